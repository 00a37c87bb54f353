/*
 * PeerMesh
 * Peer session orchestrator
 *
 * Owns the connection registry, the participant store and every retry timer for one
 * local node. All methods and callbacks run on the event loop passed at construction.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "peermesh-common.h"
#include "peermesh-config.h"
#include "peermesh-connection-registry.h"
#include "peermesh-event-loop.h"
#include "peermesh-media.h"
#include "peermesh-participant-store.h"
#include "peermesh-resilience.h"
#include "peermesh-router.h"
#include "peermesh-screen-share.h"
#include "peermesh-topology.h"
#include "peermesh-transport.h"

namespace peermesh
{

// Read-only view handed to the UI and the recorder
struct SessionSnapshot {
	std::string selfId;
	std::string username;
	bool isCreator = false;
	bool registered = false;
	bool joined = false;
	Topology topology = Topology::Mesh;
	std::vector<Participant> participants;
	std::shared_ptr<MediaStream> localStream;
	std::shared_ptr<MediaStream> screenStream;
	bool isScreenSharing = false;
	bool remoteRecording = false;
	std::string recordingHost;
	SessionError error;
};

class PeerSession : private ControlMessageHandler
{
public:
	using OnParticipantsChangedCallback = std::function<void(const std::vector<Participant> &participants)>;
	using OnDataCallback = std::function<void(const std::string &peerId, const ControlMessage &message)>;
	using OnErrorCallback = std::function<void(const SessionError &error)>;
	using OnJoinedCallback = std::function<void()>;
	using OnRecordingStatusCallback = std::function<void(bool isRecording, const std::string &host)>;

	PeerSession(const SessionSettings &settings, Transport &transport, MediaSource &mediaSource, EventLoop &loop);
	~PeerSession() override;

	PeerSession(const PeerSession &) = delete;
	PeerSession &operator=(const PeerSession &) = delete;

	// Acquire local media and register with the broker
	bool start();
	void leave();

	void establishPeerConnection(const std::string &peerId);

	bool toggleAudio();
	bool toggleVideo();

	bool canStartScreenShare() const;
	bool startScreenShare();
	void stopScreenShare();

	void setTopology(Topology mode);

	// Raw payload to every open control channel. Returns the number of peers reached.
	size_t sendToAll(const std::string &message);
	bool sendTo(const std::string &peerId, const std::string &message);
	size_t sendChat(const std::string &text);

	void setUsername(const std::string &username);
	void reconnectAll();
	void broadcastPeerList();

	// Report a remote decode failure from the media pipeline
	void reportDecodeError(const std::string &peerId);

	// Set the error slot from a collaborator (recorder)
	void raiseError(SessionErrorKind kind, const std::string &message, bool fatal = false);
	void clearError();
	const SessionError &lastError() const { return lastError_; }

	SessionSnapshot snapshot() const;
	std::vector<Participant> participants() const { return participants_.snapshot(); }
	const ConnectionRegistry &connections() const { return registry_; }
	const SessionSettings &settings() const { return settings_; }

	const std::string &selfId() const { return selfId_; }
	const std::string &username() const { return username_; }
	bool isCreator() const { return settings_.isCreator; }
	bool isRegistered() const { return registered_; }
	bool isJoined() const { return joined_; }
	Topology topology() const { return topology_.mode(); }
	bool isScreenSharing() const { return screen_.isSharing(); }
	std::shared_ptr<MediaStream> localStream() const { return localStream_; }
	std::shared_ptr<MediaStream> screenStream() const { return screen_.stream(); }
	bool remoteRecording() const { return remoteRecording_; }
	int joinAttempts() const { return joinPolicy_.attempts(); }

	void setOnParticipantsChanged(OnParticipantsChangedCallback callback)
	{
		onParticipantsChanged_ = std::move(callback);
	}
	void setOnData(OnDataCallback callback) { onData_ = std::move(callback); }
	void setOnError(OnErrorCallback callback) { onError_ = std::move(callback); }
	void setOnJoined(OnJoinedCallback callback) { onJoined_ = std::move(callback); }
	void setOnRecordingStatus(OnRecordingStatusCallback callback) { onRecordingStatus_ = std::move(callback); }

private:
	// Transport events
	void handleRegistered(const std::string &id);
	void handleIncomingControl(std::shared_ptr<ControlChannel> channel);
	void handleIncomingMedia(std::shared_ptr<MediaChannel> channel);
	void handleTransportError(TransportErrorKind kind, const std::string &peerId, const std::string &message);

	// Channel wiring
	void attachControl(const std::string &peerId, std::shared_ptr<ControlChannel> channel, bool outbound);
	void attachMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel, bool outbound);
	void attachScreenMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel, bool outbound);
	void ensureControl(const std::string &peerId);
	void handleControlOpen(const std::string &peerId);
	void handleRemoteStream(const std::string &peerId, std::shared_ptr<MediaStream> stream, bool isScreen,
	                        const std::string &remoteUsername);
	void handleControlClosed(const std::string &peerId, bool wasOutbound);
	void handleMediaClosed(const std::string &peerId, uint64_t generation);
	void handleScreenMediaClosed(const std::string &peerId, uint64_t generation, bool outbound);
	void restoreCameraView(const std::string &peerId);

	// Join and recovery
	void joinCreator();
	void handleJoinTimeout();
	void markJoined();
	void handleMediaFailure(const std::string &peerId);
	void recallPeer(const std::string &peerId);
	void scheduleControlReconnect(const std::string &peerId, int64_t delayMs);
	void reconnectControl(const std::string &peerId);
	void handlePeerDisconnection(const std::string &peerId);
	void teardownPeer(const std::string &peerId);
	void checkStreamActivity();
	void requestScreenRecovery(const std::string &peerId);
	void scheduleCameraRestoreCheck(const std::string &peerId);
	void settleTransition(const std::string &peerId, TransitionState state);

	// Screen share
	void openScreenFor(const std::string &peerId);
	void repairAfterScreenShare(const std::string &peerId);

	void refreshLocalStreamIfInactive();
	void applyPeerList(const std::vector<std::string> &peers);
	std::vector<std::string> knownPeerIds() const;
	std::string creatorId() const;
	std::string usernameFor(const std::string &peerId) const;
	void setError(SessionErrorKind kind, const std::string &message, bool fatal);
	void notifyParticipants();

	// ControlMessageHandler
	void onUsername(const std::string &fromPeer, const ControlMessage &message) override;
	void onRequestUsername(const std::string &fromPeer, const ControlMessage &message) override;
	void onPeerList(const std::string &fromPeer, const ControlMessage &message) override;
	void onRequestPeerList(const std::string &fromPeer, const ControlMessage &message) override;
	void onNewPeer(const std::string &fromPeer, const ControlMessage &message) override;
	void onPeerDisconnect(const std::string &fromPeer, const ControlMessage &message) override;
	void onScreenSharingStatus(const std::string &fromPeer, const ControlMessage &message) override;
	void onScreenSharingStream(const std::string &fromPeer, const ControlMessage &message) override;
	void onScreenShareStarted(const std::string &fromPeer, const ControlMessage &message) override;
	void onScreenShareRetryNeeded(const std::string &fromPeer, const ControlMessage &message) override;
	void onStreamMetadata(const std::string &fromPeer, const ControlMessage &message) override;
	void onRequestScreenStream(const std::string &fromPeer, const ControlMessage &message) override;
	void onRequestStreamUpdate(const std::string &fromPeer, const ControlMessage &message) override;
	void onCameraStreamRestored(const std::string &fromPeer, const ControlMessage &message) override;
	void onReconnectAfterScreenShare(const std::string &fromPeer, const ControlMessage &message) override;
	void onRequestFullReconnect(const std::string &fromPeer, const ControlMessage &message) override;
	void onRecordingStatus(const std::string &fromPeer, const ControlMessage &message) override;
	void onApplicationMessage(const std::string &fromPeer, const ControlMessage &message) override;

	SessionSettings settings_;
	Transport &transport_;
	MediaSource &mediaSource_;
	EventLoop &loop_;

	std::string selfId_;
	std::string username_;

	ConnectionRegistry registry_;
	ParticipantStore participants_;
	TopologyController topology_;
	TimerTable timers_;
	ControlMessageRouter router_;
	ScreenShareOverlay screen_;

	JoinRetryPolicy joinPolicy_;
	MediaRecoveryPolicy recovery_;
	RetryBudget screenRecovery_;
	RetryBudget cameraRestore_;
	RetryBudget controlRecovery_;
	StreamActivityMonitor activity_;

	std::shared_ptr<MediaStream> localStream_;
	// Usernames learned before the participant's first stream
	std::map<std::string, std::string> knownUsernames_;
	// Peers whose next media channel carries screen content
	std::set<std::string> pendingScreenFrom_;

	bool started_ = false;
	bool registered_ = false;
	bool joined_ = false;
	bool leaving_ = false;
	bool remoteRecording_ = false;
	std::string recordingHost_;
	SessionError lastError_;

	OnParticipantsChangedCallback onParticipantsChanged_;
	OnDataCallback onData_;
	OnErrorCallback onError_;
	OnJoinedCallback onJoined_;
	OnRecordingStatusCallback onRecordingStatus_;
};

} // namespace peermesh
