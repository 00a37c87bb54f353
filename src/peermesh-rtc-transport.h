/*
 * PeerMesh
 * Transport adapter on libdatachannel
 *
 * Speaks the PeerJS broker protocol over rtc::WebSocket and opens one
 * rtc::PeerConnection per logical channel. Every libdatachannel callback is posted to
 * the session event loop before it touches channel state.
 */

#pragma once

#include <rtc/rtc.hpp>

#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "peermesh-config.h"
#include "peermesh-event-loop.h"
#include "peermesh-signaling.h"
#include "peermesh-transport.h"
#include "peermesh-utils.h"

namespace peermesh
{

class RtcLink;

class RtcTransport : public Transport
{
public:
	RtcTransport(const SessionSettings &settings, EventLoop &loop);
	~RtcTransport() override;

	RtcTransport(const RtcTransport &) = delete;
	RtcTransport &operator=(const RtcTransport &) = delete;

	bool registerSelf(const std::string &id) override;
	void unregister() override;
	bool isRegistered() const override { return registered_; }

	std::shared_ptr<ControlChannel> openControlChannel(const std::string &peerId) override;
	std::shared_ptr<MediaChannel> openMediaChannel(const std::string &peerId,
	                                               std::shared_ptr<MediaStream> localStream,
	                                               const MediaChannelOptions &options) override;

	void restartSession(const std::string &peerId, bool forceRelay) override;

	void setIceServers(const std::vector<IceServer> &servers) { iceServers_ = servers; }
	void setForceTurn(bool force) { forceTurn_ = force; }
	bool isRelayForced(const std::string &peerId) const;
	size_t linkCount() const { return links_.size(); }

private:
	rtc::Configuration getRtcConfig(const std::string &peerId) const;

	void handleSignal(const ParsedSignalMessage &message);
	void handleOffer(const ParsedSignalMessage &message);
	void handleRemoteDescription(const ParsedSignalMessage &message);
	void handleRemoteCandidate(const ParsedSignalMessage &message);
	void handlePeerGone(const std::string &peerId, const std::string &reason);

	void wireLink(const std::shared_ptr<RtcLink> &link, const std::string &username, StreamType streamType);
	void forgetLink(const std::string &connectionId);
	std::shared_ptr<RtcLink> findLink(const std::string &connectionId) const;
	void closeAllLinks();
	void reportError(TransportErrorKind kind, const std::string &peerId, const std::string &message);

	SessionSettings settings_;
	EventLoop &loop_;
	SignalingClient signaling_;

	std::string selfId_;
	bool registered_ = false;
	std::vector<IceServer> iceServers_;
	bool forceTurn_ = false;
	std::set<std::string> relayPeers_;

	// Loop-thread only
	std::map<std::string, std::weak_ptr<RtcLink>> links_;

	std::atomic<bool> shuttingDown_{false};
	std::shared_ptr<bool> alive_;
};

// Forward libdatachannel's internal log into the PeerMesh log
void routeTransportLogs(LogLevel level);

} // namespace peermesh
