/*
 * PeerMesh
 * Peer session orchestrator
 */

#include "peermesh-session.h"

#include <algorithm>
#include <utility>

#include "peermesh-utils.h"

namespace peermesh
{

PeerSession::PeerSession(const SessionSettings &settings, Transport &transport, MediaSource &mediaSource,
                         EventLoop &loop)
    : settings_(settings),
      transport_(transport),
      mediaSource_(mediaSource),
      loop_(loop),
      selfId_(settings.isCreator ? creatorIdForRoom(settings.roomId)
                                 : joinerIdForRoom(settings.roomId, currentTimeMs())),
      username_(settings.username.empty() ? "Guest" : settings.username),
      topology_(selfId_, settings.isCreator, settings.topology),
      timers_(loop),
      router_(*this),
      screen_(transport, registry_),
      joinPolicy_(settings.timing.joinMaxAttempts, settings.timing.joinRetryIntervalMs),
      recovery_(settings.timing.relayAfterFailures, settings.timing.maxMediaRecalls),
      screenRecovery_(settings.timing.screenRecoveryMaxAttempts, settings.timing.screenRecoveryCooldownMs),
      cameraRestore_(settings.timing.cameraRestoreMaxRetries),
      controlRecovery_(settings.timing.controlReconnectMaxAttempts),
      activity_(settings.timing.inactivityGraceMs)
{
}

PeerSession::~PeerSession()
{
	transport_.setOnRegistered(nullptr);
	transport_.setOnIncomingControlChannel(nullptr);
	transport_.setOnIncomingMediaChannel(nullptr);
	transport_.setOnSessionError(nullptr);

	timers_.cancelAll();
	registry_.closeAll();
}

bool PeerSession::start()
{
	if (started_) {
		return true;
	}

	if (settings_.roomId.empty()) {
		setError(SessionErrorKind::ConnectionFailed, "Room id is empty", true);
		return false;
	}

	leaving_ = false;

	// Local media: full request, then audio only, then receive-only
	if (settings_.enableVideo || settings_.enableAudio) {
		localStream_ = mediaSource_.acquireUserMedia(settings_.enableVideo, settings_.enableAudio);
		if (!localStream_ && settings_.enableVideo && settings_.enableAudio) {
			localStream_ = mediaSource_.acquireUserMedia(false, true);
			if (localStream_) {
				setError(SessionErrorKind::MediaUnavailable, "Camera unavailable, continuing with audio only",
				         false);
			}
		}
		if (!localStream_) {
			setError(SessionErrorKind::MediaUnavailable, "Camera and microphone unavailable, joining receive-only",
			         false);
		}
	}
	if (!localStream_) {
		localStream_ = std::make_shared<MediaStream>(selfId_ + "-local");
	}

	transport_.setOnRegistered([this](const std::string &id) { handleRegistered(id); });
	transport_.setOnIncomingControlChannel(
	    [this](std::shared_ptr<ControlChannel> channel) { handleIncomingControl(std::move(channel)); });
	transport_.setOnIncomingMediaChannel(
	    [this](std::shared_ptr<MediaChannel> channel) { handleIncomingMedia(std::move(channel)); });
	transport_.setOnSessionError([this](TransportErrorKind kind, const std::string &peerId,
	                                    const std::string &message) { handleTransportError(kind, peerId, message); });

	logInfo("Starting session in room %s as %s (%s, %s)", settings_.roomId.c_str(), selfId_.c_str(),
	        isCreator() ? "creator" : "joiner", topologyName(topology_.mode()));

	started_ = true;
	if (!transport_.registerSelf(selfId_)) {
		started_ = false;
		setError(SessionErrorKind::TransportError, "Failed to register " + selfId_ + " with the signaling server",
		         true);
		return false;
	}
	return true;
}

void PeerSession::leave()
{
	if (!started_) {
		return;
	}

	logInfo("Leaving room %s", settings_.roomId.c_str());
	leaving_ = true;

	sendToAll(createPeerDisconnectMessage(selfId_));

	timers_.cancelAll();
	screen_.end();
	registry_.closeAll();
	participants_.clear();
	knownUsernames_.clear();
	pendingScreenFrom_.clear();

	if (localStream_) {
		localStream_->stop();
		localStream_.reset();
	}

	transport_.unregister();

	started_ = false;
	registered_ = false;
	joined_ = false;
	remoteRecording_ = false;
	recordingHost_.clear();
	notifyParticipants();
}

// Transport events

void PeerSession::handleRegistered(const std::string &id)
{
	if (!started_) {
		return;
	}
	if (id != selfId_) {
		logWarning("Broker confirmed id %s, expected %s", id.c_str(), selfId_.c_str());
	}

	registered_ = true;
	logInfo("Registered as %s", selfId_.c_str());

	timers_.scheduleRepeating("", TimerPurpose::ActivityCheck, settings_.timing.activityCheckMs,
	                          [this]() { checkStreamActivity(); });

	if (isCreator()) {
		timers_.scheduleRepeating("", TimerPurpose::PeerListBroadcast, settings_.timing.peerListBroadcastMs,
		                          [this]() { broadcastPeerList(); });
		markJoined();
		return;
	}

	joinPolicy_.reset();
	joinCreator();
}

void PeerSession::handleIncomingControl(std::shared_ptr<ControlChannel> channel)
{
	if (!channel) {
		return;
	}
	const std::string peerId = channel->peerId();

	if (leaving_ || !topology_.allowsConnection(peerId)) {
		logInfo("Rejecting control channel from %s (%s topology)", peerId.c_str(), topologyName(topology_.mode()));
		channel->close();
		return;
	}

	// Both sides opened at once: the channel started by the lower id wins on both ends
	const Connection *existing = registry_.find(peerId);
	if (existing && existing->control && existing->controlOutbound && !existing->control->isOpen() &&
	    selfId_ < peerId) {
		logDebug("Keeping own pending control channel to %s, closing duplicate", peerId.c_str());
		channel->close();
		return;
	}

	logDebug("Incoming control channel from %s", peerId.c_str());
	attachControl(peerId, channel, false);
	if (channel->isOpen()) {
		handleControlOpen(peerId);
	}
}

void PeerSession::handleIncomingMedia(std::shared_ptr<MediaChannel> channel)
{
	if (!channel) {
		return;
	}
	const std::string peerId = channel->peerId();

	if (leaving_ || !topology_.allowsConnection(peerId)) {
		logInfo("Rejecting media channel from %s (%s topology)", peerId.c_str(), topologyName(topology_.mode()));
		channel->close();
		return;
	}

	const bool isScreen = channel->kind() == StreamType::Screen || pendingScreenFrom_.count(peerId) > 0;
	pendingScreenFrom_.erase(peerId);

	if (isScreen) {
		logInfo("Incoming screen channel from %s", peerId.c_str());
		attachScreenMedia(peerId, channel, false);
		channel->answer(nullptr);
		return;
	}

	const Connection *existing = registry_.find(peerId);
	if (existing && existing->media && existing->mediaOutbound && !existing->media->remoteStream() &&
	    selfId_ < peerId) {
		logDebug("Keeping own pending call to %s, closing duplicate", peerId.c_str());
		channel->close();
		return;
	}

	logInfo("Incoming call from %s", peerId.c_str());
	if (participants_.contains(peerId)) {
		participants_.setTransition(peerId, TransitionState::Reconnecting);
	}
	attachMedia(peerId, channel, false);
	channel->answer(localStream_);
}

void PeerSession::handleTransportError(TransportErrorKind kind, const std::string &peerId, const std::string &message)
{
	switch (kind) {
	case TransportErrorKind::PeerUnavailable:
		if (!isCreator() && !joined_ && peerId == creatorId()) {
			joinPolicy_.recordFailure(true);
			logWarning("Room creator %s is not available (attempt %d/%d)", peerId.c_str(), joinPolicy_.attempts(),
			           joinPolicy_.maxAttempts());
			registry_.remove(peerId);
			return;
		}
		if (!peerId.empty() && registry_.contains(peerId)) {
			logWarning("Peer %s unavailable: %s", peerId.c_str(), message.c_str());
			// A closed camera channel has already been counted by handleMediaClosed
			if (registry_.clearMedia(peerId) && !leaving_ && topology_.allowsConnection(peerId)) {
				handleMediaFailure(peerId);
			}
		}
		return;
	case TransportErrorKind::IdTaken:
		setError(SessionErrorKind::TransportError,
		         isCreator() ? "Room " + settings_.roomId + " already has a creator"
		                     : "Peer id " + selfId_ + " is already taken",
		         true);
		return;
	case TransportErrorKind::Network:
	case TransportErrorKind::ServerError:
		if (!registered_) {
			setError(SessionErrorKind::TransportError, "Signaling failed: " + message, true);
		} else {
			logWarning("Signaling error, session continues: %s", message.c_str());
		}
		return;
	case TransportErrorKind::Other:
		logWarning("Transport error (%s): %s", peerId.c_str(), message.c_str());
		return;
	}
}

// Channel wiring

void PeerSession::attachControl(const std::string &peerId, std::shared_ptr<ControlChannel> channel, bool outbound)
{
	const uint64_t generation = registry_.setControl(peerId, channel);
	registry_.ensure(peerId).controlOutbound = outbound;

	channel->setOnOpen([this, peerId, generation]() {
		if (!registry_.isCurrentControl(peerId, generation)) {
			return;
		}
		handleControlOpen(peerId);
	});

	channel->setOnMessage([this, peerId, generation](const std::string &message) {
		if (!registry_.isCurrentControl(peerId, generation)) {
			return;
		}
		registry_.touch(peerId, loop_.now());
		if (!router_.route(peerId, message)) {
			logDebug("Dropped malformed message from %s", peerId.c_str());
		}
	});

	channel->setOnClosed([this, peerId, generation]() {
		if (!registry_.isCurrentControl(peerId, generation)) {
			return;
		}
		const bool wasOutbound = registry_.find(peerId)->controlOutbound;
		logInfo("Control channel to %s closed", peerId.c_str());
		registry_.clearControl(peerId, generation);
		handleControlClosed(peerId, wasOutbound);
	});

	channel->setOnError([peerId](const std::string &error) {
		logWarning("Control channel error with %s: %s", peerId.c_str(), error.c_str());
	});
}

void PeerSession::attachMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel, bool outbound)
{
	const uint64_t generation = registry_.setMedia(peerId, channel);
	registry_.ensure(peerId).mediaOutbound = outbound;

	channel->setOnStream([this, peerId, generation](std::shared_ptr<MediaStream> stream) {
		if (!registry_.isCurrentMedia(peerId, generation)) {
			logDebug("Ignoring stream from stale channel to %s", peerId.c_str());
			return;
		}
		handleRemoteStream(peerId, std::move(stream), false, registry_.find(peerId)->media->remoteUsername());
	});

	channel->setOnClosed([this, peerId, generation]() { handleMediaClosed(peerId, generation); });

	channel->setOnError([peerId](const std::string &error) {
		logWarning("Media channel error with %s: %s", peerId.c_str(), error.c_str());
	});
}

void PeerSession::attachScreenMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel, bool outbound)
{
	const uint64_t generation = registry_.setScreenMedia(peerId, channel);

	channel->setOnStream([this, peerId, generation, outbound](std::shared_ptr<MediaStream> stream) {
		// The answer on our own screen channel carries nothing we display
		if (outbound || !registry_.isCurrentScreenMedia(peerId, generation)) {
			return;
		}
		handleRemoteStream(peerId, std::move(stream), true, "");
	});

	channel->setOnClosed(
	    [this, peerId, generation, outbound]() { handleScreenMediaClosed(peerId, generation, outbound); });

	channel->setOnError([peerId](const std::string &error) {
		logWarning("Screen channel error with %s: %s", peerId.c_str(), error.c_str());
	});
}

void PeerSession::ensureControl(const std::string &peerId)
{
	if (registry_.hasControl(peerId)) {
		return;
	}
	auto control = transport_.openControlChannel(peerId);
	if (!control) {
		logWarning("Failed to open control channel to %s", peerId.c_str());
		return;
	}
	attachControl(peerId, control, true);
	if (control->isOpen()) {
		handleControlOpen(peerId);
	}
}

void PeerSession::establishPeerConnection(const std::string &peerId)
{
	if (!registered_ || leaving_) {
		return;
	}
	if (!topology_.allowsConnection(peerId)) {
		logDebug("Not connecting to %s under %s topology", peerId.c_str(), topologyName(topology_.mode()));
		return;
	}
	if (registry_.hasMedia(peerId)) {
		return;
	}

	logInfo("Connecting to %s", peerId.c_str());
	ensureControl(peerId);

	MediaChannelOptions options;
	options.kind = StreamType::Camera;
	options.username = username_;

	auto media = transport_.openMediaChannel(peerId, localStream_, options);
	if (!media) {
		logWarning("Failed to open media channel to %s", peerId.c_str());
		return;
	}
	attachMedia(peerId, media, true);
}

void PeerSession::handleControlOpen(const std::string &peerId)
{
	logInfo("Control channel to %s open", peerId.c_str());
	controlRecovery_.reset(peerId);
	timers_.cancel(peerId, TimerPurpose::ControlReconnect);

	sendTo(peerId, createUsernameMessage(selfId_, username_));

	if (!isCreator() && peerId == creatorId()) {
		markJoined();
	}

	if (isCreator()) {
		sendTo(peerId, createPeerListMessage(knownPeerIds()));
		const std::string announcement = createNewPeerMessage(peerId);
		for (const auto &entry : registry_.openControls()) {
			if (entry.first != peerId) {
				entry.second->send(announcement);
			}
		}
	}

	if (screen_.isSharing()) {
		sendTo(peerId, createScreenSharingStatusMessage(selfId_, true));
		timers_.schedule(peerId, TimerPurpose::ScreenCall, settings_.timing.newcomerScreenDelayMs, [this, peerId]() {
			if (!screen_.isSharing() || !registry_.contains(peerId)) {
				return;
			}
			openScreenFor(peerId);
			sendTo(peerId, createStreamMetadataMessage(selfId_, StreamType::Screen));
		});
	}
}

void PeerSession::handleRemoteStream(const std::string &peerId, std::shared_ptr<MediaStream> stream, bool isScreen,
                                     const std::string &remoteUsername)
{
	if (!stream) {
		return;
	}

	registry_.touch(peerId, loop_.now());
	timers_.cancel(peerId, TimerPurpose::MediaRecall);
	timers_.cancel(peerId, TimerPurpose::Removal);
	activity_.forget(peerId);

	std::string name = usernameFor(peerId);
	if (name.empty()) {
		name = remoteUsername;
	}

	bool inserted = false;
	if (isScreen) {
		logInfo("Receiving screen from %s", peerId.c_str());
		inserted = participants_.upsertStream(peerId, stream, name);
		participants_.setStreamType(peerId, StreamType::Screen);
		screenRecovery_.reset(peerId);
	} else {
		recovery_.recordSuccess(peerId);
		const Participant *participant = participants_.find(peerId);
		// While the screen is up the tile keeps showing it; the camera stays on its channel
		if (participant && participant->isScreenSharing && registry_.hasScreenMedia(peerId)) {
			logDebug("Camera stream from %s kept behind active screen", peerId.c_str());
		} else {
			inserted = participants_.upsertStream(peerId, stream, name);
		}
		logInfo("Receiving camera from %s", peerId.c_str());
	}

	settleTransition(peerId, inserted ? TransitionState::Connecting : TransitionState::Reconnecting);

	if (!isCreator() && peerId == creatorId()) {
		markJoined();
	}

	// Mesh calls are answered in both directions so the control path exists either way
	if (inserted && !isScreen && topology_.mode() == Topology::Mesh && !isCreator() && !isCreatorId(peerId)) {
		ensureControl(peerId);
	}

	notifyParticipants();
}

void PeerSession::handleControlClosed(const std::string &peerId, bool wasOutbound)
{
	if (leaving_) {
		return;
	}
	if (!isCreator() && !joined_ && peerId == creatorId()) {
		return;
	}
	if (!topology_.allowsConnection(peerId)) {
		return;
	}
	// The side that dialed re-dials first; the other side only steps in if that never arrives
	const int64_t delay = settings_.timing.controlReconnectDelayMs;
	scheduleControlReconnect(peerId, wasOutbound ? delay : 3 * delay);
}

void PeerSession::handleMediaClosed(const std::string &peerId, uint64_t generation)
{
	if (!registry_.clearMedia(peerId, generation)) {
		return;
	}
	logInfo("Media channel to %s closed", peerId.c_str());

	if (leaving_) {
		return;
	}
	// The join loop owns the creator until the first success
	if (!isCreator() && !joined_ && peerId == creatorId()) {
		return;
	}
	if (!topology_.allowsConnection(peerId)) {
		return;
	}

	if (participants_.setTransition(peerId, TransitionState::Reconnecting)) {
		notifyParticipants();
	}
	handleMediaFailure(peerId);
}

void PeerSession::handleScreenMediaClosed(const std::string &peerId, uint64_t generation, bool outbound)
{
	if (!registry_.clearScreenMedia(peerId, generation)) {
		return;
	}
	logInfo("Screen channel to %s closed", peerId.c_str());

	if (leaving_) {
		return;
	}

	if (outbound) {
		if (screen_.isSharing() && registry_.hasOpenControl(peerId)) {
			sendTo(peerId, createScreenShareRetryNeededMessage(selfId_));
		}
		return;
	}

	restoreCameraView(peerId);
	const Participant *participant = participants_.find(peerId);
	if (participant && participant->isScreenSharing) {
		requestScreenRecovery(peerId);
	}
	notifyParticipants();
}

void PeerSession::restoreCameraView(const std::string &peerId)
{
	const Connection *connection = registry_.find(peerId);
	if (connection && connection->media && connection->media->remoteStream()) {
		participants_.upsertStream(peerId, connection->media->remoteStream());
	}
}

// Join and recovery

void PeerSession::joinCreator()
{
	const std::string creator = creatorId();
	joinPolicy_.recordAttempt();
	logInfo("Joining room %s via %s (attempt %d/%d)", settings_.roomId.c_str(), creator.c_str(),
	        joinPolicy_.attempts(), joinPolicy_.maxAttempts());

	registry_.remove(creator);
	establishPeerConnection(creator);

	timers_.schedule("", TimerPurpose::JoinRetry, joinPolicy_.intervalMs(), [this]() { handleJoinTimeout(); });
}

void PeerSession::handleJoinTimeout()
{
	if (joined_ || leaving_) {
		return;
	}

	joinPolicy_.recordFailure(false);
	if (joinPolicy_.canRetry()) {
		joinCreator();
		return;
	}

	const std::string creator = creatorId();
	registry_.remove(creator);

	const SessionErrorKind kind = joinPolicy_.terminalError();
	const std::string attempts = std::to_string(joinPolicy_.attempts());
	if (kind == SessionErrorKind::HostNotFound) {
		setError(kind, "Host unreachable: no room creator at " + creator + " after " + attempts + " attempts", true);
	} else {
		setError(kind, "Could not connect to room creator " + creator + " after " + attempts + " attempts", true);
	}
}

void PeerSession::markJoined()
{
	if (joined_) {
		return;
	}
	joined_ = true;
	timers_.cancel("", TimerPurpose::JoinRetry);
	if (!isCreator()) {
		logInfo("Joined room %s after %d attempt(s)", settings_.roomId.c_str(), joinPolicy_.attempts());
	}
	joinPolicy_.reset();

	auto cb = onJoined_;
	if (cb) {
		cb();
	}
}

void PeerSession::handleMediaFailure(const std::string &peerId)
{
	switch (recovery_.recordFailure(peerId)) {
	case RecoveryAction::Recall:
		break;
	case RecoveryAction::RecallWithRelay:
		transport_.restartSession(peerId, true);
		break;
	case RecoveryAction::GiveUp:
		handlePeerDisconnection(peerId);
		return;
	}

	timers_.schedule(peerId, TimerPurpose::MediaRecall, settings_.timing.mediaRecallDelayMs,
	                 [this, peerId]() { recallPeer(peerId); });
}

void PeerSession::recallPeer(const std::string &peerId)
{
	if (leaving_) {
		return;
	}
	if (!registry_.contains(peerId) && !participants_.contains(peerId)) {
		return;
	}
	if (registry_.hasMedia(peerId)) {
		return;
	}

	logInfo("Re-calling %s (failure %d)", peerId.c_str(), recovery_.failures(peerId));
	establishPeerConnection(peerId);
}

void PeerSession::scheduleControlReconnect(const std::string &peerId, int64_t delayMs)
{
	timers_.schedule(peerId, TimerPurpose::ControlReconnect, delayMs, [this, peerId]() { reconnectControl(peerId); });
}

void PeerSession::reconnectControl(const std::string &peerId)
{
	if (leaving_ || registry_.hasControl(peerId) || !topology_.allowsConnection(peerId)) {
		return;
	}
	if (!registry_.contains(peerId) && !participants_.contains(peerId)) {
		return;
	}
	if (!controlRecovery_.consume(peerId, loop_.now())) {
		logWarning("Giving up on control channel to %s after %d attempts", peerId.c_str(),
		           controlRecovery_.attempts(peerId));
		return;
	}

	logInfo("Re-opening control channel to %s (attempt %d/%d)", peerId.c_str(), controlRecovery_.attempts(peerId),
	        settings_.timing.controlReconnectMaxAttempts);
	ensureControl(peerId);
	if (!registry_.hasControl(peerId)) {
		scheduleControlReconnect(peerId, settings_.timing.controlReconnectDelayMs);
	}
}

void PeerSession::handlePeerDisconnection(const std::string &peerId)
{
	logInfo("Peer %s disconnected", peerId.c_str());

	timers_.cancelPeer(peerId);
	recovery_.forget(peerId);
	screenRecovery_.reset(peerId);
	cameraRestore_.reset(peerId);
	controlRecovery_.reset(peerId);
	activity_.forget(peerId);
	pendingScreenFrom_.erase(peerId);
	knownUsernames_.erase(peerId);
	registry_.remove(peerId);

	if (!participants_.contains(peerId)) {
		return;
	}

	if (!settings_.transitionsEnabled) {
		participants_.remove(peerId);
		notifyParticipants();
		return;
	}

	participants_.setTransition(peerId, TransitionState::Disconnecting);
	notifyParticipants();
	timers_.schedule(peerId, TimerPurpose::Removal, settings_.timing.removalDelayMs, [this, peerId]() {
		if (participants_.remove(peerId)) {
			notifyParticipants();
		}
	});
}

void PeerSession::teardownPeer(const std::string &peerId)
{
	logInfo("Dropping connection to %s", peerId.c_str());

	timers_.cancelPeer(peerId);
	recovery_.forget(peerId);
	screenRecovery_.reset(peerId);
	cameraRestore_.reset(peerId);
	controlRecovery_.reset(peerId);
	activity_.forget(peerId);
	pendingScreenFrom_.erase(peerId);
	registry_.remove(peerId);
	participants_.remove(peerId);
}

void PeerSession::checkStreamActivity()
{
	const int64_t now = loop_.now();
	bool changed = false;

	for (const auto &participant : participants_.snapshot()) {
		const std::string &peerId = participant.id;
		const std::string screenKey = peerId + "#screen";

		if (participant.isScreenSharing) {
			const bool screenOk = registry_.hasScreenMedia(peerId) && participant.stream &&
			                      participant.stream->hasLiveVideo();
			if (activity_.observe(screenKey, screenOk, now)) {
				activity_.forget(screenKey);
				requestScreenRecovery(peerId);
			}
			continue;
		}
		activity_.forget(screenKey);

		if (!registry_.hasMedia(peerId) || !participant.stream) {
			activity_.forget(peerId);
			continue;
		}
		if (!activity_.observe(peerId, participant.stream->isActive(), now)) {
			continue;
		}

		activity_.forget(peerId);
		logWarning("Stream from %s has been inactive, reconnecting", peerId.c_str());
		participants_.setTransition(peerId, TransitionState::Reconnecting);
		changed = true;

		registry_.clearMedia(peerId);
		if (registry_.hasOpenControl(peerId)) {
			sendTo(peerId, createRequestFullReconnectMessage(selfId_));
			// Fall back to calling ourselves if the peer never calls back
			timers_.schedule(peerId, TimerPurpose::MediaRecall, settings_.timing.mediaRecallDelayMs * 2,
			                 [this, peerId]() { recallPeer(peerId); });
		} else {
			handleMediaFailure(peerId);
		}
	}

	if (changed) {
		notifyParticipants();
	}
}

void PeerSession::requestScreenRecovery(const std::string &peerId)
{
	if (!screenRecovery_.consume(peerId, loop_.now())) {
		logDebug("Screen recovery for %s exhausted or cooling down", peerId.c_str());
		return;
	}

	logInfo("Requesting a fresh screen stream from %s (attempt %d)", peerId.c_str(),
	        screenRecovery_.attempts(peerId));
	registry_.clearScreenMedia(peerId);
	if (registry_.hasOpenControl(peerId)) {
		sendTo(peerId, createRequestScreenStreamMessage(selfId_, true));
	} else {
		establishPeerConnection(peerId);
	}
}

void PeerSession::scheduleCameraRestoreCheck(const std::string &peerId)
{
	timers_.schedule(peerId, TimerPurpose::CameraRestoreRetry, settings_.timing.cameraRestoreRetryMs,
	                 [this, peerId]() {
		                 const Participant *participant = participants_.find(peerId);
		                 if (!participant) {
			                 cameraRestore_.reset(peerId);
			                 return;
		                 }
		                 if (participant->stream && participant->stream->isActive()) {
			                 cameraRestore_.reset(peerId);
			                 return;
		                 }
		                 if (!cameraRestore_.consume(peerId, loop_.now())) {
			                 logWarning("Camera stream from %s not restored after %d retries", peerId.c_str(),
			                            cameraRestore_.attempts(peerId));
			                 cameraRestore_.reset(peerId);
			                 return;
		                 }

		                 logInfo("Camera stream from %s still missing, retry %d", peerId.c_str(),
		                         cameraRestore_.attempts(peerId));
		                 registry_.clearMedia(peerId);
		                 sendTo(peerId, createRequestStreamUpdateMessage(selfId_, true, true));
		                 scheduleCameraRestoreCheck(peerId);
	                 });
}

void PeerSession::settleTransition(const std::string &peerId, TransitionState state)
{
	if (!settings_.transitionsEnabled) {
		participants_.setTransition(peerId, TransitionState::Connected);
		return;
	}

	participants_.setTransition(peerId, state);
	timers_.schedule(peerId, TimerPurpose::Transition, settings_.timing.transitionSettleMs, [this, peerId]() {
		if (participants_.setTransition(peerId, TransitionState::Connected)) {
			notifyParticipants();
		}
	});
}

// Screen share

bool PeerSession::canStartScreenShare() const
{
	return started_ && !screen_.isSharing() && !participants_.anyoneSharing();
}

bool PeerSession::startScreenShare()
{
	if (!started_) {
		return false;
	}
	if (screen_.isSharing()) {
		return true;
	}
	if (participants_.anyoneSharing()) {
		logWarning("Another participant is already sharing their screen");
		return false;
	}

	auto stream = mediaSource_.acquireDisplayMedia();
	if (!stream) {
		setError(SessionErrorKind::MediaUnavailable, "Screen capture unavailable", false);
		return false;
	}

	screen_.begin(stream);
	sendToAll(createScreenSharingStatusMessage(selfId_, true));

	int64_t delay = settings_.timing.shareNotifyDelayMs;
	for (const auto &peerId : knownPeerIds()) {
		if (peerId == selfId_ || !registry_.contains(peerId)) {
			continue;
		}
		timers_.schedule(peerId, TimerPurpose::ScreenCall, delay, [this, peerId]() {
			if (!screen_.isSharing()) {
				return;
			}
			openScreenFor(peerId);
			sendTo(peerId, createScreenSharingStreamMessage(selfId_));
		});
		delay += settings_.timing.screenCallStaggerMs;
	}

	notifyParticipants();
	return true;
}

void PeerSession::stopScreenShare()
{
	if (!screen_.isSharing()) {
		return;
	}

	sendToAll(createScreenSharingStatusMessage(selfId_, false));

	const std::vector<std::string> peers = registry_.peerIds();
	for (const auto &peerId : peers) {
		timers_.cancel(peerId, TimerPurpose::ScreenCall);
	}
	screen_.end();

	// Some transports disturb the camera channel while a second one is negotiated
	int64_t delay = settings_.timing.stopShareRepairDelayMs;
	for (const auto &peerId : peers) {
		if (!topology_.allowsConnection(peerId)) {
			continue;
		}
		timers_.schedule(peerId, TimerPurpose::ScreenRepair, delay,
		                 [this, peerId]() { repairAfterScreenShare(peerId); });
		delay += settings_.timing.stopShareRepairStaggerMs;
	}

	timers_.schedule("", TimerPurpose::ScreenRepair, delay, [this]() {
		const size_t reached = sendToAll(createCameraStreamRestoredMessage(selfId_));
		logInfo("Announced camera restore to %zu peer(s)", reached);
	});

	notifyParticipants();
}

void PeerSession::openScreenFor(const std::string &peerId)
{
	if (!topology_.allowsConnection(peerId)) {
		return;
	}
	auto channel = screen_.openFor(peerId, username_);
	if (channel) {
		attachScreenMedia(peerId, channel, true);
	}
}

void PeerSession::repairAfterScreenShare(const std::string &peerId)
{
	if (leaving_) {
		return;
	}
	if (!registry_.hasMedia(peerId)) {
		establishPeerConnection(peerId);
	} else if (registry_.hasOpenControl(peerId)) {
		sendTo(peerId, createReconnectAfterScreenShareMessage(selfId_));
	}
}

// Outbound helpers and local controls

size_t PeerSession::sendToAll(const std::string &message)
{
	size_t count = 0;
	for (const auto &entry : registry_.openControls()) {
		if (entry.second->send(message)) {
			count++;
		}
	}
	return count;
}

bool PeerSession::sendTo(const std::string &peerId, const std::string &message)
{
	const Connection *connection = registry_.find(peerId);
	if (!connection || !connection->control || !connection->control->isOpen()) {
		logDebug("No open control channel to %s", peerId.c_str());
		return false;
	}
	return connection->control->send(message);
}

size_t PeerSession::sendChat(const std::string &text)
{
	if (text.empty()) {
		return 0;
	}
	return sendToAll(createChatMessage(username_, text));
}

void PeerSession::setUsername(const std::string &username)
{
	const std::string name = trim(username);
	if (name.empty() || name == username_) {
		return;
	}
	username_ = name;
	settings_.username = name;
	logInfo("Username set to %s", name.c_str());
	sendToAll(createUsernameMessage(selfId_, name));
}

void PeerSession::reconnectAll()
{
	if (!registered_) {
		return;
	}
	if (isCreator()) {
		broadcastPeerList();
		return;
	}

	const std::string creator = creatorId();
	if (!registry_.hasOpenControl(creator)) {
		logInfo("Control channel to creator is down, reconnecting");
		registry_.remove(creator);
		establishPeerConnection(creator);
		return;
	}
	sendTo(creator, createRequestPeerListMessage(selfId_));
}

void PeerSession::broadcastPeerList()
{
	if (!isCreator()) {
		return;
	}
	sendToAll(createPeerListMessage(knownPeerIds()));
}

bool PeerSession::toggleAudio()
{
	if (!localStream_ || localStream_->audioTracks().empty()) {
		return false;
	}
	const bool enabled = !localStream_->audioEnabled();
	localStream_->setAudioEnabled(enabled);
	logInfo("Microphone %s", enabled ? "on" : "muted");
	return enabled;
}

bool PeerSession::toggleVideo()
{
	if (!localStream_ || localStream_->videoTracks().empty()) {
		return false;
	}
	const bool enabled = !localStream_->videoEnabled();
	localStream_->setVideoEnabled(enabled);
	logInfo("Camera %s", enabled ? "on" : "off");
	return enabled;
}

void PeerSession::setTopology(Topology mode)
{
	const Topology previous = topology_.mode();
	if (!topology_.setMode(mode)) {
		return;
	}
	settings_.topology = mode;

	for (const auto &peerId : topology_.disallowedPeers(registry_)) {
		teardownPeer(peerId);
	}
	for (const auto &peerId : participants_.ids()) {
		if (!topology_.allowsConnection(peerId)) {
			teardownPeer(peerId);
		}
	}

	if (topology_.needsPeerListAfterSwitch(previous)) {
		const std::string creator = creatorId();
		if (registry_.hasOpenControl(creator)) {
			sendTo(creator, createRequestPeerListMessage(selfId_));
		} else {
			establishPeerConnection(creator);
		}
	}

	notifyParticipants();
}

void PeerSession::reportDecodeError(const std::string &peerId)
{
	const Participant *participant = participants_.find(peerId);
	if (!participant) {
		return;
	}
	if (participant->isScreenSharing) {
		requestScreenRecovery(peerId);
		return;
	}
	logInfo("Decode errors from %s, requesting a fresh camera stream", peerId.c_str());
	sendTo(peerId, createRequestStreamUpdateMessage(selfId_, true, false));
}

void PeerSession::refreshLocalStreamIfInactive()
{
	if (localStream_ && localStream_->isActive()) {
		return;
	}
	if (!settings_.enableVideo && !settings_.enableAudio) {
		return;
	}

	auto fresh = mediaSource_.acquireUserMedia(settings_.enableVideo, settings_.enableAudio);
	if (!fresh) {
		logWarning("Could not refresh the local stream, reusing the previous one");
		return;
	}
	logInfo("Local stream refreshed");
	localStream_ = std::move(fresh);
}

void PeerSession::applyPeerList(const std::vector<std::string> &peers)
{
	const TopologyPlan plan = topology_.reconcile(peers, registry_);
	if (plan.empty()) {
		return;
	}

	for (const auto &peerId : plan.toTearDown) {
		teardownPeer(peerId);
	}
	for (const auto &peerId : plan.toConnect) {
		participants_.ensure(peerId, usernameFor(peerId));
		establishPeerConnection(peerId);
	}
	notifyParticipants();
}

std::vector<std::string> PeerSession::knownPeerIds() const
{
	std::vector<std::string> ids;
	ids.push_back(selfId_);

	auto addUnique = [&ids](const std::string &id) {
		if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
			ids.push_back(id);
		}
	};
	for (const auto &id : participants_.ids()) {
		addUnique(id);
	}
	for (const auto &entry : registry_.openControls()) {
		addUnique(entry.first);
	}
	return ids;
}

std::string PeerSession::creatorId() const
{
	return creatorIdForRoom(settings_.roomId);
}

std::string PeerSession::usernameFor(const std::string &peerId) const
{
	auto it = knownUsernames_.find(peerId);
	return it == knownUsernames_.end() ? std::string() : it->second;
}

void PeerSession::raiseError(SessionErrorKind kind, const std::string &message, bool fatal)
{
	setError(kind, message, fatal);
}

void PeerSession::clearError()
{
	lastError_ = SessionError();
}

void PeerSession::setError(SessionErrorKind kind, const std::string &message, bool fatal)
{
	lastError_.kind = kind;
	lastError_.message = message;
	lastError_.fatal = fatal;

	if (fatal) {
		logError("%s: %s", sessionErrorKindName(kind), message.c_str());
	} else {
		logWarning("%s: %s", sessionErrorKindName(kind), message.c_str());
	}

	auto cb = onError_;
	if (cb) {
		cb(lastError_);
	}
}

void PeerSession::notifyParticipants()
{
	auto cb = onParticipantsChanged_;
	if (cb) {
		cb(participants_.snapshot());
	}
}

SessionSnapshot PeerSession::snapshot() const
{
	SessionSnapshot snap;
	snap.selfId = selfId_;
	snap.username = username_;
	snap.isCreator = isCreator();
	snap.registered = registered_;
	snap.joined = joined_;
	snap.topology = topology_.mode();
	snap.participants = participants_.snapshot();
	snap.localStream = localStream_;
	snap.screenStream = screen_.stream();
	snap.isScreenSharing = screen_.isSharing();
	snap.remoteRecording = remoteRecording_;
	snap.recordingHost = recordingHost_;
	snap.error = lastError_;
	return snap;
}

// Control message handlers

void PeerSession::onUsername(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string peerId = message.peerId.empty() ? fromPeer : message.peerId;
	if (peerId == selfId_ || message.username.empty()) {
		return;
	}

	knownUsernames_[peerId] = message.username;
	if (participants_.setUsername(peerId, message.username)) {
		notifyParticipants();
	}

	if (isCreator()) {
		const std::string forwarded = createUsernameMessage(peerId, message.username);
		for (const auto &entry : registry_.openControls()) {
			if (entry.first != fromPeer && entry.first != peerId) {
				entry.second->send(forwarded);
			}
		}
	}
}

void PeerSession::onRequestUsername(const std::string &fromPeer, const ControlMessage &)
{
	sendTo(fromPeer, createUsernameMessage(selfId_, username_));
}

void PeerSession::onPeerList(const std::string &fromPeer, const ControlMessage &message)
{
	if (isCreator() || !isCreatorId(fromPeer)) {
		logDebug("Ignoring peer list from %s", fromPeer.c_str());
		return;
	}
	logDebug("Peer list from %s with %zu id(s)", fromPeer.c_str(), message.peers.size());
	applyPeerList(message.peers);
}

void PeerSession::onRequestPeerList(const std::string &fromPeer, const ControlMessage &)
{
	if (!isCreator()) {
		return;
	}
	sendTo(fromPeer, createPeerListMessage(knownPeerIds()));
}

void PeerSession::onNewPeer(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string &peerId = message.peerId;
	if (peerId.empty() || peerId == selfId_) {
		return;
	}
	if (!topology_.allowsConnection(peerId)) {
		logDebug("New peer %s announced by %s, not connecting under %s topology", peerId.c_str(),
		         fromPeer.c_str(), topologyName(topology_.mode()));
		return;
	}

	if (participants_.ensure(peerId, usernameFor(peerId))) {
		notifyParticipants();
	}
	establishPeerConnection(peerId);
}

void PeerSession::onPeerDisconnect(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string peerId = message.peerId.empty() ? fromPeer : message.peerId;
	if (peerId == selfId_) {
		return;
	}
	handlePeerDisconnection(peerId);
}

void PeerSession::onScreenSharingStatus(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string peerId = message.peerId.empty() ? fromPeer : message.peerId;
	if (peerId == selfId_) {
		return;
	}
	if (!participants_.contains(peerId)) {
		if (!topology_.allowsConnection(peerId)) {
			return;
		}
		participants_.ensure(peerId, usernameFor(peerId));
	}

	participants_.setScreenSharing(peerId, message.isSharing);
	logInfo("%s %s sharing", peerId.c_str(), message.isSharing ? "started" : "stopped");

	if (message.isSharing) {
		// Let the rest of the room know in case they missed the direct status
		if (isCreator()) {
			const std::string relay = createScreenShareStartedMessage(peerId);
			for (const auto &entry : registry_.openControls()) {
				if (entry.first != fromPeer && entry.first != peerId) {
					entry.second->send(relay);
				}
			}
		}
	} else {
		pendingScreenFrom_.erase(peerId);
		screenRecovery_.reset(peerId);
		activity_.forget(peerId + "#screen");
		timers_.cancel(peerId, TimerPurpose::ScreenShareStarted);
		if (registry_.clearScreenMedia(peerId)) {
			restoreCameraView(peerId);
		}
	}
	notifyParticipants();
}

void PeerSession::onScreenSharingStream(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string peerId = message.peerId.empty() ? fromPeer : message.peerId;
	if (peerId == selfId_) {
		return;
	}
	if (!registry_.hasScreenMedia(peerId)) {
		pendingScreenFrom_.insert(peerId);
	}
	if (!participants_.contains(peerId) && topology_.allowsConnection(peerId)) {
		participants_.ensure(peerId, usernameFor(peerId));
	}
	if (participants_.setScreenSharing(peerId, true)) {
		notifyParticipants();
	}
}

void PeerSession::onScreenShareStarted(const std::string &, const ControlMessage &message)
{
	const std::string &sharer = message.sharingPeerId;
	if (sharer.empty() || sharer == selfId_ || !topology_.allowsConnection(sharer)) {
		return;
	}

	participants_.ensure(sharer, usernameFor(sharer));
	participants_.setScreenSharing(sharer, true);
	notifyParticipants();

	if (!registry_.hasMedia(sharer) && !registry_.hasScreenMedia(sharer)) {
		timers_.schedule(sharer, TimerPurpose::ScreenShareStarted, settings_.timing.screenShareStartedConnectDelayMs,
		                 [this, sharer]() { establishPeerConnection(sharer); });
		return;
	}

	timers_.schedule(sharer, TimerPurpose::ScreenShareStarted, settings_.timing.screenShareStartedDelayMs,
	                 [this, sharer]() {
		                 const Participant *participant = participants_.find(sharer);
		                 if (!participant || !participant->isScreenSharing) {
			                 return;
		                 }
		                 if (registry_.hasScreenMedia(sharer) && participant->stream &&
		                     participant->stream->hasLiveVideo()) {
			                 return;
		                 }
		                 registry_.clearScreenMedia(sharer);
		                 sendTo(sharer, createRequestScreenStreamMessage(selfId_, true));
	                 });
}

void PeerSession::onScreenShareRetryNeeded(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string sharer = message.sharingPeerId.empty() ? fromPeer : message.sharingPeerId;
	if (sharer == selfId_) {
		return;
	}

	logInfo("Screen share from %s needs a retry", sharer.c_str());
	registry_.clearScreenMedia(sharer);
	if (registry_.hasOpenControl(sharer)) {
		sendTo(sharer, createRequestScreenStreamMessage(selfId_, true));
	} else {
		establishPeerConnection(sharer);
	}
}

void PeerSession::onStreamMetadata(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string peerId = message.peerId.empty() ? fromPeer : message.peerId;
	if (peerId == selfId_) {
		return;
	}
	if (message.streamType == StreamType::Screen) {
		if (!registry_.hasScreenMedia(peerId)) {
			pendingScreenFrom_.insert(peerId);
		}
	} else {
		pendingScreenFrom_.erase(peerId);
	}
	if (participants_.setStreamType(peerId, message.streamType)) {
		notifyParticipants();
	}
}

void PeerSession::onRequestScreenStream(const std::string &fromPeer, const ControlMessage &message)
{
	if (!screen_.isSharing()) {
		logDebug("Screen requested by %s but nothing is being shared", fromPeer.c_str());
		return;
	}

	logInfo("Sending %sscreen stream to %s", message.urgent ? "urgent " : "", fromPeer.c_str());
	sendTo(fromPeer, createScreenSharingStreamMessage(selfId_));
	openScreenFor(fromPeer);
	sendTo(fromPeer, createScreenShareConfirmedMessage(selfId_));
}

void PeerSession::onRequestStreamUpdate(const std::string &fromPeer, const ControlMessage &message)
{
	if (!topology_.allowsConnection(fromPeer)) {
		return;
	}

	const int64_t delay =
	    message.urgent ? settings_.timing.streamUpdateUrgentDelayMs : settings_.timing.streamUpdateDelayMs;
	logInfo("Camera stream update requested by %s", fromPeer.c_str());

	registry_.clearMedia(fromPeer);
	timers_.schedule(fromPeer, TimerPurpose::StreamUpdate, delay, [this, fromPeer]() {
		if (leaving_) {
			return;
		}
		refreshLocalStreamIfInactive();
		establishPeerConnection(fromPeer);
		sendTo(fromPeer, createCameraStreamSentMessage(selfId_));
	});
}

void PeerSession::onCameraStreamRestored(const std::string &fromPeer, const ControlMessage &message)
{
	const std::string peerId = message.peerId.empty() ? fromPeer : message.peerId;
	if (peerId == selfId_ || !participants_.contains(peerId)) {
		return;
	}

	logInfo("%s restored its camera, requesting a fresh stream", peerId.c_str());

	// A pending re-call would race the one this request triggers
	timers_.cancel(peerId, TimerPurpose::ReconnectAfterScreenShare);

	participants_.setScreenSharing(peerId, false);
	pendingScreenFrom_.erase(peerId);
	screenRecovery_.reset(peerId);
	registry_.clearScreenMedia(peerId);
	registry_.clearMedia(peerId);
	participants_.clearStream(peerId);
	notifyParticipants();

	cameraRestore_.reset(peerId);
	sendTo(peerId, createRequestStreamUpdateMessage(selfId_, true, true));
	scheduleCameraRestoreCheck(peerId);
}

void PeerSession::onReconnectAfterScreenShare(const std::string &fromPeer, const ControlMessage &)
{
	if (!topology_.allowsConnection(fromPeer)) {
		return;
	}
	timers_.schedule(fromPeer, TimerPurpose::ReconnectAfterScreenShare, settings_.timing.reconnectAfterShareDelayMs,
	                 [this, fromPeer]() {
		                 if (leaving_) {
			                 return;
		                 }
		                 registry_.clearMedia(fromPeer);
		                 establishPeerConnection(fromPeer);
	                 });
}

void PeerSession::onRequestFullReconnect(const std::string &fromPeer, const ControlMessage &)
{
	if (!topology_.allowsConnection(fromPeer)) {
		return;
	}

	logInfo("Full reconnect requested by %s", fromPeer.c_str());
	registry_.clearMedia(fromPeer);
	if (participants_.setTransition(fromPeer, TransitionState::Reconnecting)) {
		notifyParticipants();
	}
	timers_.schedule(fromPeer, TimerPurpose::FullReconnect, settings_.timing.fullReconnectDelayMs, [this, fromPeer]() {
		if (leaving_) {
			return;
		}
		refreshLocalStreamIfInactive();
		establishPeerConnection(fromPeer);
	});
}

void PeerSession::onRecordingStatus(const std::string &fromPeer, const ControlMessage &message)
{
	remoteRecording_ = message.isRecording;
	recordingHost_ = message.host.empty() ? fromPeer : message.host;
	logInfo("Recording %s by %s", message.isRecording ? "started" : "stopped", recordingHost_.c_str());

	auto cb = onRecordingStatus_;
	if (cb) {
		cb(remoteRecording_, recordingHost_);
	}
}

void PeerSession::onApplicationMessage(const std::string &fromPeer, const ControlMessage &message)
{
	auto cb = onData_;
	if (cb) {
		cb(fromPeer, message);
	}
}

} // namespace peermesh
