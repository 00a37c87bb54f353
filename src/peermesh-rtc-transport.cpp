/*
 * PeerMesh
 * Transport adapter on libdatachannel
 */

#include "peermesh-rtc-transport.h"

#include <variant>

namespace peermesh
{

// One rtc::PeerConnection carrying a single logical channel
class RtcLink
{
public:
	RtcLink(std::string peerId, std::string connectionId, ConnectionKind kind, bool outbound)
	    : peerId_(std::move(peerId)), connectionId_(std::move(connectionId)), kind_(kind), outbound_(outbound)
	{
	}
	virtual ~RtcLink() { shutdown(); }

	const std::string &linkPeerId() const { return peerId_; }
	const std::string &connectionId() const { return connectionId_; }
	ConnectionKind connectionKind() const { return kind_; }
	bool outbound() const { return outbound_; }

	void attach(std::shared_ptr<rtc::PeerConnection> pc) { pc_ = std::move(pc); }
	std::shared_ptr<rtc::PeerConnection> peerConnection() const { return pc_; }

	bool applyRemoteDescription(const std::string &sdp, rtc::Description::Type type)
	{
		if (!pc_) {
			return false;
		}
		try {
			pc_->setRemoteDescription(rtc::Description(sdp, type));
			hasRemoteDescription_ = true;
			for (const auto &candidate : pendingCandidates_) {
				pc_->addRemoteCandidate(candidate);
			}
			pendingCandidates_.clear();
			return true;
		} catch (const std::exception &e) {
			logError("Failed to apply remote description for %s: %s", peerId_.c_str(), e.what());
			return false;
		}
	}

	void addRemoteCandidate(const std::string &candidate, const std::string &mid)
	{
		if (!pc_ || candidate.empty()) {
			return;
		}
		try {
			rtc::Candidate parsed(candidate, mid);
			if (!hasRemoteDescription_) {
				pendingCandidates_.push_back(parsed);
				return;
			}
			pc_->addRemoteCandidate(parsed);
		} catch (const std::exception &e) {
			logDebug("Ignoring ICE candidate from %s: %s", peerId_.c_str(), e.what());
		}
	}

	// Remote side went away or ICE failed
	virtual void fail(const std::string &reason) = 0;
	virtual void handleConnected() {}

protected:
	void shutdown()
	{
		auto pc = std::move(pc_);
		if (!pc) {
			return;
		}
		try {
			pc->onStateChange(nullptr);
			pc->onLocalCandidate(nullptr);
			pc->onLocalDescription(nullptr);
			pc->onTrack(nullptr);
			pc->onDataChannel(nullptr);
			pc->close();
		} catch (const std::exception &e) {
			logDebug("Error closing peer connection to %s: %s", peerId_.c_str(), e.what());
		}
	}

	const std::string peerId_;
	const std::string connectionId_;
	const ConnectionKind kind_;
	const bool outbound_;
	std::shared_ptr<rtc::PeerConnection> pc_;
	bool hasRemoteDescription_ = false;
	std::vector<rtc::Candidate> pendingCandidates_;
};

namespace
{

class RtcControlChannel : public ControlChannel, public RtcLink
{
public:
	RtcControlChannel(const std::string &peerId, const std::string &connectionId, bool outbound)
	    : RtcLink(peerId, connectionId, ConnectionKind::Data, outbound)
	{
	}
	~RtcControlChannel() override { resetDataChannel(); }

	std::string peerId() const override { return peerId_; }
	bool isOpen() const override { return open_ && !closed_; }

	bool send(const std::string &message) override
	{
		if (!isOpen() || !dc_) {
			return false;
		}
		try {
			return dc_->send(message);
		} catch (const std::exception &e) {
			logError("Failed to send data to %s: %s", peerId_.c_str(), e.what());
			return false;
		}
	}

	void close() override
	{
		if (closed_) {
			return;
		}
		closed_ = true;
		open_ = false;
		resetDataChannel();
		shutdown();
	}

	void setDataChannel(std::shared_ptr<rtc::DataChannel> dc) { dc_ = std::move(dc); }

	void handleOpen()
	{
		if (closed_ || open_) {
			return;
		}
		open_ = true;
		logInfo("Data channel opened with %s", peerId_.c_str());
		notifyOpen();
	}

	void handleMessage(const std::string &message)
	{
		if (!closed_) {
			notifyMessage(message);
		}
	}

	void fail(const std::string &reason) override
	{
		if (closed_) {
			return;
		}
		logInfo("Data channel with %s ended: %s", peerId_.c_str(), reason.c_str());
		closed_ = true;
		open_ = false;
		resetDataChannel();
		shutdown();
		notifyError(reason);
		notifyClosed();
	}

private:
	void resetDataChannel()
	{
		auto dc = std::move(dc_);
		if (!dc) {
			return;
		}
		try {
			dc->onOpen(nullptr);
			dc->onClosed(nullptr);
			dc->onMessage(nullptr);
			dc->close();
		} catch (const std::exception &e) {
			logDebug("Error closing data channel to %s: %s", peerId_.c_str(), e.what());
		}
	}

	std::shared_ptr<rtc::DataChannel> dc_;
	bool open_ = false;
	bool closed_ = false;
};

class RtcMediaChannel : public MediaChannel, public RtcLink
{
public:
	RtcMediaChannel(const std::string &peerId, const std::string &connectionId, bool outbound, StreamType kind,
	                std::string remoteUsername)
	    : RtcLink(peerId, connectionId, ConnectionKind::Media, outbound), kind_(kind),
	      remoteUsername_(std::move(remoteUsername))
	{
	}

	std::string peerId() const override { return peerId_; }
	StreamType kind() const override { return kind_; }
	std::string remoteUsername() const override { return remoteUsername_; }
	bool isOpen() const override { return connected_ && !closed_; }
	std::shared_ptr<MediaStream> remoteStream() const override { return remoteStream_; }

	void setPendingOffer(const std::string &sdp) { pendingOffer_ = sdp; }

	void answer(std::shared_ptr<MediaStream> localStream) override
	{
		if (closed_ || answered_ || outbound_) {
			return;
		}
		answered_ = true;
		localStream_ = std::move(localStream);
		// Auto-negotiation produces the answer once the offer is applied
		if (!applyRemoteDescription(pendingOffer_, rtc::Description::Type::Offer)) {
			fail("Invalid offer");
		}
		pendingOffer_.clear();
	}

	void close() override
	{
		if (closed_) {
			return;
		}
		closed_ = true;
		connected_ = false;
		resetTracks();
		shutdown();
	}

	void addTrack(std::shared_ptr<rtc::Track> track)
	{
		if (closed_ || !track) {
			return;
		}
		tracks_.push_back(std::move(track));
	}

	void markTrackEnded(const std::string &mid)
	{
		auto it = remoteTracks_.find(mid);
		if (it != remoteTracks_.end()) {
			it->second->live = false;
		}
	}

	void handleConnected() override
	{
		if (closed_ || connected_) {
			return;
		}
		connected_ = true;

		auto stream = std::make_shared<MediaStream>(connectionId_);
		for (const auto &track : tracks_) {
			const auto direction = track->direction();
			if (direction != rtc::Description::Direction::SendRecv &&
			    direction != rtc::Description::Direction::RecvOnly) {
				continue;
			}
			auto remote = std::make_shared<MediaTrack>();
			remote->id = connectionId_ + ":" + track->mid();
			remote->kind = track->description().type() == "audio" ? TrackKind::Audio : TrackKind::Video;
			remoteTracks_[track->mid()] = remote;
			stream->addTrack(remote);
		}
		remoteStream_ = stream;
		logInfo("Media from %s connected (%zu remote tracks)", peerId_.c_str(), remoteTracks_.size());
		notifyStream(stream);
	}

	void fail(const std::string &reason) override
	{
		if (closed_) {
			return;
		}
		logInfo("Media channel with %s ended: %s", peerId_.c_str(), reason.c_str());
		closed_ = true;
		connected_ = false;
		for (auto &entry : remoteTracks_) {
			entry.second->live = false;
		}
		resetTracks();
		shutdown();
		notifyError(reason);
		notifyClosed();
	}

private:
	void resetTracks()
	{
		for (const auto &track : tracks_) {
			try {
				track->onOpen(nullptr);
				track->onClosed(nullptr);
			} catch (const std::exception &e) {
				logDebug("Error releasing track for %s: %s", peerId_.c_str(), e.what());
			}
		}
		tracks_.clear();
	}

	const StreamType kind_;
	const std::string remoteUsername_;
	std::string pendingOffer_;
	std::shared_ptr<MediaStream> localStream_;
	std::shared_ptr<MediaStream> remoteStream_;
	std::vector<std::shared_ptr<rtc::Track>> tracks_;
	std::map<std::string, std::shared_ptr<MediaTrack>> remoteTracks_;
	bool answered_ = false;
	bool connected_ = false;
	bool closed_ = false;
};

bool hasTurnScheme(const std::string &url)
{
	const std::string lower = asciiLower(url);
	return lower.rfind("turn:", 0) == 0 || lower.rfind("turns:", 0) == 0;
}

rtc::Description::Direction directionFor(bool sending, bool receiving)
{
	if (sending && receiving) {
		return rtc::Description::Direction::SendRecv;
	}
	if (sending) {
		return rtc::Description::Direction::SendOnly;
	}
	return rtc::Description::Direction::RecvOnly;
}

} // namespace

RtcTransport::RtcTransport(const SessionSettings &settings, EventLoop &loop)
    : settings_(settings), loop_(loop), iceServers_(settings.iceServers), forceTurn_(settings.forceTurn),
      alive_(std::make_shared<bool>(true))
{
	std::weak_ptr<bool> alive = alive_;

	signaling_.setOnMessage([this, alive](const ParsedSignalMessage &message) {
		loop_.post([this, alive, message]() {
			if (alive.expired()) {
				return;
			}
			handleSignal(message);
		});
	});

	signaling_.setOnError([this, alive](const std::string &error) {
		loop_.post([this, alive, error]() {
			if (alive.expired()) {
				return;
			}
			reportError(TransportErrorKind::Network, "", error);
		});
	});
}

RtcTransport::~RtcTransport()
{
	shuttingDown_ = true;
	signaling_.setOnMessage(nullptr);
	signaling_.setOnError(nullptr);
	signaling_.disconnect();
	alive_.reset();
	closeAllLinks();
}

bool RtcTransport::registerSelf(const std::string &id)
{
	if (id.empty()) {
		logError("Cannot register an empty peer id");
		return false;
	}
	if (signaling_.isConnected() && id == selfId_) {
		return true;
	}

	selfId_ = id;
	registered_ = false;
	const std::string url =
	    buildSignalingUrl(settings_.signalingHost, settings_.signalingPort, settings_.signalingPath,
	                      settings_.signalingSecure, settings_.signalingKey, id, generateSessionId());
	logInfo("Registering %s with the signaling server", id.c_str());
	return signaling_.connect(url);
}

void RtcTransport::unregister()
{
	if (!selfId_.empty()) {
		logInfo("Unregistering %s", selfId_.c_str());
	}
	closeAllLinks();
	signaling_.disconnect();
	registered_ = false;
}

bool RtcTransport::isRelayForced(const std::string &peerId) const
{
	return forceTurn_ || relayPeers_.count(peerId) > 0;
}

rtc::Configuration RtcTransport::getRtcConfig(const std::string &peerId) const
{
	rtc::Configuration config;
	bool hasTurnServer = false;

	// Custom servers replace the built-in list
	const std::vector<IceServer> &servers = iceServers_.empty() ? DEFAULT_ICE_SERVERS : iceServers_;
	for (const auto &server : servers) {
		try {
			rtc::IceServer iceServer(server.urls);
			if (!server.username.empty()) {
				iceServer.username = server.username;
				iceServer.password = server.credential;
			}
			config.iceServers.push_back(iceServer);
			if (hasTurnScheme(server.urls)) {
				hasTurnServer = true;
			}
		} catch (const std::exception &e) {
			logWarning("Skipping ICE server %s: %s", server.urls.c_str(), e.what());
		}
	}

	if (isRelayForced(peerId)) {
		config.iceTransportPolicy = rtc::TransportPolicy::Relay;
		if (!hasTurnServer) {
			logWarning("Relay is forced for %s but no TURN servers are configured; connections may fail.",
			           peerId.c_str());
		}
	}

	return config;
}

std::shared_ptr<ControlChannel> RtcTransport::openControlChannel(const std::string &peerId)
{
	if (!registered_) {
		logWarning("Cannot open control channel to %s - not registered", peerId.c_str());
		return nullptr;
	}

	const std::string connectionId = makeConnectionId(ConnectionKind::Data);
	auto channel = std::make_shared<RtcControlChannel>(peerId, connectionId, true);

	try {
		channel->attach(std::make_shared<rtc::PeerConnection>(getRtcConfig(peerId)));
		wireLink(channel, settings_.username, StreamType::Camera);

		std::weak_ptr<RtcControlChannel> weak = channel;
		std::weak_ptr<bool> alive = alive_;
		auto dc = channel->peerConnection()->createDataChannel(connectionId);
		dc->onOpen([this, weak, alive]() {
			loop_.post([weak, alive]() {
				auto ch = weak.lock();
				if (ch && !alive.expired()) {
					ch->handleOpen();
				}
			});
		});
		dc->onClosed([this, weak, alive]() {
			loop_.post([weak, alive]() {
				auto ch = weak.lock();
				if (ch && !alive.expired()) {
					ch->fail("Data channel closed");
				}
			});
		});
		dc->onMessage([this, weak, alive](auto data) {
			if (!std::holds_alternative<std::string>(data)) {
				return;
			}
			std::string text = std::get<std::string>(data);
			loop_.post([weak, alive, text]() {
				auto ch = weak.lock();
				if (ch && !alive.expired()) {
					ch->handleMessage(text);
				}
			});
		});
		channel->setDataChannel(dc);
	} catch (const std::exception &e) {
		logError("Failed to create control channel to %s: %s", peerId.c_str(), e.what());
		forgetLink(connectionId);
		return nullptr;
	}

	logInfo("Opening control channel %s to %s", connectionId.c_str(), peerId.c_str());
	return channel;
}

std::shared_ptr<MediaChannel> RtcTransport::openMediaChannel(const std::string &peerId,
                                                             std::shared_ptr<MediaStream> localStream,
                                                             const MediaChannelOptions &options)
{
	if (!registered_) {
		logWarning("Cannot open media channel to %s - not registered", peerId.c_str());
		return nullptr;
	}

	const std::string connectionId = makeConnectionId(ConnectionKind::Media);
	auto channel = std::make_shared<RtcMediaChannel>(peerId, connectionId, true, options.kind, "");

	const bool sendAudio = localStream && !localStream->audioTracks().empty();
	const bool sendVideo = localStream && !localStream->videoTracks().empty();
	// A screen channel only carries our content; a camera channel always receives
	const bool receive = options.kind == StreamType::Camera;

	try {
		channel->attach(std::make_shared<rtc::PeerConnection>(getRtcConfig(peerId)));
		wireLink(channel, options.username, options.kind);

		if (sendVideo || receive) {
			rtc::Description::Video videoDesc("video", directionFor(sendVideo, receive));
			videoDesc.addH264Codec(96);
			channel->addTrack(channel->peerConnection()->addTrack(videoDesc));
		}
		if (sendAudio || receive) {
			rtc::Description::Audio audioDesc("audio", directionFor(sendAudio, receive));
			audioDesc.addOpusCodec(111);
			channel->addTrack(channel->peerConnection()->addTrack(audioDesc));
		}
		channel->peerConnection()->setLocalDescription();
	} catch (const std::exception &e) {
		logError("Failed to create media channel to %s: %s", peerId.c_str(), e.what());
		forgetLink(connectionId);
		return nullptr;
	}

	logInfo("Calling %s with %s media (%s)", peerId.c_str(), streamTypeName(options.kind), connectionId.c_str());
	return channel;
}

void RtcTransport::restartSession(const std::string &peerId, bool forceRelay)
{
	if (forceRelay && relayPeers_.insert(peerId).second) {
		logInfo("Forcing TURN relay for %s", peerId.c_str());
	}

	// Drop the peer's camera links only; screen channels belong to the overlay and stay up.
	// The session re-calls once the restart settles.
	std::vector<std::shared_ptr<RtcMediaChannel>> stale;
	for (const auto &entry : links_) {
		auto media = std::dynamic_pointer_cast<RtcMediaChannel>(entry.second.lock());
		if (media && media->linkPeerId() == peerId && media->kind() == StreamType::Camera) {
			stale.push_back(media);
		}
	}
	for (const auto &media : stale) {
		forgetLink(media->connectionId());
		media->close();
	}
}

void RtcTransport::wireLink(const std::shared_ptr<RtcLink> &link, const std::string &username, StreamType streamType)
{
	auto pc = link->peerConnection();
	const std::string peerId = link->linkPeerId();
	const std::string connectionId = link->connectionId();
	const ConnectionKind kind = link->connectionKind();
	std::weak_ptr<RtcLink> weak = link;
	std::weak_ptr<bool> alive = alive_;

	links_[connectionId] = weak;

	pc->onLocalDescription([this, peerId, connectionId, kind, username, streamType](rtc::Description description) {
		if (shuttingDown_) {
			return;
		}
		const std::string sdp = std::string(description);
		if (description.type() == rtc::Description::Type::Offer) {
			signaling_.send(buildOfferMessage(peerId, connectionId, kind, sdp, username, streamType));
			logInfo("Sent offer %s to %s", connectionId.c_str(), peerId.c_str());
		} else {
			signaling_.send(buildAnswerMessage(peerId, connectionId, kind, sdp));
			logInfo("Sent answer %s to %s", connectionId.c_str(), peerId.c_str());
		}
	});

	pc->onLocalCandidate([this, peerId, connectionId, kind](rtc::Candidate candidate) {
		if (shuttingDown_) {
			return;
		}
		signaling_.send(buildCandidateMessage(peerId, connectionId, kind, std::string(candidate), candidate.mid()));
	});

	pc->onStateChange([this, weak, alive, peerId, connectionId](rtc::PeerConnection::State state) {
		if (shuttingDown_) {
			return;
		}
		loop_.post([this, weak, alive, peerId, connectionId, state]() {
			auto link = weak.lock();
			if (!link || alive.expired()) {
				return;
			}
			switch (state) {
			case rtc::PeerConnection::State::Connecting:
				logDebug("Peer %s connecting (%s)", peerId.c_str(), connectionId.c_str());
				break;
			case rtc::PeerConnection::State::Connected:
				logInfo("Peer %s connected (%s)", peerId.c_str(), connectionId.c_str());
				link->handleConnected();
				break;
			case rtc::PeerConnection::State::Disconnected:
				forgetLink(connectionId);
				link->fail("Peer disconnected");
				break;
			case rtc::PeerConnection::State::Failed:
				logError("Peer %s connection failed (%s)", peerId.c_str(), connectionId.c_str());
				forgetLink(connectionId);
				link->fail("Connection failed");
				break;
			case rtc::PeerConnection::State::Closed:
				forgetLink(connectionId);
				link->fail("Connection closed");
				break;
			default:
				break;
			}
		});
	});

	if (kind == ConnectionKind::Media) {
		pc->onTrack([this, weak, alive, peerId](std::shared_ptr<rtc::Track> track) {
			if (shuttingDown_) {
				return;
			}
			logInfo("Received %s track from %s", track->description().type().c_str(), peerId.c_str());
			const std::string mid = track->mid();
			track->onClosed([this, weak, alive, mid]() {
				loop_.post([weak, alive, mid]() {
					auto media = std::dynamic_pointer_cast<RtcMediaChannel>(weak.lock());
					if (media && !alive.expired()) {
						media->markTrackEnded(mid);
					}
				});
			});
			loop_.post([weak, alive, track]() {
				auto media = std::dynamic_pointer_cast<RtcMediaChannel>(weak.lock());
				if (media && !alive.expired()) {
					media->addTrack(track);
				}
			});
		});
	} else if (!link->outbound()) {
		pc->onDataChannel([this, weak, alive](std::shared_ptr<rtc::DataChannel> dc) {
			if (shuttingDown_) {
				return;
			}
			dc->onOpen([this, weak, alive]() {
				loop_.post([weak, alive]() {
					auto ch = std::dynamic_pointer_cast<RtcControlChannel>(weak.lock());
					if (ch && !alive.expired()) {
						ch->handleOpen();
					}
				});
			});
			dc->onClosed([this, weak, alive]() {
				loop_.post([weak, alive]() {
					auto ch = std::dynamic_pointer_cast<RtcControlChannel>(weak.lock());
					if (ch && !alive.expired()) {
						ch->fail("Data channel closed");
					}
				});
			});
			dc->onMessage([this, weak, alive](auto data) {
				if (!std::holds_alternative<std::string>(data)) {
					return;
				}
				std::string text = std::get<std::string>(data);
				loop_.post([weak, alive, text]() {
					auto ch = std::dynamic_pointer_cast<RtcControlChannel>(weak.lock());
					if (ch && !alive.expired()) {
						ch->handleMessage(text);
					}
				});
			});
			loop_.post([weak, alive, dc]() {
				auto ch = std::dynamic_pointer_cast<RtcControlChannel>(weak.lock());
				if (!ch || alive.expired()) {
					return;
				}
				ch->setDataChannel(dc);
				if (dc->isOpen()) {
					ch->handleOpen();
				}
			});
		});
	}
}

void RtcTransport::handleSignal(const ParsedSignalMessage &message)
{
	switch (message.kind) {
	case SignalKind::Open:
		if (registered_) {
			logInfo("Signaling session for %s re-opened", selfId_.c_str());
			return;
		}
		registered_ = true;
		logInfo("Registered as %s", selfId_.c_str());
		auto cb = onRegistered_;
		if (cb) {
			cb(selfId_);
		}
		break;
	case SignalKind::IdTaken:
		logError("Peer id %s is already taken", selfId_.c_str());
		reportError(TransportErrorKind::IdTaken, "", "ID \"" + selfId_ + "\" is taken");
		break;
	case SignalKind::InvalidKey:
		reportError(TransportErrorKind::ServerError, "", "Invalid signaling key");
		break;
	case SignalKind::Error:
		logWarning("Signaling server error: %s", message.errorMessage.c_str());
		reportError(TransportErrorKind::ServerError, "",
		            message.errorMessage.empty() ? "Signaling server error" : message.errorMessage);
		break;
	case SignalKind::Offer:
		handleOffer(message);
		break;
	case SignalKind::Answer:
		handleRemoteDescription(message);
		break;
	case SignalKind::Candidate:
		handleRemoteCandidate(message);
		break;
	case SignalKind::Leave:
		handlePeerGone(message.src, "Peer left");
		break;
	case SignalKind::Expire:
		logWarning("Could not reach %s", message.src.c_str());
		handlePeerGone(message.src, "Peer unavailable");
		reportError(TransportErrorKind::PeerUnavailable, message.src, "Could not connect to peer " + message.src);
		break;
	default:
		logDebug("Ignoring signaling message of type %s", message.type.c_str());
		break;
	}
}

void RtcTransport::handleOffer(const ParsedSignalMessage &message)
{
	if (message.src.empty()) {
		logWarning("Dropping offer without source");
		return;
	}
	if (findLink(message.connectionId)) {
		logDebug("Duplicate offer %s from %s", message.connectionId.c_str(), message.src.c_str());
		return;
	}

	try {
		if (message.connectionKind == ConnectionKind::Data) {
			auto channel = std::make_shared<RtcControlChannel>(message.src, message.connectionId, false);
			channel->attach(std::make_shared<rtc::PeerConnection>(getRtcConfig(message.src)));
			wireLink(channel, settings_.username, StreamType::Camera);
			if (!channel->applyRemoteDescription(message.sdp, rtc::Description::Type::Offer)) {
				forgetLink(message.connectionId);
				return;
			}
			logInfo("Incoming control channel %s from %s", message.connectionId.c_str(), message.src.c_str());
			auto cb = onIncomingControl_;
			if (cb) {
				cb(channel);
			}
			return;
		}

		const StreamType kind = message.hasStreamType ? message.streamType : StreamType::Camera;
		auto channel =
		    std::make_shared<RtcMediaChannel>(message.src, message.connectionId, false, kind, message.username);
		channel->attach(std::make_shared<rtc::PeerConnection>(getRtcConfig(message.src)));
		wireLink(channel, settings_.username, kind);
		channel->setPendingOffer(message.sdp);
		logInfo("Incoming %s call %s from %s", streamTypeName(kind), message.connectionId.c_str(),
		        message.src.c_str());
		auto cb = onIncomingMedia_;
		if (cb) {
			cb(channel);
		}
	} catch (const std::exception &e) {
		logError("Failed to accept offer from %s: %s", message.src.c_str(), e.what());
		forgetLink(message.connectionId);
	}
}

void RtcTransport::handleRemoteDescription(const ParsedSignalMessage &message)
{
	auto link = findLink(message.connectionId);
	if (!link) {
		logWarning("Answer for unknown connection %s from %s", message.connectionId.c_str(), message.src.c_str());
		return;
	}
	if (!link->applyRemoteDescription(message.sdp, rtc::Description::Type::Answer)) {
		forgetLink(message.connectionId);
		link->fail("Invalid answer");
	}
}

void RtcTransport::handleRemoteCandidate(const ParsedSignalMessage &message)
{
	auto link = findLink(message.connectionId);
	if (!link) {
		logDebug("Candidate for unknown connection %s", message.connectionId.c_str());
		return;
	}
	link->addRemoteCandidate(message.candidate, message.mid);
}

void RtcTransport::handlePeerGone(const std::string &peerId, const std::string &reason)
{
	std::vector<std::shared_ptr<RtcLink>> gone;
	for (const auto &entry : links_) {
		auto link = entry.second.lock();
		if (link && link->linkPeerId() == peerId) {
			gone.push_back(link);
		}
	}
	for (const auto &link : gone) {
		forgetLink(link->connectionId());
		link->fail(reason);
	}
}

void RtcTransport::forgetLink(const std::string &connectionId)
{
	links_.erase(connectionId);
}

std::shared_ptr<RtcLink> RtcTransport::findLink(const std::string &connectionId) const
{
	auto it = links_.find(connectionId);
	if (it == links_.end()) {
		return nullptr;
	}
	return it->second.lock();
}

void RtcTransport::closeAllLinks()
{
	std::vector<std::shared_ptr<RtcLink>> open;
	for (const auto &entry : links_) {
		if (auto link = entry.second.lock()) {
			open.push_back(link);
		}
	}
	links_.clear();

	for (const auto &link : open) {
		if (auto control = std::dynamic_pointer_cast<RtcControlChannel>(link)) {
			control->close();
		} else if (auto media = std::dynamic_pointer_cast<RtcMediaChannel>(link)) {
			media->close();
		}
	}
}

void RtcTransport::reportError(TransportErrorKind kind, const std::string &peerId, const std::string &message)
{
	auto cb = onSessionError_;
	if (cb) {
		cb(kind, peerId, message);
	}
}

void routeTransportLogs(LogLevel level)
{
	rtc::LogLevel rtcLevel = rtc::LogLevel::Warning;
	switch (level) {
	case LogLevel::Debug:
		rtcLevel = rtc::LogLevel::Debug;
		break;
	case LogLevel::Info:
		rtcLevel = rtc::LogLevel::Info;
		break;
	case LogLevel::Warning:
		rtcLevel = rtc::LogLevel::Warning;
		break;
	case LogLevel::Error:
		rtcLevel = rtc::LogLevel::Error;
		break;
	}

	rtc::InitLogger(rtcLevel, [](rtc::LogLevel messageLevel, std::string message) {
		switch (messageLevel) {
		case rtc::LogLevel::Fatal:
		case rtc::LogLevel::Error:
			logError("[rtc] %s", message.c_str());
			break;
		case rtc::LogLevel::Warning:
			logWarning("[rtc] %s", message.c_str());
			break;
		case rtc::LogLevel::Info:
			logInfo("[rtc] %s", message.c_str());
			break;
		default:
			logDebug("[rtc] %s", message.c_str());
			break;
		}
	});
}

} // namespace peermesh
