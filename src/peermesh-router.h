/*
 * PeerMesh
 * Control message routing
 */

#pragma once

#include <string>

#include "peermesh-messages.h"

namespace peermesh
{

// One handler per message type. Implementations must handle or explicitly ignore every type.
class ControlMessageHandler
{
public:
	virtual ~ControlMessageHandler() = default;

	virtual void onUsername(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onRequestUsername(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onPeerList(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onRequestPeerList(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onNewPeer(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onPeerDisconnect(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onScreenSharingStatus(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onScreenSharingStream(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onScreenShareStarted(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onScreenShareRetryNeeded(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onStreamMetadata(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onRequestScreenStream(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onRequestStreamUpdate(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onCameraStreamRestored(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onReconnectAfterScreenShare(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onRequestFullReconnect(const std::string &fromPeer, const ControlMessage &message) = 0;
	virtual void onRecordingStatus(const std::string &fromPeer, const ControlMessage &message) = 0;

	// Everything not in the internal set also reaches the application
	virtual void onApplicationMessage(const std::string &fromPeer, const ControlMessage &message) = 0;
};

class ControlMessageRouter
{
public:
	explicit ControlMessageRouter(ControlMessageHandler &handler);

	// Decode and dispatch one inbound message. Returns false if the message was malformed.
	bool route(const std::string &fromPeer, const std::string &rawMessage);
	void dispatch(const std::string &fromPeer, const ControlMessage &message);

	size_t malformedCount() const { return malformedCount_; }

private:
	ControlMessageHandler &handler_;
	size_t malformedCount_ = 0;
};

} // namespace peermesh
