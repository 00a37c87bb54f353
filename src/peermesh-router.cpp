/*
 * PeerMesh
 * Control message routing
 */

#include "peermesh-router.h"

#include "peermesh-utils.h"

namespace peermesh
{

ControlMessageRouter::ControlMessageRouter(ControlMessageHandler &handler) : handler_(handler) {}

bool ControlMessageRouter::route(const std::string &fromPeer, const std::string &rawMessage)
{
	ControlMessage message;
	std::string error;
	if (!parseControlMessage(rawMessage, message, &error)) {
		malformedCount_++;
		logWarning("Dropping malformed control message from %s: %s", fromPeer.c_str(), error.c_str());
		return false;
	}

	logDebug("Control message '%s' from %s", message.typeName.c_str(), fromPeer.c_str());
	dispatch(fromPeer, message);
	return true;
}

void ControlMessageRouter::dispatch(const std::string &fromPeer, const ControlMessage &message)
{
	switch (message.type) {
	case MessageType::Username:
		handler_.onUsername(fromPeer, message);
		break;
	case MessageType::RequestUsername:
		handler_.onRequestUsername(fromPeer, message);
		break;
	case MessageType::PeerList:
		handler_.onPeerList(fromPeer, message);
		break;
	case MessageType::RequestPeerList:
		handler_.onRequestPeerList(fromPeer, message);
		break;
	case MessageType::NewPeer:
		handler_.onNewPeer(fromPeer, message);
		break;
	case MessageType::PeerDisconnect:
		handler_.onPeerDisconnect(fromPeer, message);
		break;
	case MessageType::ScreenSharingStatus:
		handler_.onScreenSharingStatus(fromPeer, message);
		break;
	case MessageType::ScreenSharingStream:
		handler_.onScreenSharingStream(fromPeer, message);
		break;
	case MessageType::ScreenShareStarted:
		handler_.onScreenShareStarted(fromPeer, message);
		break;
	case MessageType::ScreenShareRetryNeeded:
		handler_.onScreenShareRetryNeeded(fromPeer, message);
		break;
	case MessageType::StreamMetadata:
		handler_.onStreamMetadata(fromPeer, message);
		break;
	case MessageType::RequestScreenStream:
		handler_.onRequestScreenStream(fromPeer, message);
		break;
	case MessageType::RequestStreamUpdate:
		handler_.onRequestStreamUpdate(fromPeer, message);
		break;
	case MessageType::CameraStreamRestored:
		handler_.onCameraStreamRestored(fromPeer, message);
		break;
	case MessageType::ReconnectAfterScreenShare:
		handler_.onReconnectAfterScreenShare(fromPeer, message);
		break;
	case MessageType::RequestFullReconnect:
		handler_.onRequestFullReconnect(fromPeer, message);
		break;
	case MessageType::RecordingStatus:
		handler_.onRecordingStatus(fromPeer, message);
		break;
	case MessageType::ScreenShareConfirmed:
	case MessageType::CameraStreamSent:
	case MessageType::ChatMessage:
	case MessageType::Unknown:
		// Application-only messages
		break;
	}

	if (!isInternalMessage(message.type)) {
		handler_.onApplicationMessage(fromPeer, message);
	}
}

} // namespace peermesh
