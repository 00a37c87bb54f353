/*
 * PeerMesh
 * Control-channel message types and codec
 */

#include "peermesh-messages.h"

#include <utility>

#include "peermesh-utils.h"

namespace peermesh
{

namespace
{

const std::vector<std::pair<MessageType, const char *>> &messageTypeNames()
{
	static const std::vector<std::pair<MessageType, const char *>> names = {
	    {MessageType::Username, "username"},
	    {MessageType::RequestUsername, "request-username"},
	    {MessageType::PeerList, "peer-list"},
	    {MessageType::RequestPeerList, "request-peer-list"},
	    {MessageType::NewPeer, "new-peer"},
	    {MessageType::PeerDisconnect, "peer-disconnect"},
	    {MessageType::ScreenSharingStatus, "screen-sharing-status"},
	    {MessageType::ScreenSharingStream, "screen-sharing-stream"},
	    {MessageType::ScreenShareStarted, "screen-share-started"},
	    {MessageType::ScreenShareRetryNeeded, "screen-share-retry-needed"},
	    {MessageType::ScreenShareConfirmed, "screen-share-confirmed"},
	    {MessageType::StreamMetadata, "stream-metadata"},
	    {MessageType::RequestScreenStream, "request-screen-stream"},
	    {MessageType::RequestStreamUpdate, "request-stream-update"},
	    {MessageType::CameraStreamRestored, "camera-stream-restored"},
	    {MessageType::CameraStreamSent, "camera-stream-sent"},
	    {MessageType::ReconnectAfterScreenShare, "reconnect-after-screen-share"},
	    {MessageType::RequestFullReconnect, "request-full-reconnect"},
	    {MessageType::ChatMessage, "chat-message"},
	    {MessageType::RecordingStatus, "recording-status"},
	};
	return names;
}

bool requireField(const JsonParser &json, const char *key, std::string *error)
{
	if (json.hasKey(key)) {
		return true;
	}
	if (error) {
		*error = std::string("missing field '") + key + "'";
	}
	return false;
}

std::string encode(ControlMessage message)
{
	if (message.timestamp == 0) {
		message.timestamp = currentTimeMs();
	}
	return encodeControlMessage(message);
}

ControlMessage withPeer(MessageType type, const std::string &peerId)
{
	ControlMessage message;
	message.type = type;
	message.peerId = peerId;
	return message;
}

} // namespace

const char *messageTypeName(MessageType type)
{
	for (const auto &entry : messageTypeNames()) {
		if (entry.first == type) {
			return entry.second;
		}
	}
	return "unknown";
}

MessageType messageTypeFromName(const std::string &name)
{
	for (const auto &entry : messageTypeNames()) {
		if (name == entry.second) {
			return entry.first;
		}
	}
	return MessageType::Unknown;
}

bool isInternalMessage(MessageType type)
{
	switch (type) {
	case MessageType::PeerList:
	case MessageType::NewPeer:
	case MessageType::RequestPeerList:
	case MessageType::PeerDisconnect:
	case MessageType::ScreenSharingStatus:
	case MessageType::RequestStreamUpdate:
	case MessageType::ScreenShareStarted:
	case MessageType::RequestScreenStream:
	case MessageType::CameraStreamRestored:
		return true;
	case MessageType::Username:
	case MessageType::RequestUsername:
	case MessageType::ScreenSharingStream:
	case MessageType::ScreenShareRetryNeeded:
	case MessageType::ScreenShareConfirmed:
	case MessageType::StreamMetadata:
	case MessageType::CameraStreamSent:
	case MessageType::ReconnectAfterScreenShare:
	case MessageType::RequestFullReconnect:
	case MessageType::ChatMessage:
	case MessageType::RecordingStatus:
	case MessageType::Unknown:
		return false;
	}
	return false;
}

bool parseControlMessage(const std::string &raw, ControlMessage &message, std::string *error)
{
	try {
		const std::string trimmed = trim(raw);
		if (trimmed.empty() || trimmed[0] != '{') {
			if (error) {
				*error = "not a JSON object";
			}
			return false;
		}

		JsonParser json(trimmed);
		message = ControlMessage{};
		message.raw = raw;
		message.typeName = json.getString("type");
		if (message.typeName.empty()) {
			if (error) {
				*error = "missing field 'type'";
			}
			return false;
		}

		message.type = messageTypeFromName(message.typeName);
		message.hasTimestamp = json.hasKey("timestamp");
		if (message.hasTimestamp) {
			message.timestamp = json.getInt64("timestamp", 0);
		} else {
			logDebug("Control message '%s' has no timestamp", message.typeName.c_str());
		}
		message.peerId = json.getString("peerId");
		message.username = json.getString("username");
		message.peers = json.getArray("peers");
		message.isSharing = json.getBool("isSharing", false);
		message.sharingPeerId = json.getString("sharingPeerId");
		message.urgent = json.getBool("urgent", false);
		message.forceRefresh = json.getBool("forceRefresh", false);
		message.sender = json.getString("sender");
		message.text = json.getString("text");
		message.isRecording = json.getBool("isRecording", false);
		message.host = json.getString("host");
		if (json.hasKey("streamType")) {
			message.hasStreamType = parseStreamType(json.getString("streamType"), message.streamType);
		}

		switch (message.type) {
		case MessageType::Username:
			return requireField(json, "username", error) && requireField(json, "peerId", error);
		case MessageType::PeerList:
			return requireField(json, "peers", error);
		case MessageType::ScreenSharingStatus:
			return requireField(json, "peerId", error) && requireField(json, "isSharing", error);
		case MessageType::StreamMetadata:
			if (!requireField(json, "peerId", error) || !requireField(json, "streamType", error)) {
				return false;
			}
			if (!message.hasStreamType) {
				if (error) {
					*error = "invalid streamType";
				}
				return false;
			}
			return true;
		case MessageType::RequestUsername:
		case MessageType::NewPeer:
		case MessageType::PeerDisconnect:
		case MessageType::ScreenSharingStream:
		case MessageType::CameraStreamRestored:
		case MessageType::ReconnectAfterScreenShare:
			return requireField(json, "peerId", error);
		case MessageType::ScreenShareStarted:
		case MessageType::ScreenShareRetryNeeded:
			return requireField(json, "sharingPeerId", error);
		case MessageType::ChatMessage:
			return requireField(json, "sender", error) && requireField(json, "text", error);
		case MessageType::RecordingStatus:
			return requireField(json, "isRecording", error);
		case MessageType::RequestPeerList:
		case MessageType::ScreenShareConfirmed:
		case MessageType::RequestScreenStream:
		case MessageType::RequestStreamUpdate:
		case MessageType::CameraStreamSent:
		case MessageType::RequestFullReconnect:
		case MessageType::Unknown:
			return true;
		}
		return true;
	} catch (const std::exception &e) {
		if (error) {
			*error = e.what();
		}
		return false;
	}
}

std::string encodeControlMessage(const ControlMessage &message)
{
	JsonBuilder json;
	json.add("type", message.type == MessageType::Unknown ? message.typeName : messageTypeName(message.type));

	switch (message.type) {
	case MessageType::Username:
		json.add("username", message.username);
		json.add("peerId", message.peerId);
		break;
	case MessageType::PeerList:
		json.add("peers", message.peers);
		break;
	case MessageType::ScreenSharingStatus:
		json.add("peerId", message.peerId);
		json.add("isSharing", message.isSharing);
		json.add("streamType", streamTypeName(message.isSharing ? StreamType::Screen : StreamType::Camera));
		break;
	case MessageType::StreamMetadata:
		json.add("peerId", message.peerId);
		json.add("streamType", streamTypeName(message.streamType));
		break;
	case MessageType::ScreenShareStarted:
	case MessageType::ScreenShareRetryNeeded:
		json.add("sharingPeerId", message.sharingPeerId);
		break;
	case MessageType::RequestScreenStream:
		json.add("peerId", message.peerId);
		json.add("urgent", message.urgent);
		break;
	case MessageType::RequestStreamUpdate:
		json.add("peerId", message.peerId);
		json.add("urgent", message.urgent);
		json.add("forceRefresh", message.forceRefresh);
		break;
	case MessageType::ChatMessage:
		json.add("sender", message.sender);
		json.add("text", message.text);
		break;
	case MessageType::RecordingStatus:
		json.add("isRecording", message.isRecording);
		json.add("host", message.host);
		break;
	case MessageType::RequestUsername:
	case MessageType::RequestPeerList:
	case MessageType::NewPeer:
	case MessageType::PeerDisconnect:
	case MessageType::ScreenSharingStream:
	case MessageType::ScreenShareConfirmed:
	case MessageType::CameraStreamRestored:
	case MessageType::CameraStreamSent:
	case MessageType::ReconnectAfterScreenShare:
	case MessageType::RequestFullReconnect:
	case MessageType::Unknown:
		if (!message.peerId.empty()) {
			json.add("peerId", message.peerId);
		}
		break;
	}

	json.add("timestamp", message.timestamp);
	return json.build();
}

std::string createUsernameMessage(const std::string &peerId, const std::string &username)
{
	ControlMessage message = withPeer(MessageType::Username, peerId);
	message.username = username;
	return encode(message);
}

std::string createRequestUsernameMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::RequestUsername, peerId));
}

std::string createPeerListMessage(const std::vector<std::string> &peers)
{
	ControlMessage message;
	message.type = MessageType::PeerList;
	message.peers = peers;
	return encode(message);
}

std::string createRequestPeerListMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::RequestPeerList, peerId));
}

std::string createNewPeerMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::NewPeer, peerId));
}

std::string createPeerDisconnectMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::PeerDisconnect, peerId));
}

std::string createScreenSharingStatusMessage(const std::string &peerId, bool isSharing)
{
	ControlMessage message = withPeer(MessageType::ScreenSharingStatus, peerId);
	message.isSharing = isSharing;
	return encode(message);
}

std::string createScreenSharingStreamMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::ScreenSharingStream, peerId));
}

std::string createScreenShareStartedMessage(const std::string &sharingPeerId)
{
	ControlMessage message;
	message.type = MessageType::ScreenShareStarted;
	message.sharingPeerId = sharingPeerId;
	return encode(message);
}

std::string createScreenShareRetryNeededMessage(const std::string &sharingPeerId)
{
	ControlMessage message;
	message.type = MessageType::ScreenShareRetryNeeded;
	message.sharingPeerId = sharingPeerId;
	return encode(message);
}

std::string createScreenShareConfirmedMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::ScreenShareConfirmed, peerId));
}

std::string createStreamMetadataMessage(const std::string &peerId, StreamType streamType)
{
	ControlMessage message = withPeer(MessageType::StreamMetadata, peerId);
	message.streamType = streamType;
	message.hasStreamType = true;
	return encode(message);
}

std::string createRequestScreenStreamMessage(const std::string &peerId, bool urgent)
{
	ControlMessage message = withPeer(MessageType::RequestScreenStream, peerId);
	message.urgent = urgent;
	return encode(message);
}

std::string createRequestStreamUpdateMessage(const std::string &peerId, bool urgent, bool forceRefresh)
{
	ControlMessage message = withPeer(MessageType::RequestStreamUpdate, peerId);
	message.urgent = urgent;
	message.forceRefresh = forceRefresh;
	return encode(message);
}

std::string createCameraStreamRestoredMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::CameraStreamRestored, peerId));
}

std::string createCameraStreamSentMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::CameraStreamSent, peerId));
}

std::string createReconnectAfterScreenShareMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::ReconnectAfterScreenShare, peerId));
}

std::string createRequestFullReconnectMessage(const std::string &peerId)
{
	return encode(withPeer(MessageType::RequestFullReconnect, peerId));
}

std::string createChatMessage(const std::string &sender, const std::string &text)
{
	ControlMessage message;
	message.type = MessageType::ChatMessage;
	message.sender = sender;
	message.text = text;
	return encode(message);
}

std::string createRecordingStatusMessage(bool isRecording, const std::string &host)
{
	ControlMessage message;
	message.type = MessageType::RecordingStatus;
	message.isRecording = isRecording;
	message.host = host;
	return encode(message);
}

} // namespace peermesh
