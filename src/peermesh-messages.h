/*
 * PeerMesh
 * Control-channel message types and codec
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "peermesh-common.h"

namespace peermesh
{

enum class MessageType {
	Username,
	RequestUsername,
	PeerList,
	RequestPeerList,
	NewPeer,
	PeerDisconnect,
	ScreenSharingStatus,
	ScreenSharingStream,
	ScreenShareStarted,
	ScreenShareRetryNeeded,
	ScreenShareConfirmed,
	StreamMetadata,
	RequestScreenStream,
	RequestStreamUpdate,
	CameraStreamRestored,
	CameraStreamSent,
	ReconnectAfterScreenShare,
	RequestFullReconnect,
	ChatMessage,
	RecordingStatus,
	Unknown
};

// Decoded control message. Fields not used by a type keep their defaults.
struct ControlMessage {
	MessageType type = MessageType::Unknown;
	std::string typeName;
	// Sender's clock; stays 0 with hasTimestamp unset when the field is missing
	int64_t timestamp = 0;
	bool hasTimestamp = false;

	std::string peerId;
	std::string username;
	std::vector<std::string> peers;

	bool isSharing = false;
	bool hasStreamType = false;
	StreamType streamType = StreamType::Camera;
	std::string sharingPeerId;

	bool urgent = false;
	bool forceRefresh = false;

	std::string sender;
	std::string text;

	bool isRecording = false;
	std::string host;

	std::string raw;
};

const char *messageTypeName(MessageType type);
MessageType messageTypeFromName(const std::string &name);

// Messages consumed by the orchestrator and not forwarded to the application
bool isInternalMessage(MessageType type);

bool parseControlMessage(const std::string &raw, ControlMessage &message, std::string *error = nullptr);
std::string encodeControlMessage(const ControlMessage &message);

// Builders for outbound messages; each stamps the current time
std::string createUsernameMessage(const std::string &peerId, const std::string &username);
std::string createRequestUsernameMessage(const std::string &peerId);
std::string createPeerListMessage(const std::vector<std::string> &peers);
std::string createRequestPeerListMessage(const std::string &peerId);
std::string createNewPeerMessage(const std::string &peerId);
std::string createPeerDisconnectMessage(const std::string &peerId);
std::string createScreenSharingStatusMessage(const std::string &peerId, bool isSharing);
std::string createScreenSharingStreamMessage(const std::string &peerId);
std::string createScreenShareStartedMessage(const std::string &sharingPeerId);
std::string createScreenShareRetryNeededMessage(const std::string &sharingPeerId);
std::string createScreenShareConfirmedMessage(const std::string &peerId);
std::string createStreamMetadataMessage(const std::string &peerId, StreamType streamType);
std::string createRequestScreenStreamMessage(const std::string &peerId, bool urgent);
std::string createRequestStreamUpdateMessage(const std::string &peerId, bool urgent, bool forceRefresh);
std::string createCameraStreamRestoredMessage(const std::string &peerId);
std::string createCameraStreamSentMessage(const std::string &peerId);
std::string createReconnectAfterScreenShareMessage(const std::string &peerId);
std::string createRequestFullReconnectMessage(const std::string &peerId);
std::string createChatMessage(const std::string &sender, const std::string &text);
std::string createRecordingStatusMessage(bool isRecording, const std::string &host);

} // namespace peermesh
