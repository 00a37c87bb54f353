/*
 * Unit tests for control message codec
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "peermesh-messages.h"
#include "peermesh-utils.h"

using namespace peermesh;

// Type Name Tests

TEST(MessagesTest, TypeNamesRoundTrip)
{
	EXPECT_STREQ(messageTypeName(MessageType::ScreenShareRetryNeeded), "screen-share-retry-needed");
	EXPECT_EQ(messageTypeFromName("request-full-reconnect"), MessageType::RequestFullReconnect);
	EXPECT_EQ(messageTypeFromName("chat-message"), MessageType::ChatMessage);
	EXPECT_EQ(messageTypeFromName("emoji-reaction"), MessageType::Unknown);
}

TEST(MessagesTest, InternalSetIsFixed)
{
	EXPECT_TRUE(isInternalMessage(MessageType::PeerList));
	EXPECT_TRUE(isInternalMessage(MessageType::NewPeer));
	EXPECT_TRUE(isInternalMessage(MessageType::RequestPeerList));
	EXPECT_TRUE(isInternalMessage(MessageType::PeerDisconnect));
	EXPECT_TRUE(isInternalMessage(MessageType::ScreenSharingStatus));
	EXPECT_TRUE(isInternalMessage(MessageType::RequestStreamUpdate));
	EXPECT_TRUE(isInternalMessage(MessageType::ScreenShareStarted));
	EXPECT_TRUE(isInternalMessage(MessageType::RequestScreenStream));
	EXPECT_TRUE(isInternalMessage(MessageType::CameraStreamRestored));

	EXPECT_FALSE(isInternalMessage(MessageType::Username));
	EXPECT_FALSE(isInternalMessage(MessageType::StreamMetadata));
	EXPECT_FALSE(isInternalMessage(MessageType::ScreenShareRetryNeeded));
	EXPECT_FALSE(isInternalMessage(MessageType::ChatMessage));
	EXPECT_FALSE(isInternalMessage(MessageType::Unknown));
}

// Builder Tests

TEST(MessagesTest, UsernameMessage)
{
	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(createUsernameMessage("room-1", "Ana \"A\""), message));
	EXPECT_EQ(message.type, MessageType::Username);
	EXPECT_EQ(message.peerId, "room-1");
	EXPECT_EQ(message.username, "Ana \"A\"");
	EXPECT_GT(message.timestamp, 0);
}

TEST(MessagesTest, PeerListMessage)
{
	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(createPeerListMessage({"room-creator", "room-1", "room-2"}), message));
	EXPECT_EQ(message.type, MessageType::PeerList);
	ASSERT_EQ(message.peers.size(), 3u);
	EXPECT_EQ(message.peers[0], "room-creator");
	EXPECT_EQ(message.peers[2], "room-2");
}

TEST(MessagesTest, EmptyPeerList)
{
	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(createPeerListMessage({}), message));
	EXPECT_TRUE(message.peers.empty());
}

TEST(MessagesTest, ScreenSharingStatusCarriesStreamType)
{
	const std::string raw = createScreenSharingStatusMessage("room-1", true);
	JsonParser json(raw);
	EXPECT_EQ(json.getString("streamType"), "screen");

	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(raw, message));
	EXPECT_TRUE(message.isSharing);
	EXPECT_TRUE(message.hasStreamType);
	EXPECT_EQ(message.streamType, StreamType::Screen);

	ASSERT_TRUE(parseControlMessage(createScreenSharingStatusMessage("room-1", false), message));
	EXPECT_FALSE(message.isSharing);
	EXPECT_EQ(message.streamType, StreamType::Camera);
}

TEST(MessagesTest, StreamUpdateFlags)
{
	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(createRequestStreamUpdateMessage("room-2", true, true), message));
	EXPECT_EQ(message.type, MessageType::RequestStreamUpdate);
	EXPECT_TRUE(message.urgent);
	EXPECT_TRUE(message.forceRefresh);

	ASSERT_TRUE(parseControlMessage(createRequestScreenStreamMessage("room-2", false), message));
	EXPECT_EQ(message.type, MessageType::RequestScreenStream);
	EXPECT_FALSE(message.urgent);
}

TEST(MessagesTest, ScreenShareStartedAndRetry)
{
	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(createScreenShareStartedMessage("room-3"), message));
	EXPECT_EQ(message.sharingPeerId, "room-3");
	ASSERT_TRUE(parseControlMessage(createScreenShareRetryNeededMessage("room-3"), message));
	EXPECT_EQ(message.type, MessageType::ScreenShareRetryNeeded);
	EXPECT_EQ(message.sharingPeerId, "room-3");
}

TEST(MessagesTest, ChatAndRecordingStatus)
{
	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(createChatMessage("Ana", "hi\nthere"), message));
	EXPECT_EQ(message.sender, "Ana");
	EXPECT_EQ(message.text, "hi\nthere");

	ASSERT_TRUE(parseControlMessage(createRecordingStatusMessage(true, "Ana"), message));
	EXPECT_TRUE(message.isRecording);
	EXPECT_EQ(message.host, "Ana");
}

// Parse Tests

TEST(MessagesTest, UnknownTypeIsKept)
{
	ControlMessage message;
	const std::string raw = R"({"type":"emoji-reaction","emoji":"+1"})";
	ASSERT_TRUE(parseControlMessage(raw, message));
	EXPECT_EQ(message.type, MessageType::Unknown);
	EXPECT_EQ(message.typeName, "emoji-reaction");
	EXPECT_EQ(message.raw, raw);
	EXPECT_EQ(JsonParser(message.raw).getString("emoji"), "+1");
}

TEST(MessagesTest, RejectsMalformed)
{
	ControlMessage message;
	std::string error;
	EXPECT_FALSE(parseControlMessage("not json", message, &error));
	EXPECT_EQ(error, "not a JSON object");
	EXPECT_FALSE(parseControlMessage(R"({"peerId":"x"})", message, &error));
	EXPECT_EQ(error, "missing field 'type'");
}

TEST(MessagesTest, RejectsMissingRequiredFields)
{
	ControlMessage message;
	std::string error;
	EXPECT_FALSE(parseControlMessage(R"({"type":"username","peerId":"x"})", message, &error));
	EXPECT_EQ(error, "missing field 'username'");
	EXPECT_FALSE(parseControlMessage(R"({"type":"peer-list"})", message, &error));
	EXPECT_FALSE(parseControlMessage(R"({"type":"screen-sharing-status","peerId":"x"})", message, &error));
	EXPECT_FALSE(parseControlMessage(R"({"type":"screen-share-started"})", message, &error));
}

TEST(MessagesTest, ChatRequiresSender)
{
	ControlMessage message;
	std::string error;
	EXPECT_FALSE(parseControlMessage(R"({"type":"chat-message","text":"hi"})", message, &error));
	EXPECT_EQ(error, "missing field 'sender'");
	EXPECT_FALSE(parseControlMessage(R"({"type":"chat-message","sender":"Ana"})", message, &error));
	EXPECT_EQ(error, "missing field 'text'");
}

TEST(MessagesTest, TimestampPresenceIsReported)
{
	ControlMessage message;
	ASSERT_TRUE(parseControlMessage(R"({"type":"request-peer-list"})", message));
	EXPECT_FALSE(message.hasTimestamp);
	EXPECT_EQ(message.timestamp, 0);

	ASSERT_TRUE(parseControlMessage(R"({"type":"request-peer-list","timestamp":1700000000000})", message));
	EXPECT_TRUE(message.hasTimestamp);
	EXPECT_EQ(message.timestamp, 1700000000000);

	ASSERT_TRUE(parseControlMessage(createUsernameMessage("x", "Ana"), message));
	EXPECT_TRUE(message.hasTimestamp);
	EXPECT_GT(message.timestamp, 0);
}

TEST(MessagesTest, RejectsInvalidStreamType)
{
	ControlMessage message;
	std::string error;
	EXPECT_FALSE(parseControlMessage(R"({"type":"stream-metadata","peerId":"x","streamType":"hologram"})", message,
	                                 &error));
	EXPECT_EQ(error, "invalid streamType");

	ASSERT_TRUE(parseControlMessage(createStreamMetadataMessage("x", StreamType::Screen), message));
	EXPECT_EQ(message.streamType, StreamType::Screen);
}

TEST(MessagesTest, TypesWithoutPayloadParse)
{
	ControlMessage message;
	EXPECT_TRUE(parseControlMessage(R"({"type":"request-peer-list"})", message));
	EXPECT_TRUE(parseControlMessage(R"({"type":"request-full-reconnect"})", message));
	EXPECT_TRUE(parseControlMessage(R"({"type":"camera-stream-sent"})", message));
}

TEST(MessagesTest, EncodeKeepsUnknownTypeName)
{
	ControlMessage message;
	message.typeName = "custom";
	message.peerId = "p";
	message.timestamp = 42;
	JsonParser json(encodeControlMessage(message));
	EXPECT_EQ(json.getString("type"), "custom");
	EXPECT_EQ(json.getString("peerId"), "p");
	EXPECT_EQ(json.getInt64("timestamp"), 42);
}
