/*
 * Unit tests for control message routing
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "peermesh-router.h"

using namespace peermesh;

namespace
{

class RecordingHandler : public ControlMessageHandler
{
public:
	std::vector<std::string> calls;
	std::vector<std::string> application;

	void onUsername(const std::string &from, const ControlMessage &) override { record("username", from); }
	void onRequestUsername(const std::string &from, const ControlMessage &) override
	{
		record("request-username", from);
	}
	void onPeerList(const std::string &from, const ControlMessage &) override { record("peer-list", from); }
	void onRequestPeerList(const std::string &from, const ControlMessage &) override
	{
		record("request-peer-list", from);
	}
	void onNewPeer(const std::string &from, const ControlMessage &) override { record("new-peer", from); }
	void onPeerDisconnect(const std::string &from, const ControlMessage &) override
	{
		record("peer-disconnect", from);
	}
	void onScreenSharingStatus(const std::string &from, const ControlMessage &) override
	{
		record("screen-sharing-status", from);
	}
	void onScreenSharingStream(const std::string &from, const ControlMessage &) override
	{
		record("screen-sharing-stream", from);
	}
	void onScreenShareStarted(const std::string &from, const ControlMessage &) override
	{
		record("screen-share-started", from);
	}
	void onScreenShareRetryNeeded(const std::string &from, const ControlMessage &) override
	{
		record("screen-share-retry-needed", from);
	}
	void onStreamMetadata(const std::string &from, const ControlMessage &) override
	{
		record("stream-metadata", from);
	}
	void onRequestScreenStream(const std::string &from, const ControlMessage &) override
	{
		record("request-screen-stream", from);
	}
	void onRequestStreamUpdate(const std::string &from, const ControlMessage &) override
	{
		record("request-stream-update", from);
	}
	void onCameraStreamRestored(const std::string &from, const ControlMessage &) override
	{
		record("camera-stream-restored", from);
	}
	void onReconnectAfterScreenShare(const std::string &from, const ControlMessage &) override
	{
		record("reconnect-after-screen-share", from);
	}
	void onRequestFullReconnect(const std::string &from, const ControlMessage &) override
	{
		record("request-full-reconnect", from);
	}
	void onRecordingStatus(const std::string &from, const ControlMessage &) override
	{
		record("recording-status", from);
	}
	void onApplicationMessage(const std::string &, const ControlMessage &message) override
	{
		application.push_back(message.typeName);
	}

private:
	void record(const std::string &name, const std::string &from) { calls.push_back(name + "@" + from); }
};

} // namespace

class RouterTest : public ::testing::Test
{
protected:
	RecordingHandler handler;
	ControlMessageRouter router{handler};
};

// Dispatch Tests

TEST_F(RouterTest, InternalMessageStaysInternal)
{
	EXPECT_TRUE(router.route("room-1", createPeerListMessage({"room-creator"})));
	ASSERT_EQ(handler.calls.size(), 1u);
	EXPECT_EQ(handler.calls[0], "peer-list@room-1");
	EXPECT_TRUE(handler.application.empty());
}

TEST_F(RouterTest, UsernameReachesBoth)
{
	EXPECT_TRUE(router.route("room-1", createUsernameMessage("room-1", "Ana")));
	ASSERT_EQ(handler.calls.size(), 1u);
	EXPECT_EQ(handler.calls[0], "username@room-1");
	ASSERT_EQ(handler.application.size(), 1u);
	EXPECT_EQ(handler.application[0], "username");
}

TEST_F(RouterTest, ChatIsApplicationOnly)
{
	EXPECT_TRUE(router.route("room-2", createChatMessage("Bo", "hello")));
	EXPECT_TRUE(handler.calls.empty());
	ASSERT_EQ(handler.application.size(), 1u);
	EXPECT_EQ(handler.application[0], "chat-message");
}

TEST_F(RouterTest, UnknownTypeForwarded)
{
	EXPECT_TRUE(router.route("room-2", R"({"type":"hand-raised","peerId":"room-2"})"));
	EXPECT_TRUE(handler.calls.empty());
	ASSERT_EQ(handler.application.size(), 1u);
	EXPECT_EQ(handler.application[0], "hand-raised");
}

TEST_F(RouterTest, EachInternalTypeHasHandler)
{
	router.route("p", createNewPeerMessage("x"));
	router.route("p", createRequestPeerListMessage("x"));
	router.route("p", createPeerDisconnectMessage("x"));
	router.route("p", createScreenSharingStatusMessage("x", true));
	router.route("p", createRequestStreamUpdateMessage("x", false, false));
	router.route("p", createScreenShareStartedMessage("x"));
	router.route("p", createRequestScreenStreamMessage("x", true));
	router.route("p", createCameraStreamRestoredMessage("x"));

	const std::vector<std::string> expected = {
		"new-peer@p",
		"request-peer-list@p",
		"peer-disconnect@p",
		"screen-sharing-status@p",
		"request-stream-update@p",
		"screen-share-started@p",
		"request-screen-stream@p",
		"camera-stream-restored@p",
	};
	EXPECT_EQ(handler.calls, expected);
	EXPECT_TRUE(handler.application.empty());
}

TEST_F(RouterTest, RetryNeededAlsoForwarded)
{
	router.route("p", createScreenShareRetryNeededMessage("p"));
	ASSERT_EQ(handler.calls.size(), 1u);
	EXPECT_EQ(handler.calls[0], "screen-share-retry-needed@p");
	ASSERT_EQ(handler.application.size(), 1u);
}

// Malformed Tests

TEST_F(RouterTest, MalformedMessagesAreCountedAndDropped)
{
	EXPECT_FALSE(router.route("p", "garbage"));
	EXPECT_FALSE(router.route("p", R"({"type":"username"})"));
	EXPECT_EQ(router.malformedCount(), 2u);
	EXPECT_TRUE(handler.calls.empty());
	EXPECT_TRUE(handler.application.empty());

	EXPECT_TRUE(router.route("p", createChatMessage("a", "b")));
	EXPECT_EQ(router.malformedCount(), 2u);
}
