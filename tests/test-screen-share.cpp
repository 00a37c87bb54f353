/*
 * Unit tests for the screen-share overlay
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "fake-transport.h"
#include "peermesh-screen-share.h"

using namespace peermesh;
using namespace peermesh::fakes;

class ScreenShareTest : public ::testing::Test
{
protected:
	FakeTransport transport;
	ConnectionRegistry registry;
	ScreenShareOverlay overlay{transport, registry};
};

TEST_F(ScreenShareTest, NotSharingByDefault)
{
	EXPECT_FALSE(overlay.isSharing());
	EXPECT_EQ(overlay.openFor("peer-a", "Ana"), nullptr);
	EXPECT_TRUE(transport.media.empty());
}

TEST_F(ScreenShareTest, BeginMarksTracksAsDetail)
{
	auto stream = makeMediaStream("screen", false, true);
	overlay.begin(stream);
	EXPECT_TRUE(overlay.isSharing());
	EXPECT_EQ(overlay.stream(), stream);
	EXPECT_EQ(stream->videoTracks()[0]->contentHint, "detail");
}

TEST_F(ScreenShareTest, OpenForUsesScreenKind)
{
	overlay.begin(makeMediaStream("screen", false, true));
	auto channel = overlay.openFor("peer-a", "Ana");
	ASSERT_NE(channel, nullptr);
	EXPECT_EQ(channel->kind(), StreamType::Screen);
	EXPECT_TRUE(registry.hasScreenMedia("peer-a"));
	EXPECT_FALSE(registry.hasMedia("peer-a"));

	auto fake = transport.lastMedia("peer-a", StreamType::Screen);
	ASSERT_NE(fake, nullptr);
	EXPECT_EQ(fake->localStream, overlay.stream());
	EXPECT_EQ(fake->remoteUsername(), "Ana");
}

TEST_F(ScreenShareTest, ReopenReplacesChannel)
{
	overlay.begin(makeMediaStream("screen", false, true));
	overlay.openFor("peer-a", "Ana");
	auto first = transport.lastMedia("peer-a", StreamType::Screen);
	overlay.openFor("peer-a", "Ana");
	auto second = transport.lastMedia("peer-a", StreamType::Screen);

	EXPECT_NE(first, second);
	EXPECT_TRUE(first->closed);
	EXPECT_EQ(registry.find("peer-a")->screenMedia, second);
}

TEST_F(ScreenShareTest, EndLeavesCameraChannels)
{
	auto camera = std::make_shared<FakeMediaChannel>("peer-a", StreamType::Camera, "", nullptr, true);
	registry.setMedia("peer-a", camera);

	auto stream = makeMediaStream("screen", false, true);
	overlay.begin(stream);
	overlay.openFor("peer-a", "Ana");
	overlay.openFor("peer-b", "Ana");

	std::vector<std::string> closed = overlay.end();
	EXPECT_EQ(closed, (std::vector<std::string>{"peer-a", "peer-b"}));
	EXPECT_FALSE(overlay.isSharing());
	EXPECT_FALSE(stream->isActive());
	EXPECT_FALSE(camera->closed);
	EXPECT_TRUE(registry.hasMedia("peer-a"));
	EXPECT_TRUE(registry.peersWithScreenMedia().empty());
}

TEST_F(ScreenShareTest, EndLeavesInboundScreens)
{
	// A remote sharer's screen arriving while we share too
	auto inbound = std::make_shared<FakeMediaChannel>("peer-c", StreamType::Screen, "Cy", nullptr, false);
	registry.setScreenMedia("peer-c", inbound);

	overlay.begin(makeMediaStream("screen", false, true));
	overlay.openFor("peer-a", "Ana");

	EXPECT_EQ(overlay.end(), (std::vector<std::string>{"peer-a"}));
	EXPECT_FALSE(inbound->closed);
	EXPECT_TRUE(registry.hasScreenMedia("peer-c"));
	EXPECT_FALSE(registry.hasScreenMedia("peer-a"));
}

TEST_F(ScreenShareTest, ReplacedByInboundIsNotClosed)
{
	overlay.begin(makeMediaStream("screen", false, true));
	overlay.openFor("peer-a", "Ana");
	auto inbound = std::make_shared<FakeMediaChannel>("peer-a", StreamType::Screen, "Ana", nullptr, false);
	registry.setScreenMedia("peer-a", inbound);

	EXPECT_FALSE(overlay.closeFor("peer-a"));
	EXPECT_TRUE(overlay.end().empty());
	EXPECT_FALSE(inbound->closed);
}

TEST_F(ScreenShareTest, BeginWithNewStreamStopsOld)
{
	auto first = makeMediaStream("screen-1", false, true);
	auto second = makeMediaStream("screen-2", false, true);
	overlay.begin(first);
	overlay.begin(second);
	EXPECT_FALSE(first->isActive());
	EXPECT_TRUE(second->isActive());
}

TEST_F(ScreenShareTest, CloseForSinglePeer)
{
	overlay.begin(makeMediaStream("screen", false, true));
	overlay.openFor("peer-a", "Ana");
	EXPECT_TRUE(overlay.closeFor("peer-a"));
	EXPECT_FALSE(overlay.closeFor("peer-a"));
	EXPECT_TRUE(overlay.isSharing());
}
