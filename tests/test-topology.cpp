/*
 * Unit tests for topology policy
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "fake-transport.h"
#include "peermesh-topology.h"

using namespace peermesh;
using namespace peermesh::fakes;

namespace
{

void addMedia(ConnectionRegistry &registry, const std::string &peerId)
{
	registry.setMedia(peerId, std::make_shared<FakeMediaChannel>(peerId, StreamType::Camera, "", nullptr, true));
}

} // namespace

// Mesh Tests

TEST(TopologyTest, MeshAllowsEveryoneButSelf)
{
	TopologyController topology("room-1", false);
	EXPECT_TRUE(topology.allowsConnection("room-creator"));
	EXPECT_TRUE(topology.allowsConnection("room-2"));
	EXPECT_FALSE(topology.allowsConnection("room-1"));
	EXPECT_FALSE(topology.allowsConnection(""));
}

TEST(TopologyTest, MeshReconcileSkipsConnectedPeers)
{
	TopologyController topology("room-1", false);
	ConnectionRegistry registry;
	addMedia(registry, "room-creator");

	TopologyPlan plan = topology.reconcile({"room-creator", "room-1", "room-2", "room-3", "room-2"}, registry);
	EXPECT_EQ(plan.toConnect, (std::vector<std::string>{"room-2", "room-3"}));
	EXPECT_TRUE(plan.toTearDown.empty());
}

TEST(TopologyTest, MeshReconcileIsIdempotent)
{
	TopologyController topology("room-1", false);
	ConnectionRegistry registry;
	addMedia(registry, "room-creator");
	addMedia(registry, "room-2");

	EXPECT_TRUE(topology.reconcile({"room-creator", "room-2"}, registry).empty());
}

// Star Tests

TEST(TopologyTest, StarMemberOnlyReachesCreator)
{
	TopologyController topology("room-1", false, Topology::Star);
	EXPECT_TRUE(topology.allowsConnection("room-creator"));
	EXPECT_FALSE(topology.allowsConnection("room-2"));

	ConnectionRegistry registry;
	addMedia(registry, "room-2");
	TopologyPlan plan = topology.reconcile({"room-creator", "room-2", "room-3"}, registry);
	EXPECT_EQ(plan.toConnect, (std::vector<std::string>{"room-creator"}));
	EXPECT_EQ(plan.toTearDown, (std::vector<std::string>{"room-2"}));
}

TEST(TopologyTest, StarCreatorReachesEveryone)
{
	TopologyController topology("room-creator", true, Topology::Star);
	EXPECT_TRUE(topology.allowsConnection("room-1"));
	EXPECT_TRUE(topology.allowsConnection("room-2"));

	ConnectionRegistry registry;
	addMedia(registry, "room-1");
	EXPECT_TRUE(topology.disallowedPeers(registry).empty());
}

// Switch Tests

TEST(TopologyTest, SetModeReportsChange)
{
	TopologyController topology("room-1", false);
	EXPECT_FALSE(topology.setMode(Topology::Mesh));
	EXPECT_TRUE(topology.setMode(Topology::Star));
	EXPECT_EQ(topology.mode(), Topology::Star);
}

TEST(TopologyTest, StarToMeshNeedsPeerListOnMember)
{
	TopologyController member("room-1", false, Topology::Star);
	member.setMode(Topology::Mesh);
	EXPECT_TRUE(member.needsPeerListAfterSwitch(Topology::Star));
	EXPECT_FALSE(member.needsPeerListAfterSwitch(Topology::Mesh));

	TopologyController creator("room-creator", true, Topology::Star);
	creator.setMode(Topology::Mesh);
	EXPECT_FALSE(creator.needsPeerListAfterSwitch(Topology::Star));
}
