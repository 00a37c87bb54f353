/*
 * PeerMesh
 * Topology policy
 */

#pragma once

#include <string>
#include <vector>

#include "peermesh-common.h"
#include "peermesh-connection-registry.h"

namespace peermesh
{

struct TopologyPlan {
	std::vector<std::string> toConnect;
	std::vector<std::string> toTearDown;

	bool empty() const { return toConnect.empty() && toTearDown.empty(); }
};

// Decides which direct connections should exist under the active mode. Pure policy:
// the session applies the resulting plan.
class TopologyController
{
public:
	TopologyController(std::string selfId, bool selfIsCreator, Topology mode = Topology::Mesh);

	Topology mode() const { return mode_; }
	const std::string &selfId() const { return selfId_; }
	bool selfIsCreator() const { return selfIsCreator_; }

	// Returns true if the mode changed
	bool setMode(Topology mode);

	bool allowsConnection(const std::string &peerId) const;

	// Connect to allowed ids without media; tear down entries the mode forbids
	TopologyPlan reconcile(const std::vector<std::string> &peerIds, const ConnectionRegistry &registry) const;

	// Entries that must go under the current mode
	std::vector<std::string> disallowedPeers(const ConnectionRegistry &registry) const;

	// Star to mesh on a non-creator needs a fresh peer list from the creator
	bool needsPeerListAfterSwitch(Topology previous) const;

private:
	std::string selfId_;
	bool selfIsCreator_ = false;
	Topology mode_ = Topology::Mesh;
};

} // namespace peermesh
