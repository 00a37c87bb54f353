/*
 * PeerMesh
 * Topology policy
 */

#include "peermesh-topology.h"

#include <algorithm>
#include <utility>

#include "peermesh-utils.h"

namespace peermesh
{

TopologyController::TopologyController(std::string selfId, bool selfIsCreator, Topology mode)
    : selfId_(std::move(selfId)), selfIsCreator_(selfIsCreator), mode_(mode)
{
}

bool TopologyController::setMode(Topology mode)
{
	if (mode_ == mode) {
		return false;
	}
	logInfo("Topology %s -> %s", topologyName(mode_), topologyName(mode));
	mode_ = mode;
	return true;
}

bool TopologyController::allowsConnection(const std::string &peerId) const
{
	if (peerId.empty() || peerId == selfId_) {
		return false;
	}
	if (mode_ == Topology::Star && !selfIsCreator_) {
		return isCreatorId(peerId);
	}
	return true;
}

TopologyPlan TopologyController::reconcile(const std::vector<std::string> &peerIds,
                                           const ConnectionRegistry &registry) const
{
	TopologyPlan plan;

	for (const auto &peerId : peerIds) {
		if (peerId == selfId_) {
			continue;
		}
		if (!allowsConnection(peerId)) {
			continue;
		}
		if (registry.hasMedia(peerId)) {
			continue;
		}
		if (std::find(plan.toConnect.begin(), plan.toConnect.end(), peerId) == plan.toConnect.end()) {
			plan.toConnect.push_back(peerId);
		}
	}

	plan.toTearDown = disallowedPeers(registry);
	return plan;
}

std::vector<std::string> TopologyController::disallowedPeers(const ConnectionRegistry &registry) const
{
	std::vector<std::string> result;
	for (const auto &peerId : registry.peerIds()) {
		if (!allowsConnection(peerId)) {
			result.push_back(peerId);
		}
	}
	return result;
}

bool TopologyController::needsPeerListAfterSwitch(Topology previous) const
{
	return previous == Topology::Star && mode_ == Topology::Mesh && !selfIsCreator_;
}

} // namespace peermesh
