/*
 * PeerMesh
 * Screen-share overlay channels
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "peermesh-connection-registry.h"
#include "peermesh-media.h"
#include "peermesh-transport.h"

namespace peermesh
{

// Owns the local screen stream and the per-peer screen channels that sit beside the
// camera channels. Camera channels are never touched here.
class ScreenShareOverlay
{
public:
	ScreenShareOverlay(Transport &transport, ConnectionRegistry &registry);

	bool isSharing() const { return stream_ != nullptr; }
	std::shared_ptr<MediaStream> stream() const { return stream_; }

	void begin(std::shared_ptr<MediaStream> screenStream);

	// Open, or replace, the screen channel to one peer
	std::shared_ptr<MediaChannel> openFor(const std::string &peerId, const std::string &username);
	bool closeFor(const std::string &peerId);

	// Close the screen channels opened here and stop the capture. Returns the peers that had one.
	// Inbound screens from a remote sharer are left alone.
	std::vector<std::string> end();

private:
	Transport &transport_;
	ConnectionRegistry &registry_;
	std::shared_ptr<MediaStream> stream_;
	// Registry generation of each outbound screen channel
	std::map<std::string, uint64_t> outbound_;
};

} // namespace peermesh
