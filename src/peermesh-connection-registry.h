/*
 * PeerMesh
 * Per-peer channel bookkeeping
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "peermesh-transport.h"

namespace peermesh
{

struct Connection {
	std::string peerId;
	std::shared_ptr<ControlChannel> control;
	std::shared_ptr<MediaChannel> media;
	std::shared_ptr<MediaChannel> screenMedia;
	int64_t lastSeenAt = 0;
	// Set when this side opened the channel; used to settle simultaneous opens
	bool controlOutbound = false;
	bool mediaOutbound = false;
	// Generation of the channel currently held in each slot, 0 when empty
	uint64_t controlGeneration = 0;
	uint64_t mediaGeneration = 0;
	uint64_t screenGeneration = 0;
};

// Single source of truth for "do we have a path to peer X". Replacing a channel
// closes the previous one; at most one media and one screen channel per peer.
// Every stored channel gets a registry-wide unique generation; callbacks check it
// to tell the current channel from one that has since been replaced.
class ConnectionRegistry
{
public:
	ConnectionRegistry() = default;
	~ConnectionRegistry();

	ConnectionRegistry(const ConnectionRegistry &) = delete;
	ConnectionRegistry &operator=(const ConnectionRegistry &) = delete;

	Connection *find(const std::string &peerId);
	const Connection *find(const std::string &peerId) const;
	Connection &ensure(const std::string &peerId);
	bool contains(const std::string &peerId) const;

	bool hasMedia(const std::string &peerId) const;
	bool hasScreenMedia(const std::string &peerId) const;
	bool hasControl(const std::string &peerId) const;
	bool hasOpenControl(const std::string &peerId) const;

	// Store a channel and return its generation. Storing the current channel again is a no-op.
	uint64_t setControl(const std::string &peerId, std::shared_ptr<ControlChannel> channel);
	uint64_t setMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel);
	uint64_t setScreenMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel);

	bool isCurrentControl(const std::string &peerId, uint64_t generation) const;
	bool isCurrentMedia(const std::string &peerId, uint64_t generation) const;
	bool isCurrentScreenMedia(const std::string &peerId, uint64_t generation) const;

	// Close and drop a channel. With a non-zero `expected`, only if that generation is still current.
	bool clearControl(const std::string &peerId, uint64_t expected = 0);
	bool clearMedia(const std::string &peerId, uint64_t expected = 0);
	bool clearScreenMedia(const std::string &peerId, uint64_t expected = 0);

	void touch(const std::string &peerId, int64_t now);

	// Close every channel to the peer and delete its entry
	bool remove(const std::string &peerId);
	void closeAll();

	std::vector<std::string> peerIds() const;
	std::vector<std::string> peersWithMedia() const;
	std::vector<std::string> peersWithScreenMedia() const;
	std::vector<std::pair<std::string, std::shared_ptr<ControlChannel>>> openControls() const;
	size_t size() const { return connections_.size(); }

private:
	static void closeChannel(std::shared_ptr<ControlChannel> channel);
	static void closeChannel(std::shared_ptr<MediaChannel> channel);

	std::map<std::string, Connection> connections_;
	uint64_t nextGeneration_ = 1;
};

} // namespace peermesh
