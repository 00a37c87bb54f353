/*
 * PeerMesh
 * Per-peer channel bookkeeping
 */

#include "peermesh-connection-registry.h"

#include <utility>

#include "peermesh-utils.h"

namespace peermesh
{

ConnectionRegistry::~ConnectionRegistry()
{
	closeAll();
}

void ConnectionRegistry::closeChannel(std::shared_ptr<ControlChannel> channel)
{
	if (!channel) {
		return;
	}
	// Callbacks are dropped first so the close does not re-enter the orchestrator
	channel->clearCallbacks();
	channel->close();
}

void ConnectionRegistry::closeChannel(std::shared_ptr<MediaChannel> channel)
{
	if (!channel) {
		return;
	}
	channel->clearCallbacks();
	channel->close();
}

Connection *ConnectionRegistry::find(const std::string &peerId)
{
	auto it = connections_.find(peerId);
	return it == connections_.end() ? nullptr : &it->second;
}

const Connection *ConnectionRegistry::find(const std::string &peerId) const
{
	auto it = connections_.find(peerId);
	return it == connections_.end() ? nullptr : &it->second;
}

Connection &ConnectionRegistry::ensure(const std::string &peerId)
{
	auto it = connections_.find(peerId);
	if (it == connections_.end()) {
		Connection connection;
		connection.peerId = peerId;
		it = connections_.emplace(peerId, std::move(connection)).first;
	}
	return it->second;
}

bool ConnectionRegistry::contains(const std::string &peerId) const
{
	return connections_.find(peerId) != connections_.end();
}

bool ConnectionRegistry::hasMedia(const std::string &peerId) const
{
	const Connection *connection = find(peerId);
	return connection && connection->media;
}

bool ConnectionRegistry::hasScreenMedia(const std::string &peerId) const
{
	const Connection *connection = find(peerId);
	return connection && connection->screenMedia;
}

bool ConnectionRegistry::hasControl(const std::string &peerId) const
{
	const Connection *connection = find(peerId);
	return connection && connection->control;
}

bool ConnectionRegistry::hasOpenControl(const std::string &peerId) const
{
	const Connection *connection = find(peerId);
	return connection && connection->control && connection->control->isOpen();
}

uint64_t ConnectionRegistry::setControl(const std::string &peerId, std::shared_ptr<ControlChannel> channel)
{
	Connection &connection = ensure(peerId);
	if (connection.control == channel) {
		return connection.controlGeneration;
	}
	std::shared_ptr<ControlChannel> previous = std::move(connection.control);
	connection.control = std::move(channel);
	connection.controlGeneration = connection.control ? nextGeneration_++ : 0;
	if (previous) {
		logDebug("Replacing control channel for %s", peerId.c_str());
		closeChannel(std::move(previous));
	}
	return connection.controlGeneration;
}

uint64_t ConnectionRegistry::setMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel)
{
	Connection &connection = ensure(peerId);
	if (connection.media == channel) {
		return connection.mediaGeneration;
	}
	std::shared_ptr<MediaChannel> previous = std::move(connection.media);
	connection.media = std::move(channel);
	connection.mediaGeneration = connection.media ? nextGeneration_++ : 0;
	if (previous) {
		logDebug("Replacing media channel for %s", peerId.c_str());
		closeChannel(std::move(previous));
	}
	return connection.mediaGeneration;
}

uint64_t ConnectionRegistry::setScreenMedia(const std::string &peerId, std::shared_ptr<MediaChannel> channel)
{
	Connection &connection = ensure(peerId);
	if (connection.screenMedia == channel) {
		return connection.screenGeneration;
	}
	std::shared_ptr<MediaChannel> previous = std::move(connection.screenMedia);
	connection.screenMedia = std::move(channel);
	connection.screenGeneration = connection.screenMedia ? nextGeneration_++ : 0;
	if (previous) {
		logDebug("Replacing screen channel for %s", peerId.c_str());
		closeChannel(std::move(previous));
	}
	return connection.screenGeneration;
}

bool ConnectionRegistry::isCurrentControl(const std::string &peerId, uint64_t generation) const
{
	const Connection *connection = find(peerId);
	return connection && connection->control && generation != 0 && connection->controlGeneration == generation;
}

bool ConnectionRegistry::isCurrentMedia(const std::string &peerId, uint64_t generation) const
{
	const Connection *connection = find(peerId);
	return connection && connection->media && generation != 0 && connection->mediaGeneration == generation;
}

bool ConnectionRegistry::isCurrentScreenMedia(const std::string &peerId, uint64_t generation) const
{
	const Connection *connection = find(peerId);
	return connection && connection->screenMedia && generation != 0 && connection->screenGeneration == generation;
}

bool ConnectionRegistry::clearControl(const std::string &peerId, uint64_t expected)
{
	Connection *connection = find(peerId);
	if (!connection || !connection->control) {
		return false;
	}
	if (expected != 0 && connection->controlGeneration != expected) {
		return false;
	}
	std::shared_ptr<ControlChannel> previous = std::move(connection->control);
	connection->control.reset();
	connection->controlGeneration = 0;
	closeChannel(std::move(previous));
	return true;
}

bool ConnectionRegistry::clearMedia(const std::string &peerId, uint64_t expected)
{
	Connection *connection = find(peerId);
	if (!connection || !connection->media) {
		return false;
	}
	if (expected != 0 && connection->mediaGeneration != expected) {
		return false;
	}
	std::shared_ptr<MediaChannel> previous = std::move(connection->media);
	connection->media.reset();
	connection->mediaGeneration = 0;
	closeChannel(std::move(previous));
	return true;
}

bool ConnectionRegistry::clearScreenMedia(const std::string &peerId, uint64_t expected)
{
	Connection *connection = find(peerId);
	if (!connection || !connection->screenMedia) {
		return false;
	}
	if (expected != 0 && connection->screenGeneration != expected) {
		return false;
	}
	std::shared_ptr<MediaChannel> previous = std::move(connection->screenMedia);
	connection->screenMedia.reset();
	connection->screenGeneration = 0;
	closeChannel(std::move(previous));
	return true;
}

void ConnectionRegistry::touch(const std::string &peerId, int64_t now)
{
	Connection *connection = find(peerId);
	if (connection) {
		connection->lastSeenAt = now;
	}
}

bool ConnectionRegistry::remove(const std::string &peerId)
{
	auto it = connections_.find(peerId);
	if (it == connections_.end()) {
		return false;
	}

	Connection connection = std::move(it->second);
	connections_.erase(it);

	closeChannel(std::move(connection.screenMedia));
	closeChannel(std::move(connection.media));
	closeChannel(std::move(connection.control));
	logDebug("Removed connection entry for %s", peerId.c_str());
	return true;
}

void ConnectionRegistry::closeAll()
{
	std::map<std::string, Connection> connections;
	connections.swap(connections_);
	for (auto &pair : connections) {
		closeChannel(std::move(pair.second.screenMedia));
		closeChannel(std::move(pair.second.media));
		closeChannel(std::move(pair.second.control));
	}
}

std::vector<std::string> ConnectionRegistry::peerIds() const
{
	std::vector<std::string> ids;
	ids.reserve(connections_.size());
	for (const auto &pair : connections_) {
		ids.push_back(pair.first);
	}
	return ids;
}

std::vector<std::string> ConnectionRegistry::peersWithMedia() const
{
	std::vector<std::string> ids;
	for (const auto &pair : connections_) {
		if (pair.second.media) {
			ids.push_back(pair.first);
		}
	}
	return ids;
}

std::vector<std::string> ConnectionRegistry::peersWithScreenMedia() const
{
	std::vector<std::string> ids;
	for (const auto &pair : connections_) {
		if (pair.second.screenMedia) {
			ids.push_back(pair.first);
		}
	}
	return ids;
}

std::vector<std::pair<std::string, std::shared_ptr<ControlChannel>>> ConnectionRegistry::openControls() const
{
	std::vector<std::pair<std::string, std::shared_ptr<ControlChannel>>> result;
	for (const auto &pair : connections_) {
		if (pair.second.control && pair.second.control->isOpen()) {
			result.emplace_back(pair.first, pair.second.control);
		}
	}
	return result;
}

} // namespace peermesh
