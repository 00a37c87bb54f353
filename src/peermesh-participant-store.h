/*
 * PeerMesh
 * Participant state store
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "peermesh-common.h"
#include "peermesh-media.h"

namespace peermesh
{

struct Participant {
	std::string id;
	std::string username;
	std::shared_ptr<MediaStream> stream;
	bool isCreator = false;
	StreamType streamType = StreamType::Camera;
	bool isScreenSharing = false;
	TransitionState transitionState = TransitionState::Connecting;
};

// Remote peers in arrival order. streamType and isScreenSharing are always updated together.
class ParticipantStore
{
public:
	const Participant *find(const std::string &id) const;
	bool contains(const std::string &id) const { return find(id) != nullptr; }

	// Insert without a stream if missing. Returns true when inserted.
	bool ensure(const std::string &id, const std::string &username = "");

	// Insert with stream, or replace the stream of an existing entry (dropping the old reference).
	// Returns true when a new participant was inserted.
	bool upsertStream(const std::string &id, std::shared_ptr<MediaStream> stream, const std::string &username = "");

	bool setUsername(const std::string &id, const std::string &username);
	bool setScreenSharing(const std::string &id, bool isSharing);
	bool setStreamType(const std::string &id, StreamType type);
	bool setTransition(const std::string &id, TransitionState state);
	bool clearStream(const std::string &id);

	bool remove(const std::string &id);
	void clear();

	bool anyoneSharing(const std::string &exceptId = "") const;
	std::vector<std::string> ids() const;
	std::vector<Participant> snapshot() const { return participants_; }
	size_t size() const { return participants_.size(); }
	bool empty() const { return participants_.empty(); }

private:
	Participant *findMutable(const std::string &id);

	std::vector<Participant> participants_;
};

} // namespace peermesh
