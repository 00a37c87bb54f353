/*
 * PeerMesh
 * Participant state store
 */

#include "peermesh-participant-store.h"

#include <algorithm>
#include <utility>

#include "peermesh-utils.h"

namespace peermesh
{

namespace
{

Participant makeParticipant(const std::string &id, const std::string &username)
{
	Participant participant;
	participant.id = id;
	participant.username = username.empty() ? "Guest" : username;
	participant.isCreator = isCreatorId(id);
	participant.transitionState = TransitionState::Connecting;
	return participant;
}

} // namespace

Participant *ParticipantStore::findMutable(const std::string &id)
{
	auto it = std::find_if(participants_.begin(), participants_.end(),
	                       [&id](const Participant &participant) { return participant.id == id; });
	return it == participants_.end() ? nullptr : &*it;
}

const Participant *ParticipantStore::find(const std::string &id) const
{
	auto it = std::find_if(participants_.begin(), participants_.end(),
	                       [&id](const Participant &participant) { return participant.id == id; });
	return it == participants_.end() ? nullptr : &*it;
}

bool ParticipantStore::ensure(const std::string &id, const std::string &username)
{
	if (id.empty() || findMutable(id)) {
		return false;
	}
	participants_.push_back(makeParticipant(id, username));
	return true;
}

bool ParticipantStore::upsertStream(const std::string &id, std::shared_ptr<MediaStream> stream,
                                    const std::string &username)
{
	if (id.empty()) {
		return false;
	}

	Participant *existing = findMutable(id);
	if (existing) {
		existing->stream = std::move(stream);
		// Names learned from messages win over call metadata
		if (!username.empty() && (existing->username.empty() || existing->username == "Guest")) {
			existing->username = username;
		}
		return false;
	}

	Participant participant = makeParticipant(id, username);
	participant.stream = std::move(stream);
	participants_.push_back(std::move(participant));
	return true;
}

bool ParticipantStore::setUsername(const std::string &id, const std::string &username)
{
	Participant *participant = findMutable(id);
	if (!participant) {
		return false;
	}
	participant->username = username;
	return true;
}

bool ParticipantStore::setScreenSharing(const std::string &id, bool isSharing)
{
	Participant *participant = findMutable(id);
	if (!participant) {
		return false;
	}
	participant->isScreenSharing = isSharing;
	participant->streamType = isSharing ? StreamType::Screen : StreamType::Camera;
	return true;
}

bool ParticipantStore::setStreamType(const std::string &id, StreamType type)
{
	Participant *participant = findMutable(id);
	if (!participant) {
		return false;
	}
	participant->streamType = type;
	participant->isScreenSharing = type == StreamType::Screen;
	return true;
}

bool ParticipantStore::setTransition(const std::string &id, TransitionState state)
{
	Participant *participant = findMutable(id);
	if (!participant) {
		return false;
	}
	participant->transitionState = state;
	return true;
}

bool ParticipantStore::clearStream(const std::string &id)
{
	Participant *participant = findMutable(id);
	if (!participant || !participant->stream) {
		return false;
	}
	participant->stream.reset();
	return true;
}

bool ParticipantStore::remove(const std::string &id)
{
	auto it = std::find_if(participants_.begin(), participants_.end(),
	                       [&id](const Participant &participant) { return participant.id == id; });
	if (it == participants_.end()) {
		return false;
	}
	participants_.erase(it);
	return true;
}

void ParticipantStore::clear()
{
	participants_.clear();
}

bool ParticipantStore::anyoneSharing(const std::string &exceptId) const
{
	return std::any_of(participants_.begin(), participants_.end(), [&exceptId](const Participant &participant) {
		return participant.isScreenSharing && participant.id != exceptId;
	});
}

std::vector<std::string> ParticipantStore::ids() const
{
	std::vector<std::string> result;
	result.reserve(participants_.size());
	for (const auto &participant : participants_) {
		result.push_back(participant.id);
	}
	return result;
}

} // namespace peermesh
