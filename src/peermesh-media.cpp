/*
 * PeerMesh
 * Media stream handles
 */

#include "peermesh-media.h"

#include <utility>

namespace peermesh
{

MediaStream::MediaStream(std::string id) : id_(std::move(id)) {}

void MediaStream::addTrack(std::shared_ptr<MediaTrack> track)
{
	if (track) {
		tracks_.push_back(std::move(track));
	}
}

std::vector<std::shared_ptr<MediaTrack>> MediaStream::audioTracks() const
{
	std::vector<std::shared_ptr<MediaTrack>> result;
	for (const auto &track : tracks_) {
		if (track->kind == TrackKind::Audio) {
			result.push_back(track);
		}
	}
	return result;
}

std::vector<std::shared_ptr<MediaTrack>> MediaStream::videoTracks() const
{
	std::vector<std::shared_ptr<MediaTrack>> result;
	for (const auto &track : tracks_) {
		if (track->kind == TrackKind::Video) {
			result.push_back(track);
		}
	}
	return result;
}

bool MediaStream::isActive() const
{
	for (const auto &track : tracks_) {
		if (track->live) {
			return true;
		}
	}
	return false;
}

bool MediaStream::hasLiveVideo() const
{
	for (const auto &track : tracks_) {
		if (track->kind == TrackKind::Video && track->live && track->enabled) {
			return true;
		}
	}
	return false;
}

bool MediaStream::setAudioEnabled(bool enabled)
{
	bool changed = false;
	for (const auto &track : tracks_) {
		if (track->kind == TrackKind::Audio) {
			track->enabled = enabled;
			changed = true;
		}
	}
	return changed;
}

bool MediaStream::setVideoEnabled(bool enabled)
{
	bool changed = false;
	for (const auto &track : tracks_) {
		if (track->kind == TrackKind::Video) {
			track->enabled = enabled;
			changed = true;
		}
	}
	return changed;
}

bool MediaStream::audioEnabled() const
{
	for (const auto &track : tracks_) {
		if (track->kind == TrackKind::Audio && track->enabled) {
			return true;
		}
	}
	return false;
}

bool MediaStream::videoEnabled() const
{
	for (const auto &track : tracks_) {
		if (track->kind == TrackKind::Video && track->enabled) {
			return true;
		}
	}
	return false;
}

void MediaStream::stop()
{
	for (const auto &track : tracks_) {
		track->live = false;
	}
}

std::shared_ptr<MediaStream> makeMediaStream(const std::string &id, bool withAudio, bool withVideo)
{
	auto stream = std::make_shared<MediaStream>(id);
	if (withAudio) {
		auto track = std::make_shared<MediaTrack>();
		track->id = id + "-audio";
		track->kind = TrackKind::Audio;
		stream->addTrack(track);
	}
	if (withVideo) {
		auto track = std::make_shared<MediaTrack>();
		track->id = id + "-video";
		track->kind = TrackKind::Video;
		stream->addTrack(track);
	}
	return stream;
}

} // namespace peermesh
