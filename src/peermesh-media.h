/*
 * PeerMesh
 * Media stream handles and local capture boundary
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

namespace peermesh
{

enum class TrackKind { Audio, Video };

struct MediaTrack {
	std::string id;
	TrackKind kind = TrackKind::Video;
	bool enabled = true;
	bool live = true;
	std::string contentHint;
};

// Reference-counted handle to a set of tracks. The transport owns the underlying media;
// holders share the handle and drop it to release their reference.
class MediaStream
{
public:
	explicit MediaStream(std::string id);

	const std::string &id() const { return id_; }

	void addTrack(std::shared_ptr<MediaTrack> track);
	std::vector<std::shared_ptr<MediaTrack>> tracks() const { return tracks_; }
	std::vector<std::shared_ptr<MediaTrack>> audioTracks() const;
	std::vector<std::shared_ptr<MediaTrack>> videoTracks() const;

	// Any live track
	bool isActive() const;
	// A live, enabled video track
	bool hasLiveVideo() const;

	bool setAudioEnabled(bool enabled);
	bool setVideoEnabled(bool enabled);
	bool audioEnabled() const;
	bool videoEnabled() const;

	void stop();

private:
	std::string id_;
	std::vector<std::shared_ptr<MediaTrack>> tracks_;
};

std::shared_ptr<MediaStream> makeMediaStream(const std::string &id, bool withAudio, bool withVideo);

// Local device capture
class MediaSource
{
public:
	virtual ~MediaSource() = default;

	// Returns nullptr if the devices are unavailable or access was denied
	virtual std::shared_ptr<MediaStream> acquireUserMedia(bool video, bool audio) = 0;
	virtual std::shared_ptr<MediaStream> acquireDisplayMedia() = 0;
};

} // namespace peermesh
