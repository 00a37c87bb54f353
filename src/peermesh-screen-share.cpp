/*
 * PeerMesh
 * Screen-share overlay channels
 */

#include "peermesh-screen-share.h"

#include <utility>

#include "peermesh-utils.h"

namespace peermesh
{

ScreenShareOverlay::ScreenShareOverlay(Transport &transport, ConnectionRegistry &registry)
    : transport_(transport), registry_(registry)
{
}

void ScreenShareOverlay::begin(std::shared_ptr<MediaStream> screenStream)
{
	if (stream_ && stream_ != screenStream) {
		stream_->stop();
	}
	stream_ = std::move(screenStream);
	if (stream_) {
		for (const auto &track : stream_->videoTracks()) {
			track->contentHint = "detail";
		}
		logInfo("Screen share started (%s)", stream_->id().c_str());
	}
}

std::shared_ptr<MediaChannel> ScreenShareOverlay::openFor(const std::string &peerId, const std::string &username)
{
	if (!stream_) {
		logWarning("No screen stream to send to %s", peerId.c_str());
		return nullptr;
	}

	MediaChannelOptions options;
	options.kind = StreamType::Screen;
	options.username = username;

	auto channel = transport_.openMediaChannel(peerId, stream_, options);
	if (!channel) {
		logWarning("Failed to open screen channel to %s", peerId.c_str());
		return nullptr;
	}

	outbound_[peerId] = registry_.setScreenMedia(peerId, channel);
	logDebug("Screen channel opened to %s", peerId.c_str());
	return channel;
}

bool ScreenShareOverlay::closeFor(const std::string &peerId)
{
	auto it = outbound_.find(peerId);
	if (it == outbound_.end()) {
		return false;
	}
	const uint64_t generation = it->second;
	outbound_.erase(it);
	return registry_.clearScreenMedia(peerId, generation);
}

std::vector<std::string> ScreenShareOverlay::end()
{
	std::vector<std::string> peers;
	std::map<std::string, uint64_t> outbound;
	outbound.swap(outbound_);
	for (const auto &entry : outbound) {
		if (registry_.clearScreenMedia(entry.first, entry.second)) {
			peers.push_back(entry.first);
		}
	}

	if (stream_) {
		stream_->stop();
		stream_.reset();
		logInfo("Screen share stopped, closed %zu screen channel(s)", peers.size());
	}
	return peers;
}

} // namespace peermesh
