/*
 * PeerMesh
 * Recording compositor and recorder
 */

#include "peermesh-recording.h"

#include <algorithm>
#include <fstream>
#include <utility>

#include "peermesh-messages.h"
#include "peermesh-utils.h"

namespace peermesh
{

namespace
{

constexpr uint32_t kCanvasBackground = 0x101014FF;
constexpr uint32_t kPlaceholder = 0x26262EFF;
constexpr uint32_t kLabelBackground = 0x000000B4;
constexpr uint32_t kBadgeBackground = 0x1E88E5E6;
constexpr uint32_t kRecBackground = 0xD32F2FE6;
constexpr uint32_t kTextColor = 0xFFFFFFFF;

constexpr int kLabelHeight = 24;
constexpr int kMargin = 8;
constexpr int kGlyphWidth = 8;

uint8_t channel(uint32_t rgba, int shift)
{
	return static_cast<uint8_t>((rgba >> shift) & 0xFF);
}

} // namespace

FrameBuffer::FrameBuffer(uint32_t width, uint32_t height)
{
	resize(width, height);
}

void FrameBuffer::resize(uint32_t width, uint32_t height)
{
	width_ = width;
	height_ = height;
	pixels_.assign(static_cast<size_t>(width) * height * 4, 0);
}

void FrameBuffer::clear(uint32_t rgba)
{
	for (size_t i = 0; i + 3 < pixels_.size(); i += 4) {
		pixels_[i] = channel(rgba, 24);
		pixels_[i + 1] = channel(rgba, 16);
		pixels_[i + 2] = channel(rgba, 8);
		pixels_[i + 3] = channel(rgba, 0);
	}
}

void FrameBuffer::fillRect(int x, int y, int width, int height, uint32_t rgba)
{
	const int x0 = std::max(0, x);
	const int y0 = std::max(0, y);
	const int x1 = std::min(static_cast<int>(width_), x + width);
	const int y1 = std::min(static_cast<int>(height_), y + height);
	if (x0 >= x1 || y0 >= y1) {
		return;
	}

	const uint32_t alpha = channel(rgba, 0);
	const uint32_t inverse = 255 - alpha;
	const uint8_t r = channel(rgba, 24);
	const uint8_t g = channel(rgba, 16);
	const uint8_t b = channel(rgba, 8);

	for (int row = y0; row < y1; ++row) {
		uint8_t *px = &pixels_[(static_cast<size_t>(row) * width_ + x0) * 4];
		for (int col = x0; col < x1; ++col, px += 4) {
			if (alpha == 255) {
				px[0] = r;
				px[1] = g;
				px[2] = b;
			} else {
				px[0] = static_cast<uint8_t>((r * alpha + px[0] * inverse) / 255);
				px[1] = static_cast<uint8_t>((g * alpha + px[1] * inverse) / 255);
				px[2] = static_cast<uint8_t>((b * alpha + px[2] * inverse) / 255);
			}
			px[3] = 255;
		}
	}
}

void FrameBuffer::blit(const FrameBuffer &source, int x, int y, int width, int height)
{
	if (source.width_ == 0 || source.height_ == 0 || width <= 0 || height <= 0) {
		return;
	}

	const int x0 = std::max(0, x);
	const int y0 = std::max(0, y);
	const int x1 = std::min(static_cast<int>(width_), x + width);
	const int y1 = std::min(static_cast<int>(height_), y + height);

	for (int row = y0; row < y1; ++row) {
		const uint32_t srcY = static_cast<uint32_t>(static_cast<int64_t>(row - y) * source.height_ / height);
		for (int col = x0; col < x1; ++col) {
			const uint32_t srcX = static_cast<uint32_t>(static_cast<int64_t>(col - x) * source.width_ / width);
			const uint8_t *src = &source.pixels_[(static_cast<size_t>(srcY) * source.width_ + srcX) * 4];
			uint8_t *dst = &pixels_[(static_cast<size_t>(row) * width_ + col) * 4];
			std::copy(src, src + 4, dst);
		}
	}
}

uint32_t FrameBuffer::pixel(uint32_t x, uint32_t y) const
{
	if (x >= width_ || y >= height_) {
		return 0;
	}
	const uint8_t *px = &pixels_[(static_cast<size_t>(y) * width_ + x) * 4];
	return (static_cast<uint32_t>(px[0]) << 24) | (static_cast<uint32_t>(px[1]) << 16) |
	       (static_cast<uint32_t>(px[2]) << 8) | px[3];
}

std::vector<float> mixAudioBlocks(const std::vector<std::vector<float>> &blocks, size_t frames)
{
	std::vector<float> mixed(frames, 0.0f);
	for (const auto &block : blocks) {
		const size_t count = std::min(frames, block.size());
		for (size_t i = 0; i < count; ++i) {
			mixed[i] += block[i];
		}
	}
	for (auto &sample : mixed) {
		sample = std::max(-1.0f, std::min(1.0f, sample));
	}
	return mixed;
}

std::vector<RecordingCell> recordingCellsFor(const SessionSnapshot &snapshot)
{
	std::vector<RecordingCell> cells;
	cells.reserve(snapshot.participants.size() + 1);

	RecordingCell local;
	local.label = snapshot.isCreator ? "You (Host)" : "You";
	local.screenBadge = snapshot.isScreenSharing;
	local.stream = snapshot.isScreenSharing && snapshot.screenStream ? snapshot.screenStream : snapshot.localStream;
	cells.push_back(std::move(local));

	for (const auto &participant : snapshot.participants) {
		RecordingCell cell;
		cell.label = participant.username.empty() ? "Guest" : participant.username;
		cell.screenBadge = participant.isScreenSharing;
		cell.stream = participant.stream;
		cells.push_back(std::move(cell));
	}
	return cells;
}

std::string recordingFileName(int64_t epochMs, const std::string &extension)
{
	return "recording-" + formatIsoTimestamp(epochMs) + "." + extension;
}

RecordingCompositor::RecordingCompositor(uint32_t width, uint32_t height, FrameProvider &frames, TextRenderer *text)
    : canvas_(width, height), frames_(frames), text_(text)
{
}

void RecordingCompositor::drawLabel(int x, int y, int maxWidth, const std::string &text, uint32_t background)
{
	const int width = std::min(maxWidth, static_cast<int>(text.size()) * kGlyphWidth + 2 * kMargin);
	if (width <= 0) {
		return;
	}
	canvas_.fillRect(x, y, width, kLabelHeight, background);
	if (text_) {
		text_->drawText(canvas_, x + kMargin, y + 4, width - 2 * kMargin, text, kTextColor);
	}
}

const FrameBuffer &RecordingCompositor::compose(const std::vector<RecordingCell> &cells, int64_t elapsedMs)
{
	canvas_.clear(kCanvasBackground);

	const auto layout = buildGridLayout(cells.size(), canvas_.width(), canvas_.height());
	for (size_t i = 0; i < cells.size() && i < layout.size(); ++i) {
		const RecordingCell &cell = cells[i];
		const int x = static_cast<int>(layout[i].x);
		const int y = static_cast<int>(layout[i].y);
		const int w = static_cast<int>(layout[i].width);
		const int h = static_cast<int>(layout[i].height);

		if (cell.stream && frames_.latestFrame(*cell.stream, scratch_) && scratch_.width() > 0) {
			canvas_.blit(scratch_, x, y, w, h);
		} else {
			canvas_.fillRect(x, y, w, h, kPlaceholder);
		}

		drawLabel(x + kMargin, y + h - kLabelHeight - kMargin, w - 2 * kMargin, cell.label, kLabelBackground);
		if (cell.screenBadge) {
			const std::string badge = "Screen";
			const int badgeWidth = static_cast<int>(badge.size()) * kGlyphWidth + 2 * kMargin;
			drawLabel(x + w - badgeWidth - kMargin, y + kMargin, badgeWidth, badge, kBadgeBackground);
		}
	}

	drawLabel(kMargin, kMargin, static_cast<int>(canvas_.width()), "REC " + formatDuration(elapsedMs),
	          kRecBackground);
	return canvas_;
}

std::vector<float> RecordingCompositor::mixAudio(const std::vector<RecordingCell> &cells, size_t frames)
{
	std::vector<std::vector<float>> blocks;
	for (const auto &cell : cells) {
		if (!cell.stream || cell.stream->audioTracks().empty()) {
			continue;
		}
		std::vector<float> block;
		if (frames_.audioBlock(*cell.stream, frames, block)) {
			blocks.push_back(std::move(block));
		}
	}
	return mixAudioBlocks(blocks, frames);
}

Recorder::Recorder(PeerSession &session, EventLoop &loop, FrameProvider &frames, ChunkEncoder &encoder,
                   TextRenderer *text, RecordingOptions options)
    : session_(session),
      loop_(loop),
      encoder_(encoder),
      options_(std::move(options)),
      compositor_(options_.width, options_.height, frames, text),
      timers_(loop)
{
}

Recorder::~Recorder()
{
	if (recording_) {
		stop();
	}
	timers_.cancelAll();
	if (worker_.joinable()) {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			workerRunning_ = false;
		}
		cv_.notify_all();
		worker_.join();
	}
}

bool Recorder::start()
{
	if (recording_) {
		logWarning("Recording already in progress");
		return false;
	}
	if (!session_.isCreator()) {
		fail("Only the room creator can record");
		return false;
	}
	if (session_.participants().empty()) {
		fail("Recording needs at least one participant");
		return false;
	}
	if (!encoder_.begin(options_.width, options_.height, options_.fps, options_.sampleRate)) {
		fail("Encoder failed to start");
		return false;
	}

	{
		std::lock_guard<std::mutex> lock(mutex_);
		jobs_.clear();
		chunks_.clear();
	}
	encodeFailed_ = false;
	workerRunning_ = true;
	worker_ = std::thread(&Recorder::workerLoop, this);

	recording_ = true;
	startedAt_ = loop_.now();

	const int64_t frameInterval = std::max<int64_t>(1, 1000 / std::max(1, options_.fps));
	timers_.scheduleRepeating("", TimerPurpose::RecordingFrame, frameInterval, [this]() { captureFrame(); });
	timers_.scheduleRepeating("", TimerPurpose::RecordingChunk, options_.chunkIntervalMs, [this]() { flushChunk(); });
	captureFrame();

	session_.sendToAll(createRecordingStatusMessage(true, session_.selfId()));
	logInfo("Recording started (%ux%u @ %d fps)", options_.width, options_.height, options_.fps);
	return true;
}

std::string Recorder::stop()
{
	if (!recording_) {
		return "";
	}

	timers_.cancelAll();
	recording_ = false;
	const int64_t duration = loop_.now() - startedAt_;

	Job flush;
	flush.kind = Job::Kind::Flush;
	enqueue(std::move(flush));
	{
		std::lock_guard<std::mutex> lock(mutex_);
		workerRunning_ = false;
	}
	cv_.notify_all();
	if (worker_.joinable()) {
		worker_.join();
	}

	std::vector<uint8_t> tail;
	try {
		tail = encoder_.finish();
	} catch (const std::exception &e) {
		logError("Encoder failed to finish: %s", e.what());
		encodeFailed_ = true;
	}

	std::vector<uint8_t> data;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		for (const auto &chunk : chunks_) {
			data.insert(data.end(), chunk.begin(), chunk.end());
		}
		chunks_.clear();
	}
	data.insert(data.end(), tail.begin(), tail.end());

	session_.sendToAll(createRecordingStatusMessage(false, session_.selfId()));
	logInfo("Recording stopped after %s, %zu bytes", formatDuration(duration).c_str(), data.size());

	if (encodeFailed_) {
		fail("Encoder reported an error during recording");
		return "";
	}
	if (data.size() < options_.minimumBytes) {
		fail("Recording produced only " + std::to_string(data.size()) + " bytes");
		return "";
	}

	std::string path = options_.directory.empty() ? "." : options_.directory;
	if (path.back() != '/') {
		path += '/';
	}
	path += recordingFileName(currentTimeMs(), encoder_.fileExtension());

	std::ofstream out(path, std::ios::binary);
	if (!out) {
		fail("Cannot open " + path + " for writing");
		return "";
	}
	out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
	if (!out) {
		fail("Failed to write " + path);
		return "";
	}

	lastOutput_ = path;
	logInfo("Recording saved to %s", path.c_str());

	auto cb = onFinished_;
	if (cb) {
		cb(path, data.size());
	}
	return path;
}

int64_t Recorder::elapsedMs() const
{
	return recording_ ? loop_.now() - startedAt_ : 0;
}

size_t Recorder::chunkCount() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return chunks_.size();
}

void Recorder::captureFrame()
{
	if (!recording_) {
		return;
	}

	const int64_t elapsed = loop_.now() - startedAt_;
	const auto cells = recordingCellsFor(session_.snapshot());
	const int64_t frameInterval = std::max<int64_t>(1, 1000 / std::max(1, options_.fps));
	const size_t audioFrames = static_cast<size_t>(options_.sampleRate * frameInterval / 1000);

	Job job;
	job.kind = Job::Kind::Frame;
	job.frame = compositor_.compose(cells, elapsed);
	job.audio = compositor_.mixAudio(cells, audioFrames);
	job.timestampMs = elapsed;
	enqueue(std::move(job));
}

void Recorder::flushChunk()
{
	Job job;
	job.kind = Job::Kind::Flush;
	enqueue(std::move(job));
}

void Recorder::enqueue(Job job)
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		jobs_.push_back(std::move(job));
	}
	cv_.notify_one();
}

void Recorder::workerLoop()
{
	while (true) {
		Job job;
		{
			std::unique_lock<std::mutex> lock(mutex_);
			cv_.wait(lock, [this] { return !jobs_.empty() || !workerRunning_; });
			if (jobs_.empty()) {
				break;
			}
			job = std::move(jobs_.front());
			jobs_.pop_front();
		}

		try {
			if (job.kind == Job::Kind::Frame) {
				if (!encoder_.encode(job.frame, job.audio, job.timestampMs)) {
					encodeFailed_ = true;
				}
			} else {
				std::vector<uint8_t> chunk = encoder_.takeChunk();
				if (!chunk.empty()) {
					std::lock_guard<std::mutex> lock(mutex_);
					chunks_.push_back(std::move(chunk));
				}
			}
		} catch (const std::exception &e) {
			logError("Encoder error: %s", e.what());
			encodeFailed_ = true;
		}
	}
}

void Recorder::fail(const std::string &message)
{
	session_.raiseError(SessionErrorKind::RecordingFailed, message, false);
}

} // namespace peermesh
