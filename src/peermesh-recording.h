/*
 * PeerMesh
 * Recording compositor and recorder
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "peermesh-event-loop.h"
#include "peermesh-layout.h"
#include "peermesh-media.h"
#include "peermesh-session.h"

namespace peermesh
{

// Packed RGBA8 canvas
class FrameBuffer
{
public:
	FrameBuffer() = default;
	FrameBuffer(uint32_t width, uint32_t height);

	uint32_t width() const { return width_; }
	uint32_t height() const { return height_; }
	const std::vector<uint8_t> &pixels() const { return pixels_; }

	void resize(uint32_t width, uint32_t height);
	void clear(uint32_t rgba);
	void fillRect(int x, int y, int width, int height, uint32_t rgba);
	// Nearest-neighbour scale of `source` into the target rectangle
	void blit(const FrameBuffer &source, int x, int y, int width, int height);
	uint32_t pixel(uint32_t x, uint32_t y) const;

private:
	uint32_t width_ = 0;
	uint32_t height_ = 0;
	std::vector<uint8_t> pixels_;
};

// Latest decoded media per stream, supplied by the media pipeline
class FrameProvider
{
public:
	virtual ~FrameProvider() = default;

	virtual bool latestFrame(const MediaStream &stream, FrameBuffer &frame) = 0;
	// Mono float samples in [-1, 1] covering the last `frames` sample frames
	virtual bool audioBlock(const MediaStream &stream, size_t frames, std::vector<float> &samples) = 0;
};

// Glyph rendering for overlay labels
class TextRenderer
{
public:
	virtual ~TextRenderer() = default;

	virtual void drawText(FrameBuffer &canvas, int x, int y, int maxWidth, const std::string &text,
	                      uint32_t rgba) = 0;
};

class ChunkEncoder
{
public:
	virtual ~ChunkEncoder() = default;

	virtual bool begin(uint32_t width, uint32_t height, int fps, int sampleRate) = 0;
	virtual bool encode(const FrameBuffer &frame, const std::vector<float> &audio, int64_t timestampMs) = 0;
	// Bytes produced since the last call
	virtual std::vector<uint8_t> takeChunk() = 0;
	virtual std::vector<uint8_t> finish() = 0;
	virtual std::string fileExtension() const { return "webm"; }
};

struct RecordingCell {
	std::string label;
	bool screenBadge = false;
	std::shared_ptr<MediaStream> stream;
};

struct RecordingOptions {
	uint32_t width = 1280;
	uint32_t height = 720;
	int fps = 30;
	int sampleRate = 48000;
	int64_t chunkIntervalMs = 1000;
	std::string directory = ".";
	size_t minimumBytes = 1024;
};

// Sums blocks sample by sample, clamping to [-1, 1]
std::vector<float> mixAudioBlocks(const std::vector<std::vector<float>> &blocks, size_t frames);

// Local stream first, then participants in arrival order
std::vector<RecordingCell> recordingCellsFor(const SessionSnapshot &snapshot);

std::string recordingFileName(int64_t epochMs, const std::string &extension);

class RecordingCompositor
{
public:
	RecordingCompositor(uint32_t width, uint32_t height, FrameProvider &frames, TextRenderer *text = nullptr);

	const FrameBuffer &compose(const std::vector<RecordingCell> &cells, int64_t elapsedMs);
	std::vector<float> mixAudio(const std::vector<RecordingCell> &cells, size_t frames);

	const FrameBuffer &canvas() const { return canvas_; }

private:
	void drawLabel(int x, int y, int maxWidth, const std::string &text, uint32_t background);

	FrameBuffer canvas_;
	FrameBuffer scratch_;
	FrameProvider &frames_;
	TextRenderer *text_ = nullptr;
};

// Drives the compositor on the session loop and encodes off it. Creator only.
class Recorder
{
public:
	using OnFinishedCallback = std::function<void(const std::string &path, size_t bytes)>;

	Recorder(PeerSession &session, EventLoop &loop, FrameProvider &frames, ChunkEncoder &encoder,
	         TextRenderer *text = nullptr, RecordingOptions options = RecordingOptions());
	~Recorder();

	Recorder(const Recorder &) = delete;
	Recorder &operator=(const Recorder &) = delete;

	bool start();
	// Returns the written file, or an empty string if the recording failed
	std::string stop();

	bool isRecording() const { return recording_; }
	int64_t elapsedMs() const;
	size_t chunkCount() const;
	const std::string &lastOutput() const { return lastOutput_; }

	void setOnFinished(OnFinishedCallback callback) { onFinished_ = std::move(callback); }

private:
	struct Job {
		enum class Kind { Frame, Flush };
		Kind kind = Kind::Frame;
		FrameBuffer frame;
		std::vector<float> audio;
		int64_t timestampMs = 0;
	};

	void captureFrame();
	void flushChunk();
	void enqueue(Job job);
	void workerLoop();
	void fail(const std::string &message);

	PeerSession &session_;
	EventLoop &loop_;
	ChunkEncoder &encoder_;
	RecordingOptions options_;
	RecordingCompositor compositor_;
	TimerTable timers_;

	bool recording_ = false;
	int64_t startedAt_ = 0;
	std::string lastOutput_;

	std::thread worker_;
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<Job> jobs_;
	std::vector<std::vector<uint8_t>> chunks_;
	std::atomic<bool> workerRunning_{false};
	std::atomic<bool> encodeFailed_{false};

	OnFinishedCallback onFinished_;
};

} // namespace peermesh
