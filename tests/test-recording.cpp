/*
 * Unit tests for the recording compositor and recorder
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "fake-transport.h"
#include "peermesh-recording.h"

using namespace peermesh;
using namespace peermesh::fakes;

namespace
{

constexpr uint32_t kRed = 0xFF0000FF;

class SolidFrameProvider : public FrameProvider
{
public:
	bool latestFrame(const MediaStream &, FrameBuffer &frame) override
	{
		frameRequests++;
		if (!available) {
			return false;
		}
		frame.resize(4, 4);
		frame.clear(color);
		return true;
	}

	bool audioBlock(const MediaStream &, size_t frames, std::vector<float> &samples) override
	{
		samples.assign(frames, level);
		return true;
	}

	bool available = true;
	uint32_t color = kRed;
	float level = 0.0f;
	int frameRequests = 0;
};

// Produces a fixed number of bytes per encoded frame
class CountingEncoder : public ChunkEncoder
{
public:
	bool begin(uint32_t w, uint32_t h, int f, int) override
	{
		width = w;
		height = h;
		fps = f;
		return beginResult;
	}

	bool encode(const FrameBuffer &frame, const std::vector<float> &, int64_t) override
	{
		frames++;
		lastFrameWidth = frame.width();
		pending.insert(pending.end(), bytesPerFrame, 0xAB);
		produced += bytesPerFrame;
		return encodeResult;
	}

	std::vector<uint8_t> takeChunk() override
	{
		std::vector<uint8_t> chunk;
		chunk.swap(pending);
		return chunk;
	}

	std::vector<uint8_t> finish() override
	{
		finished = true;
		std::vector<uint8_t> tail(pending);
		pending.clear();
		tail.insert(tail.end(), tailBytes, 0xCD);
		produced += tailBytes;
		return tail;
	}

	bool beginResult = true;
	bool encodeResult = true;
	size_t bytesPerFrame = 100;
	size_t tailBytes = 16;

	uint32_t width = 0;
	uint32_t height = 0;
	int fps = 0;
	int frames = 0;
	uint32_t lastFrameWidth = 0;
	size_t produced = 0;
	bool finished = false;

private:
	std::vector<uint8_t> pending;
};

size_t fileSize(const std::string &path)
{
	std::ifstream in(path, std::ios::binary | std::ios::ate);
	if (!in) {
		return 0;
	}
	return static_cast<size_t>(in.tellg());
}

} // namespace

// Compositor Tests

TEST(RecordingCompositorTest, GridPlacesStreamsAndPlaceholders)
{
	SolidFrameProvider frames;
	RecordingCompositor compositor(200, 200, frames);

	RecordingCell local;
	local.label = "You (Host)";
	local.stream = makeMediaStream("local", true, true);
	RecordingCell guest;
	guest.label = "Guest";

	const FrameBuffer &canvas = compositor.compose({local, guest}, 0);
	EXPECT_EQ(canvas.width(), 200u);
	EXPECT_EQ(canvas.height(), 200u);

	// Two cells use a 2x2 grid; the bottom row stays empty
	EXPECT_EQ(canvas.pixel(50, 40), kRed);
	EXPECT_EQ(canvas.pixel(150, 40), 0x26262EFFu);
	EXPECT_EQ(canvas.pixel(50, 150), 0x101014FFu);
}

TEST(RecordingCompositorTest, MissingFrameFallsBackToPlaceholder)
{
	SolidFrameProvider frames;
	frames.available = false;
	RecordingCompositor compositor(100, 100, frames);

	RecordingCell cell;
	cell.stream = makeMediaStream("local", false, true);
	const FrameBuffer &canvas = compositor.compose({cell}, 0);
	EXPECT_EQ(frames.frameRequests, 1);
	EXPECT_EQ(canvas.pixel(50, 50), 0x26262EFFu);
}

TEST(RecordingCompositorTest, MixSkipsStreamsWithoutAudio)
{
	SolidFrameProvider frames;
	frames.level = 0.25f;
	RecordingCompositor compositor(100, 100, frames);

	RecordingCell withAudio;
	withAudio.stream = makeMediaStream("a", true, true);
	RecordingCell videoOnly;
	videoOnly.stream = makeMediaStream("b", false, true);
	RecordingCell empty;

	std::vector<float> mixed = compositor.mixAudio({withAudio, videoOnly, empty}, 8);
	ASSERT_EQ(mixed.size(), 8u);
	EXPECT_FLOAT_EQ(mixed[0], 0.25f);
	EXPECT_FLOAT_EQ(mixed[7], 0.25f);
}

TEST(RecordingCompositorTest, MixAudioBlocksClamps)
{
	std::vector<float> mixed = mixAudioBlocks({{0.5f, 0.8f, -0.9f}, {0.7f, -0.1f, -0.9f}}, 4);
	ASSERT_EQ(mixed.size(), 4u);
	EXPECT_FLOAT_EQ(mixed[0], 1.0f);
	EXPECT_NEAR(mixed[1], 0.7f, 1e-6);
	EXPECT_FLOAT_EQ(mixed[2], -1.0f);
	EXPECT_FLOAT_EQ(mixed[3], 0.0f);
}

TEST(RecordingCompositorTest, FillRectBlendsAlpha)
{
	FrameBuffer buffer(2, 2);
	buffer.clear(0x000000FF);
	buffer.fillRect(0, 0, 1, 1, 0xFF000080);
	buffer.fillRect(-5, 1, 100, 100, 0x00FF00FF);

	const uint32_t blended = buffer.pixel(0, 0);
	EXPECT_EQ(blended >> 24, 0x80u);
	EXPECT_EQ(blended & 0xFF, 0xFFu);
	EXPECT_EQ(buffer.pixel(1, 0), 0x000000FFu);
	EXPECT_EQ(buffer.pixel(0, 1), 0x00FF00FFu);
	EXPECT_EQ(buffer.pixel(1, 1), 0x00FF00FFu);
	EXPECT_EQ(buffer.pixel(5, 5), 0u);
}

// Cell Tests

TEST(RecordingCellsTest, LocalFirstThenParticipants)
{
	SessionSnapshot snapshot;
	snapshot.isCreator = true;
	snapshot.localStream = makeMediaStream("local", true, true);

	Participant ana;
	ana.id = "room-100";
	ana.username = "Ana";
	Participant anonymous;
	anonymous.id = "room-200";
	anonymous.isScreenSharing = true;
	snapshot.participants = {ana, anonymous};

	auto cells = recordingCellsFor(snapshot);
	ASSERT_EQ(cells.size(), 3u);
	EXPECT_EQ(cells[0].label, "You (Host)");
	EXPECT_EQ(cells[0].stream, snapshot.localStream);
	EXPECT_EQ(cells[1].label, "Ana");
	EXPECT_EQ(cells[2].label, "Guest");
	EXPECT_TRUE(cells[2].screenBadge);
}

TEST(RecordingCellsTest, LocalScreenReplacesCamera)
{
	SessionSnapshot snapshot;
	snapshot.localStream = makeMediaStream("local", true, true);
	snapshot.screenStream = makeMediaStream("screen", false, true);
	snapshot.isScreenSharing = true;

	auto cells = recordingCellsFor(snapshot);
	ASSERT_EQ(cells.size(), 1u);
	EXPECT_EQ(cells[0].label, "You");
	EXPECT_EQ(cells[0].stream, snapshot.screenStream);
	EXPECT_TRUE(cells[0].screenBadge);
}

TEST(RecordingCellsTest, FileNameIsTimestamped)
{
	EXPECT_EQ(recordingFileName(0, "webm"), "recording-1970-01-01T00-00-00Z.webm");
}

// Recorder Tests

class RecorderTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		options.width = 160;
		options.height = 90;
		options.fps = 10;
		options.chunkIntervalMs = 500;
		options.directory = ::testing::TempDir();
	}

	void startSession(bool creator)
	{
		settings.roomId = "room";
		settings.username = creator ? "Host" : "Bo";
		settings.isCreator = creator;
		session = std::make_unique<PeerSession>(settings, transport, media, loop);
		session->setOnError([this](const SessionError &error) { errors.push_back(error); });
		ASSERT_TRUE(session->start());
		transport.completeRegistration();
	}

	std::shared_ptr<FakeControlChannel> acceptPeer(const std::string &peerId, const std::string &username)
	{
		auto control = transport.incomingControl(peerId);
		control->open();
		transport.incomingMedia(peerId, StreamType::Camera, username)->connect();
		return control;
	}

	std::unique_ptr<Recorder> makeRecorder()
	{
		return std::make_unique<Recorder>(*session, loop, frames, encoder, nullptr, options);
	}

	EventLoop loop{EventLoop::ClockMode::Manual};
	FakeTransport transport;
	FakeMediaSource media;
	SessionSettings settings;
	std::unique_ptr<PeerSession> session;
	std::vector<SessionError> errors;

	SolidFrameProvider frames;
	CountingEncoder encoder;
	RecordingOptions options;
};

TEST_F(RecorderTest, OnlyCreatorCanRecord)
{
	startSession(false);
	auto recorder = makeRecorder();
	EXPECT_FALSE(recorder->start());
	EXPECT_FALSE(recorder->isRecording());
	ASSERT_EQ(errors.size(), 1u);
	EXPECT_EQ(errors[0].kind, SessionErrorKind::RecordingFailed);
	EXPECT_FALSE(errors[0].fatal);
}

TEST_F(RecorderTest, NeedsAParticipant)
{
	startSession(true);
	auto recorder = makeRecorder();
	EXPECT_FALSE(recorder->start());
	ASSERT_EQ(errors.size(), 1u);
	EXPECT_EQ(errors[0].kind, SessionErrorKind::RecordingFailed);
}

TEST_F(RecorderTest, EncoderStartFailure)
{
	startSession(true);
	acceptPeer("room-100", "Ana");
	encoder.beginResult = false;
	auto recorder = makeRecorder();
	EXPECT_FALSE(recorder->start());
	EXPECT_FALSE(recorder->isRecording());
	ASSERT_EQ(errors.size(), 1u);
	EXPECT_EQ(errors[0].kind, SessionErrorKind::RecordingFailed);
}

TEST_F(RecorderTest, RecordsAndWritesFile)
{
	startSession(true);
	auto ana = acceptPeer("room-100", "Ana");
	auto recorder = makeRecorder();

	std::string finishedPath;
	size_t finishedBytes = 0;
	recorder->setOnFinished([&](const std::string &path, size_t bytes) {
		finishedPath = path;
		finishedBytes = bytes;
	});

	ASSERT_TRUE(recorder->start());
	EXPECT_TRUE(recorder->isRecording());
	EXPECT_FALSE(recorder->start());
	EXPECT_EQ(encoder.width, 160u);
	EXPECT_EQ(encoder.height, 90u);
	EXPECT_EQ(encoder.fps, 10);

	loop.advance(2000);
	EXPECT_EQ(recorder->elapsedMs(), 2000);

	const std::string path = recorder->stop();
	ASSERT_FALSE(path.empty());
	EXPECT_FALSE(recorder->isRecording());
	EXPECT_EQ(recorder->elapsedMs(), 0);
	EXPECT_EQ(recorder->lastOutput(), path);
	EXPECT_EQ(path, finishedPath);
	EXPECT_TRUE(encoder.finished);

	// One immediate frame plus one per 100 ms tick
	EXPECT_GE(encoder.frames, 20);
	EXPECT_EQ(encoder.lastFrameWidth, 160u);
	EXPECT_EQ(finishedBytes, encoder.produced);
	EXPECT_EQ(fileSize(path), encoder.produced);
	EXPECT_NE(path.find("recording-"), std::string::npos);
	EXPECT_NE(path.find(".webm"), std::string::npos);

	auto status = ana->sentOfType(MessageType::RecordingStatus);
	ASSERT_EQ(status.size(), 2u);
	EXPECT_TRUE(status[0].isRecording);
	EXPECT_FALSE(status[1].isRecording);
	EXPECT_TRUE(errors.empty());
}

TEST_F(RecorderTest, StopWithoutStartIsNoop)
{
	startSession(true);
	auto recorder = makeRecorder();
	EXPECT_EQ(recorder->stop(), "");
	EXPECT_TRUE(errors.empty());
}

TEST_F(RecorderTest, TinyRecordingIsRejected)
{
	startSession(true);
	acceptPeer("room-100", "Ana");
	encoder.bytesPerFrame = 1;
	encoder.tailBytes = 0;
	auto recorder = makeRecorder();

	ASSERT_TRUE(recorder->start());
	loop.advance(300);
	EXPECT_EQ(recorder->stop(), "");
	EXPECT_TRUE(recorder->lastOutput().empty());
	ASSERT_EQ(errors.size(), 1u);
	EXPECT_EQ(errors[0].kind, SessionErrorKind::RecordingFailed);
}

TEST_F(RecorderTest, EncodeFailureDiscardsRecording)
{
	startSession(true);
	acceptPeer("room-100", "Ana");
	encoder.encodeResult = false;
	auto recorder = makeRecorder();

	ASSERT_TRUE(recorder->start());
	loop.advance(1000);
	EXPECT_EQ(recorder->stop(), "");
	ASSERT_EQ(errors.size(), 1u);
	EXPECT_EQ(errors[0].kind, SessionErrorKind::RecordingFailed);
}

TEST_F(RecorderTest, DestructorStopsRecording)
{
	startSession(true);
	acceptPeer("room-100", "Ana");
	auto recorder = makeRecorder();
	ASSERT_TRUE(recorder->start());
	loop.advance(500);
	recorder.reset();
	EXPECT_TRUE(encoder.finished);
}
