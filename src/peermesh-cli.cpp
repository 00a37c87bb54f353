/*
 * PeerMesh
 * Command-line front end
 *
 * Runs one session on the libdatachannel transport with synthetic capture. The main
 * thread drives the event loop; a reader thread turns stdin lines into posted commands.
 */

#include <getopt.h>

#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "peermesh-config.h"
#include "peermesh-event-loop.h"
#include "peermesh-messages.h"
#include "peermesh-recording.h"
#include "peermesh-rtc-transport.h"
#include "peermesh-session.h"
#include "peermesh-utils.h"

using namespace peermesh;

namespace
{

// Hands out stream handles without touching capture devices
class SyntheticMediaSource : public MediaSource
{
public:
	std::shared_ptr<MediaStream> acquireUserMedia(bool video, bool audio) override
	{
		if (!video && !audio) {
			return nullptr;
		}
		return makeMediaStream("local-" + generateSessionId(), audio, video);
	}

	std::shared_ptr<MediaStream> acquireDisplayMedia() override
	{
		return makeMediaStream("screen-" + generateSessionId(), false, true);
	}
};

// Solid tile per stream, tinted from the stream id
class SyntheticFrameProvider : public FrameProvider
{
public:
	bool latestFrame(const MediaStream &stream, FrameBuffer &frame) override
	{
		if (!stream.hasLiveVideo()) {
			return false;
		}
		uint32_t hash = 2166136261u;
		for (char c : stream.id()) {
			hash = (hash ^ static_cast<uint8_t>(c)) * 16777619u;
		}
		frame.resize(64, 36);
		frame.clear((hash & 0xFFFFFF00u) | 0xFF);
		return true;
	}

	bool audioBlock(const MediaStream &, size_t, std::vector<float> &) override { return false; }
};

// Uncompressed RGBA frames, one chunk per flush
class RawChunkEncoder : public ChunkEncoder
{
public:
	bool begin(uint32_t width, uint32_t height, int fps, int sampleRate) override
	{
		pending_.clear();
		const std::string header = "PMRAW " + std::to_string(width) + "x" + std::to_string(height) + " " +
		                           std::to_string(fps) + "fps " + std::to_string(sampleRate) + "Hz\n";
		pending_.insert(pending_.end(), header.begin(), header.end());
		return true;
	}

	bool encode(const FrameBuffer &frame, const std::vector<float> &, int64_t) override
	{
		const auto &pixels = frame.pixels();
		pending_.insert(pending_.end(), pixels.begin(), pixels.end());
		return true;
	}

	std::vector<uint8_t> takeChunk() override
	{
		std::vector<uint8_t> chunk;
		chunk.swap(pending_);
		return chunk;
	}

	std::vector<uint8_t> finish() override { return takeChunk(); }

	std::string fileExtension() const override { return "rgba"; }

private:
	std::vector<uint8_t> pending_;
};

void printUsage(const char *program)
{
	std::printf("Usage: %s --room <id> [options]\n", program);
	std::printf("  -r, --room <id>        Room to create or join\n");
	std::printf("  -c, --create           Create the room\n");
	std::printf("  -n, --name <name>      Display name\n");
	std::printf("  -f, --config <file>    JSON settings file\n");
	std::printf("  -s, --set key=value    Override one setting (repeatable)\n");
	std::printf("  -v, --verbose          Debug logging\n");
	std::printf("  -h, --help             Show this help\n");
	std::printf("\nCommands: /share /unshare /mesh /star /name <n> /reconnect /record /stop /quit\n");
	std::printf("Any other line is sent as chat.\n");
}

void printParticipants(const std::vector<Participant> &participants)
{
	std::printf("Participants (%zu):", participants.size());
	for (const auto &participant : participants) {
		std::printf(" %s[%s%s]", participant.username.empty() ? participant.id.c_str() : participant.username.c_str(),
		            transitionStateName(participant.transitionState), participant.isScreenSharing ? ",screen" : "");
	}
	std::printf("\n");
	std::fflush(stdout);
}

void runCommand(const std::string &line, PeerSession &session, Recorder &recorder, EventLoop &loop)
{
	if (line.empty()) {
		return;
	}
	if (line == "/quit") {
		if (recorder.isRecording()) {
			recorder.stop();
		}
		session.leave();
		loop.stop();
	} else if (line == "/share") {
		if (!session.startScreenShare()) {
			std::printf("Screen share not started: %s\n", session.lastError().message.c_str());
		}
	} else if (line == "/unshare") {
		session.stopScreenShare();
	} else if (line == "/mesh") {
		session.setTopology(Topology::Mesh);
	} else if (line == "/star") {
		session.setTopology(Topology::Star);
	} else if (line.rfind("/name ", 0) == 0) {
		session.setUsername(trim(line.substr(6)));
	} else if (line == "/reconnect") {
		session.reconnectAll();
	} else if (line == "/record") {
		recorder.start();
	} else if (line == "/stop") {
		const std::string path = recorder.stop();
		if (!path.empty()) {
			std::printf("Recording saved to %s\n", path.c_str());
		}
	} else if (line[0] == '/') {
		std::printf("Unknown command %s\n", line.c_str());
	} else {
		session.sendChat(line);
	}
	std::fflush(stdout);
}

} // namespace

int main(int argc, char *argv[])
{
	SessionSettings settings;
	std::vector<std::string> overrides;
	std::string configPath;
	std::string room;
	std::string name;
	bool create = false;
	bool verbose = false;

	struct option longOptions[] = {
	    {"room", required_argument, nullptr, 'r'},   {"create", no_argument, nullptr, 'c'},
	    {"name", required_argument, nullptr, 'n'},   {"config", required_argument, nullptr, 'f'},
	    {"set", required_argument, nullptr, 's'},    {"verbose", no_argument, nullptr, 'v'},
	    {"help", no_argument, nullptr, 'h'},         {nullptr, 0, nullptr, 0},
	};

	int c;
	while ((c = getopt_long(argc, argv, "r:cn:f:s:vh", longOptions, nullptr)) != -1) {
		switch (c) {
		case 'r':
			room = optarg;
			break;
		case 'c':
			create = true;
			break;
		case 'n':
			name = optarg;
			break;
		case 'f':
			configPath = optarg;
			break;
		case 's':
			overrides.emplace_back(optarg);
			break;
		case 'v':
			verbose = true;
			break;
		case 'h':
			printUsage(argv[0]);
			return 0;
		default:
			printUsage(argv[0]);
			return 1;
		}
	}

	setLogLevel(verbose ? LogLevel::Debug : LogLevel::Info);
	routeTransportLogs(verbose ? LogLevel::Debug : LogLevel::Warning);

	std::string error;
	if (!configPath.empty() && !loadSettingsFile(configPath, settings, &error)) {
		logError("Failed to load settings: %s", error.c_str());
		return 1;
	}
	for (const auto &argument : overrides) {
		if (!applySettingsArgument(argument, settings, &error)) {
			logError("Bad setting: %s", error.c_str());
			return 1;
		}
	}
	if (!room.empty()) {
		settings.roomId = room;
	}
	if (!name.empty()) {
		settings.username = name;
	}
	if (create) {
		settings.isCreator = true;
	}
	if (!validateSettings(settings, &error)) {
		logError("Invalid settings: %s", error.c_str());
		printUsage(argv[0]);
		return 1;
	}

	EventLoop loop;
	RtcTransport transport(settings, loop);
	SyntheticMediaSource mediaSource;
	SyntheticFrameProvider frames;
	RawChunkEncoder encoder;

	RecordingOptions recordingOptions;
	recordingOptions.width = 320;
	recordingOptions.height = 180;
	recordingOptions.fps = 10;
	recordingOptions.chunkIntervalMs = settings.timing.recordingChunkMs;
	recordingOptions.directory = settings.recordingDirectory;

	int exitCode = 0;
	{
		PeerSession session(settings, transport, mediaSource, loop);
		Recorder recorder(session, loop, frames, encoder, nullptr, recordingOptions);

		session.setOnParticipantsChanged(printParticipants);
		session.setOnJoined([&session]() {
			std::printf("Joined room %s as %s (%s)\n", session.settings().roomId.c_str(), session.selfId().c_str(),
			            session.isCreator() ? "creator" : "member");
			std::fflush(stdout);
		});
		session.setOnData([](const std::string &peerId, const ControlMessage &message) {
			if (message.type == MessageType::ChatMessage) {
				std::printf("<%s> %s\n", message.sender.empty() ? peerId.c_str() : message.sender.c_str(),
				            message.text.c_str());
			} else {
				std::printf("[%s] %s\n", peerId.c_str(), message.typeName.c_str());
			}
			std::fflush(stdout);
		});
		session.setOnRecordingStatus([](bool isRecording, const std::string &host) {
			std::printf("Recording %s by %s\n", isRecording ? "started" : "stopped", host.c_str());
			std::fflush(stdout);
		});
		session.setOnError([&loop, &exitCode](const SessionError &sessionError) {
			std::printf("Error (%s): %s\n", sessionErrorKindName(sessionError.kind), sessionError.message.c_str());
			std::fflush(stdout);
			if (sessionError.fatal) {
				exitCode = 2;
				loop.stop();
			}
		});
		recorder.setOnFinished([](const std::string &path, size_t bytes) {
			std::printf("Wrote %zu bytes to %s\n", bytes, path.c_str());
			std::fflush(stdout);
		});

		if (!session.start()) {
			return 2;
		}

		// Blocks on stdin for the life of the process
		std::thread reader([&loop, &session, &recorder]() {
			std::string line;
			while (std::getline(std::cin, line)) {
				const std::string command = trim(line);
				loop.post([command, &session, &recorder, &loop]() { runCommand(command, session, recorder, loop); });
				if (command == "/quit") {
					return;
				}
			}
			loop.post([&session, &loop]() {
				session.leave();
				loop.stop();
			});
		});
		reader.detach();

		loop.run();
		// Drain the tasks queued by leave()
		loop.runPending();
	}

	transport.unregister();
	return exitCode;
}
