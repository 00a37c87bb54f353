/*
 * PeerMesh
 * Session settings and configuration loading
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "peermesh-common.h"

namespace peermesh
{

// Delays and retry bounds used by the orchestrator. All values in milliseconds unless noted.
struct Timing {
	int64_t joinRetryIntervalMs = 3000;
	int joinMaxAttempts = 5;
	int64_t peerListBroadcastMs = 10000;

	int64_t transitionSettleMs = 1000;
	int64_t removalDelayMs = 800;

	int64_t mediaRecallDelayMs = 1000;
	int relayAfterFailures = 2;
	int maxMediaRecalls = 5;

	int64_t controlReconnectDelayMs = 1000;
	int controlReconnectMaxAttempts = 5;

	int64_t newcomerScreenDelayMs = 500;
	int64_t shareNotifyDelayMs = 300;
	int64_t screenCallStaggerMs = 200;
	int64_t stopShareRepairDelayMs = 300;
	int64_t stopShareRepairStaggerMs = 150;
	int64_t screenShareStartedDelayMs = 300;
	int64_t screenShareStartedConnectDelayMs = 200;

	int64_t fullReconnectDelayMs = 100;
	int64_t streamUpdateUrgentDelayMs = 50;
	int64_t streamUpdateDelayMs = 100;
	int64_t reconnectAfterShareDelayMs = 200;

	int cameraRestoreMaxRetries = 3;
	int64_t cameraRestoreRetryMs = 2000;

	int screenRecoveryMaxAttempts = 3;
	int64_t screenRecoveryCooldownMs = 3000;
	int64_t activityCheckMs = 2000;
	int64_t inactivityGraceMs = 2000;

	int64_t recordingChunkMs = 1000;
};

struct SessionSettings {
	std::string roomId;
	std::string username = "Guest";
	bool isCreator = false;

	// Signaling broker
	std::string signalingHost = DEFAULT_SIGNALING_HOST;
	int signalingPort = DEFAULT_SIGNALING_PORT;
	std::string signalingPath = DEFAULT_SIGNALING_PATH;
	std::string signalingKey = DEFAULT_SIGNALING_KEY;
	bool signalingSecure = true;

	// ICE
	std::vector<IceServer> iceServers;
	bool forceTurn = false;

	Topology topology = Topology::Mesh;
	bool transitionsEnabled = true;
	bool enableVideo = true;
	bool enableAudio = true;
	std::string recordingDirectory = ".";

	Timing timing;
};

// Apply a flat JSON settings object. Unknown keys are logged and skipped.
bool applySettingsJson(const std::string &json, SessionSettings &settings, std::string *error = nullptr);
bool loadSettingsFile(const std::string &path, SessionSettings &settings, std::string *error = nullptr);

// Apply a single "key=value" override
bool applySettingsArgument(const std::string &argument, SessionSettings &settings, std::string *error = nullptr);

bool validateSettings(const SessionSettings &settings, std::string *error = nullptr);

} // namespace peermesh
