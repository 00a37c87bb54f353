/*
 * PeerMesh
 * Common types and definitions
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace peermesh
{

// Version info
#define PEERMESH_VERSION "1.0.0"
#define PEERMESH_LOG_PREFIX "[PeerMesh]"

// Default signaling server (PeerJS cloud broker)
constexpr const char *DEFAULT_SIGNALING_HOST = "0.peerjs.com";
constexpr const char *DEFAULT_SIGNALING_KEY = "peerjs";
constexpr const char *DEFAULT_SIGNALING_PATH = "/";
constexpr int DEFAULT_SIGNALING_PORT = 443;

// Peer id conventions
constexpr const char *CREATOR_SUFFIX = "-creator";
constexpr size_t MAX_ROOM_ID_LENGTH = 64;

// Default ICE servers used when none are configured
struct IceServer {
	std::string urls;
	std::string username;
	std::string credential;
};

const std::vector<IceServer> DEFAULT_ICE_SERVERS = {
    {"stun:stun.l.google.com:19302", "", ""},
    {"stun:stun1.l.google.com:19302", "", ""},
    {"stun:stun2.l.google.com:19302", "", ""},
    {"stun:stun3.l.google.com:19302", "", ""},
    {"stun:stun4.l.google.com:19302", "", ""},
    {"stun:global.stun.twilio.com:3478", "", ""},
    {"stun:stun.openrelay.metered.ca:80", "", ""},
    {"turn:openrelay.metered.ca:80", "openrelayproject", "openrelayproject"},
    {"turn:openrelay.metered.ca:443", "openrelayproject", "openrelayproject"},
    {"turn:openrelay.metered.ca:443?transport=tcp", "openrelayproject", "openrelayproject"},
};

// Connection topology
enum class Topology { Mesh, Star };

// Kind of content carried by a media channel
enum class StreamType { Camera, Screen };

// UI-facing animation hint for a participant tile
enum class TransitionState { Connecting, Connected, Disconnecting, Reconnecting };

// Errors surfaced through the session error slot
enum class SessionErrorKind { None, MediaUnavailable, HostNotFound, ConnectionFailed, TransportError, RecordingFailed };

struct SessionError {
	SessionErrorKind kind = SessionErrorKind::None;
	std::string message;
	bool fatal = false;
};

// Errors reported by the transport adapter
enum class TransportErrorKind { PeerUnavailable, IdTaken, Network, ServerError, Other };

// Purposes for scheduled tasks; one pending task per (peer, purpose)
enum class TimerPurpose {
	JoinRetry,
	PeerListBroadcast,
	MediaRecall,
	ControlReconnect,
	Transition,
	Removal,
	ScreenCall,
	ScreenRepair,
	ScreenShareStarted,
	StreamUpdate,
	CameraRestoreRetry,
	FullReconnect,
	ReconnectAfterScreenShare,
	ActivityCheck,
	RecordingFrame,
	RecordingChunk
};

const char *topologyName(Topology topology);
const char *streamTypeName(StreamType type);
const char *transitionStateName(TransitionState state);
const char *sessionErrorKindName(SessionErrorKind kind);
const char *timerPurposeName(TimerPurpose purpose);

bool parseTopology(const std::string &value, Topology &topology);
bool parseStreamType(const std::string &value, StreamType &type);

} // namespace peermesh
