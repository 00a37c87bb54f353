/*
 * PeerMesh
 * Common type helpers
 */

#include "peermesh-common.h"

namespace peermesh
{

const char *topologyName(Topology topology)
{
	switch (topology) {
	case Topology::Mesh:
		return "mesh";
	case Topology::Star:
		return "star";
	}
	return "mesh";
}

const char *streamTypeName(StreamType type)
{
	switch (type) {
	case StreamType::Camera:
		return "camera";
	case StreamType::Screen:
		return "screen";
	}
	return "camera";
}

const char *transitionStateName(TransitionState state)
{
	switch (state) {
	case TransitionState::Connecting:
		return "connecting";
	case TransitionState::Connected:
		return "connected";
	case TransitionState::Disconnecting:
		return "disconnecting";
	case TransitionState::Reconnecting:
		return "reconnecting";
	}
	return "connecting";
}

const char *sessionErrorKindName(SessionErrorKind kind)
{
	switch (kind) {
	case SessionErrorKind::None:
		return "none";
	case SessionErrorKind::MediaUnavailable:
		return "media-unavailable";
	case SessionErrorKind::HostNotFound:
		return "host-not-found";
	case SessionErrorKind::ConnectionFailed:
		return "connection-failed";
	case SessionErrorKind::TransportError:
		return "transport-error";
	case SessionErrorKind::RecordingFailed:
		return "recording-failed";
	}
	return "none";
}

const char *timerPurposeName(TimerPurpose purpose)
{
	switch (purpose) {
	case TimerPurpose::JoinRetry:
		return "join-retry";
	case TimerPurpose::PeerListBroadcast:
		return "peer-list-broadcast";
	case TimerPurpose::MediaRecall:
		return "media-recall";
	case TimerPurpose::ControlReconnect:
		return "control-reconnect";
	case TimerPurpose::Transition:
		return "transition";
	case TimerPurpose::Removal:
		return "removal";
	case TimerPurpose::ScreenCall:
		return "screen-call";
	case TimerPurpose::ScreenRepair:
		return "screen-repair";
	case TimerPurpose::ScreenShareStarted:
		return "screen-share-started";
	case TimerPurpose::StreamUpdate:
		return "stream-update";
	case TimerPurpose::CameraRestoreRetry:
		return "camera-restore-retry";
	case TimerPurpose::FullReconnect:
		return "full-reconnect";
	case TimerPurpose::ReconnectAfterScreenShare:
		return "reconnect-after-screen-share";
	case TimerPurpose::ActivityCheck:
		return "activity-check";
	case TimerPurpose::RecordingFrame:
		return "recording-frame";
	case TimerPurpose::RecordingChunk:
		return "recording-chunk";
	}
	return "unknown";
}

bool parseTopology(const std::string &value, Topology &topology)
{
	if (value == "mesh") {
		topology = Topology::Mesh;
		return true;
	}
	if (value == "star") {
		topology = Topology::Star;
		return true;
	}
	return false;
}

bool parseStreamType(const std::string &value, StreamType &type)
{
	if (value == "camera") {
		type = StreamType::Camera;
		return true;
	}
	if (value == "screen") {
		type = StreamType::Screen;
		return true;
	}
	return false;
}

} // namespace peermesh
