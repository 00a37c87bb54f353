/*
 * PeerMesh
 * PeerJS broker protocol
 */

#pragma once

#include <string>

#include "peermesh-common.h"

namespace peermesh
{

enum class SignalKind {
	Unknown,
	Open,
	IdTaken,
	InvalidKey,
	Error,
	Offer,
	Answer,
	Candidate,
	Leave,
	Expire,
	Heartbeat
};

// PeerJS connection flavour: data channel or media call
enum class ConnectionKind { Data, Media };

struct ParsedSignalMessage {
	SignalKind kind = SignalKind::Unknown;
	std::string type;
	std::string src;
	std::string dst;

	std::string connectionId;
	ConnectionKind connectionKind = ConnectionKind::Data;
	std::string label;

	std::string sdp;
	std::string sdpType;

	std::string candidate;
	std::string mid;
	int mlineIndex = 0;

	// Call metadata
	std::string username;
	bool hasStreamType = false;
	StreamType streamType = StreamType::Camera;

	std::string errorMessage;
};

bool parseSignalingMessage(const std::string &message, ParsedSignalMessage &parsed, std::string *error = nullptr);

const char *connectionKindName(ConnectionKind kind);
std::string makeConnectionId(ConnectionKind kind);
bool connectionKindFromId(const std::string &connectionId, ConnectionKind &kind);

std::string buildOfferMessage(const std::string &dst, const std::string &connectionId, ConnectionKind kind,
                              const std::string &sdp, const std::string &username, StreamType streamType);
std::string buildAnswerMessage(const std::string &dst, const std::string &connectionId, ConnectionKind kind,
                               const std::string &sdp);
std::string buildCandidateMessage(const std::string &dst, const std::string &connectionId, ConnectionKind kind,
                                  const std::string &candidate, const std::string &mid);
std::string buildLeaveMessage(const std::string &dst);
std::string buildHeartbeatMessage();

std::string buildSignalingUrl(const std::string &host, int port, const std::string &path, bool secure,
                              const std::string &key, const std::string &id, const std::string &token);

} // namespace peermesh
