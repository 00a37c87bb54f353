/*
 * PeerMesh
 * PeerJS broker protocol
 */

#include "peermesh-signaling-protocol.h"

#include <initializer_list>

#include "peermesh-utils.h"

namespace peermesh
{

namespace
{

std::string getAnyString(const JsonParser &json, const std::initializer_list<const char *> &keys)
{
	for (const char *key : keys) {
		if (json.hasKey(key)) {
			return json.getString(key);
		}
	}
	return "";
}

SignalKind signalKindFromType(const std::string &type)
{
	if (type == "OPEN")
		return SignalKind::Open;
	if (type == "ID-TAKEN")
		return SignalKind::IdTaken;
	if (type == "INVALID-KEY")
		return SignalKind::InvalidKey;
	if (type == "ERROR")
		return SignalKind::Error;
	if (type == "OFFER")
		return SignalKind::Offer;
	if (type == "ANSWER")
		return SignalKind::Answer;
	if (type == "CANDIDATE")
		return SignalKind::Candidate;
	if (type == "LEAVE")
		return SignalKind::Leave;
	if (type == "EXPIRE")
		return SignalKind::Expire;
	if (type == "HEARTBEAT")
		return SignalKind::Heartbeat;
	return SignalKind::Unknown;
}

void parseMetadata(const std::string &raw, ParsedSignalMessage &parsed)
{
	if (raw.empty() || raw[0] != '{') {
		return;
	}
	JsonParser metadata(raw);
	parsed.username = getAnyString(metadata, {"username", "name"});
	if (metadata.hasKey("streamType")) {
		parsed.hasStreamType = parseStreamType(metadata.getString("streamType"), parsed.streamType);
	}
}

void parsePayload(const std::string &raw, ParsedSignalMessage &parsed)
{
	if (raw.empty() || raw[0] != '{') {
		return;
	}
	JsonParser payload(raw);

	parsed.connectionId = payload.getString("connectionId");
	const std::string connectionType = asciiLower(payload.getString("type"));
	if (connectionType == "media") {
		parsed.connectionKind = ConnectionKind::Media;
	} else if (connectionType == "data") {
		parsed.connectionKind = ConnectionKind::Data;
	} else {
		connectionKindFromId(parsed.connectionId, parsed.connectionKind);
	}
	parsed.label = payload.getString("label");
	parsed.errorMessage = getAnyString(payload, {"msg", "message"});

	const std::string sdpRaw = payload.getRaw("sdp");
	if (!sdpRaw.empty() && sdpRaw[0] == '{') {
		JsonParser sdp(sdpRaw);
		parsed.sdp = sdp.getString("sdp");
		parsed.sdpType = sdp.getString("type");
	} else if (!sdpRaw.empty()) {
		parsed.sdp = sdpRaw;
	}

	const std::string candidateRaw = payload.getRaw("candidate");
	if (!candidateRaw.empty() && candidateRaw[0] == '{') {
		JsonParser candidate(candidateRaw);
		parsed.candidate = candidate.getString("candidate");
		parsed.mid = getAnyString(candidate, {"sdpMid", "mid"});
		parsed.mlineIndex = candidate.getInt("sdpMLineIndex", 0);
	} else if (!candidateRaw.empty()) {
		parsed.candidate = candidateRaw;
	}

	parseMetadata(payload.getRaw("metadata"), parsed);
}

std::string sdpObject(const std::string &type, const std::string &sdp)
{
	JsonBuilder builder;
	builder.add("type", type);
	builder.add("sdp", sdp);
	return builder.build();
}

std::string envelope(const char *type, const std::string &dst, const std::string &payload)
{
	JsonBuilder builder;
	builder.add("type", type);
	builder.add("dst", dst);
	builder.addRaw("payload", payload);
	return builder.build();
}

} // namespace

bool parseSignalingMessage(const std::string &message, ParsedSignalMessage &parsed, std::string *error)
{
	try {
		JsonParser json(message);

		if (!json.hasKey("type")) {
			if (error) {
				*error = "Missing type";
			}
			return false;
		}

		parsed.type = json.getString("type");
		parsed.kind = signalKindFromType(parsed.type);
		parsed.src = json.getString("src");
		parsed.dst = json.getString("dst");
		parsePayload(json.getRaw("payload"), parsed);

		switch (parsed.kind) {
		case SignalKind::Offer:
		case SignalKind::Answer:
			if (parsed.connectionId.empty() || parsed.sdp.empty()) {
				if (error) {
					*error = parsed.type + " without connectionId or sdp";
				}
				return false;
			}
			break;
		case SignalKind::Candidate:
			if (parsed.connectionId.empty()) {
				if (error) {
					*error = "CANDIDATE without connectionId";
				}
				return false;
			}
			break;
		default:
			break;
		}
		return true;
	} catch (const std::exception &ex) {
		if (error) {
			*error = ex.what();
		}
		return false;
	}
}

const char *connectionKindName(ConnectionKind kind)
{
	return kind == ConnectionKind::Media ? "media" : "data";
}

std::string makeConnectionId(ConnectionKind kind)
{
	return std::string(kind == ConnectionKind::Media ? "mc_" : "dc_") + generateSessionId() + generateSessionId();
}

bool connectionKindFromId(const std::string &connectionId, ConnectionKind &kind)
{
	if (connectionId.rfind("mc_", 0) == 0) {
		kind = ConnectionKind::Media;
		return true;
	}
	if (connectionId.rfind("dc_", 0) == 0) {
		kind = ConnectionKind::Data;
		return true;
	}
	return false;
}

std::string buildOfferMessage(const std::string &dst, const std::string &connectionId, ConnectionKind kind,
                              const std::string &sdp, const std::string &username, StreamType streamType)
{
	JsonBuilder metadata;
	metadata.add("username", username);
	metadata.add("streamType", streamTypeName(streamType));

	JsonBuilder payload;
	payload.addRaw("sdp", sdpObject("offer", sdp));
	payload.add("type", connectionKindName(kind));
	payload.add("connectionId", connectionId);
	payload.addRaw("metadata", metadata.build());
	if (kind == ConnectionKind::Data) {
		payload.add("label", connectionId);
		payload.add("serialization", "json");
		payload.add("reliable", true);
	}
	return envelope("OFFER", dst, payload.build());
}

std::string buildAnswerMessage(const std::string &dst, const std::string &connectionId, ConnectionKind kind,
                               const std::string &sdp)
{
	JsonBuilder payload;
	payload.addRaw("sdp", sdpObject("answer", sdp));
	payload.add("type", connectionKindName(kind));
	payload.add("connectionId", connectionId);
	return envelope("ANSWER", dst, payload.build());
}

std::string buildCandidateMessage(const std::string &dst, const std::string &connectionId, ConnectionKind kind,
                                  const std::string &candidate, const std::string &mid)
{
	JsonBuilder candidateJson;
	candidateJson.add("candidate", candidate);
	candidateJson.add("sdpMid", mid);
	candidateJson.add("sdpMLineIndex", 0);

	JsonBuilder payload;
	payload.addRaw("candidate", candidateJson.build());
	payload.add("type", connectionKindName(kind));
	payload.add("connectionId", connectionId);
	return envelope("CANDIDATE", dst, payload.build());
}

std::string buildLeaveMessage(const std::string &dst)
{
	JsonBuilder builder;
	builder.add("type", "LEAVE");
	builder.add("dst", dst);
	return builder.build();
}

std::string buildHeartbeatMessage()
{
	JsonBuilder builder;
	builder.add("type", "HEARTBEAT");
	return builder.build();
}

std::string buildSignalingUrl(const std::string &host, int port, const std::string &path, bool secure,
                              const std::string &key, const std::string &id, const std::string &token)
{
	std::string normalizedPath = path.empty() ? "/" : path;
	if (normalizedPath.front() != '/') {
		normalizedPath = "/" + normalizedPath;
	}
	if (normalizedPath.back() != '/') {
		normalizedPath += "/";
	}

	std::string url = secure ? "wss://" : "ws://";
	url += host + ":" + std::to_string(port) + normalizedPath + "peerjs?key=" + key + "&id=" + id + "&token=" + token;
	return url;
}

} // namespace peermesh
