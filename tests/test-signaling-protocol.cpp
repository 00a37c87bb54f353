/*
 * Unit tests for the PeerJS broker protocol
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "peermesh-signaling-protocol.h"
#include "peermesh-utils.h"

using namespace peermesh;

TEST(SignalingProtocolTest, ParsesOpen)
{
	const std::string raw = R"({"type":"OPEN"})";
	ParsedSignalMessage parsed;
	std::string error;

	EXPECT_TRUE(parseSignalingMessage(raw, parsed, &error));
	EXPECT_EQ(parsed.kind, SignalKind::Open);
	EXPECT_EQ(parsed.type, "OPEN");
}

TEST(SignalingProtocolTest, ParsesIdTakenAndServerError)
{
	ParsedSignalMessage taken;
	EXPECT_TRUE(parseSignalingMessage(R"({"type":"ID-TAKEN","payload":{"msg":"ID is taken"}})", taken));
	EXPECT_EQ(taken.kind, SignalKind::IdTaken);
	EXPECT_EQ(taken.errorMessage, "ID is taken");

	ParsedSignalMessage failure;
	EXPECT_TRUE(parseSignalingMessage(R"({"type":"ERROR","payload":{"msg":"Server overloaded"}})", failure));
	EXPECT_EQ(failure.kind, SignalKind::Error);
	EXPECT_EQ(failure.errorMessage, "Server overloaded");
}

TEST(SignalingProtocolTest, ParsesMediaOfferWithMetadata)
{
	const std::string raw = R"({
		"type":"OFFER",
		"src":"standup-creator",
		"dst":"standup-1700000000000",
		"payload":{
			"sdp":{"type":"offer","sdp":"v=0\r\na=mid:0\r\n"},
			"type":"media",
			"connectionId":"mc_abc123",
			"metadata":{"username":"Alice","streamType":"screen"}
		}
	})";
	ParsedSignalMessage parsed;
	std::string error;

	ASSERT_TRUE(parseSignalingMessage(raw, parsed, &error)) << error;
	EXPECT_EQ(parsed.kind, SignalKind::Offer);
	EXPECT_EQ(parsed.src, "standup-creator");
	EXPECT_EQ(parsed.dst, "standup-1700000000000");
	EXPECT_EQ(parsed.connectionKind, ConnectionKind::Media);
	EXPECT_EQ(parsed.connectionId, "mc_abc123");
	EXPECT_EQ(parsed.sdpType, "offer");
	EXPECT_NE(parsed.sdp.find("a=mid:0"), std::string::npos);
	EXPECT_EQ(parsed.username, "Alice");
	EXPECT_TRUE(parsed.hasStreamType);
	EXPECT_EQ(parsed.streamType, StreamType::Screen);
}

TEST(SignalingProtocolTest, OfferWithoutStreamTypeLeavesFlagUnset)
{
	const std::string raw =
	    R"({"type":"OFFER","src":"p1","payload":{"sdp":{"type":"offer","sdp":"v=0"},"type":"media","connectionId":"mc_1","metadata":{"username":"Bob"}}})";
	ParsedSignalMessage parsed;

	ASSERT_TRUE(parseSignalingMessage(raw, parsed));
	EXPECT_FALSE(parsed.hasStreamType);
	EXPECT_EQ(parsed.streamType, StreamType::Camera);
	EXPECT_EQ(parsed.username, "Bob");
}

TEST(SignalingProtocolTest, InfersConnectionKindFromId)
{
	const std::string raw = R"({"type":"ANSWER","src":"p1","payload":{"sdp":{"type":"answer","sdp":"v=0"},"connectionId":"dc_xyz"}})";
	ParsedSignalMessage parsed;

	ASSERT_TRUE(parseSignalingMessage(raw, parsed));
	EXPECT_EQ(parsed.kind, SignalKind::Answer);
	EXPECT_EQ(parsed.connectionKind, ConnectionKind::Data);
	EXPECT_EQ(parsed.sdpType, "answer");
}

TEST(SignalingProtocolTest, ParsesCandidateObjectPayload)
{
	const std::string raw = R"({
		"type":"CANDIDATE",
		"src":"peer-c",
		"payload":{
			"candidate":{"candidate":"candidate:1 1 UDP 2122260223 192.0.2.1 54400 typ host","sdpMid":"0","sdpMLineIndex":0},
			"type":"data",
			"connectionId":"dc_c1"
		}
	})";
	ParsedSignalMessage parsed;
	std::string error;

	ASSERT_TRUE(parseSignalingMessage(raw, parsed, &error)) << error;
	EXPECT_EQ(parsed.kind, SignalKind::Candidate);
	EXPECT_NE(parsed.candidate.find("candidate:1 1 UDP"), std::string::npos);
	EXPECT_EQ(parsed.mid, "0");
	EXPECT_EQ(parsed.mlineIndex, 0);
	EXPECT_EQ(parsed.connectionId, "dc_c1");
}

TEST(SignalingProtocolTest, ParsesLeaveAndExpire)
{
	ParsedSignalMessage leave;
	EXPECT_TRUE(parseSignalingMessage(R"({"type":"LEAVE","src":"gone-peer"})", leave));
	EXPECT_EQ(leave.kind, SignalKind::Leave);
	EXPECT_EQ(leave.src, "gone-peer");

	ParsedSignalMessage expire;
	EXPECT_TRUE(parseSignalingMessage(R"({"type":"EXPIRE","src":"room-creator","dst":"room-1"})", expire));
	EXPECT_EQ(expire.kind, SignalKind::Expire);
	EXPECT_EQ(expire.src, "room-creator");
}

TEST(SignalingProtocolTest, UnknownTypeStillParses)
{
	ParsedSignalMessage parsed;
	EXPECT_TRUE(parseSignalingMessage(R"({"type":"SOMETHING-NEW"})", parsed));
	EXPECT_EQ(parsed.kind, SignalKind::Unknown);
}

TEST(SignalingProtocolTest, RejectsMessagesWithoutType)
{
	ParsedSignalMessage parsed;
	std::string error;
	EXPECT_FALSE(parseSignalingMessage(R"({"src":"x"})", parsed, &error));
	EXPECT_FALSE(error.empty());
	EXPECT_FALSE(parseSignalingMessage("", parsed));
}

TEST(SignalingProtocolTest, RejectsOfferWithoutSdpOrConnection)
{
	ParsedSignalMessage parsed;
	std::string error;
	EXPECT_FALSE(parseSignalingMessage(R"({"type":"OFFER","src":"x","payload":{"type":"data"}})", parsed, &error));
	EXPECT_FALSE(error.empty());
	EXPECT_FALSE(parseSignalingMessage(R"({"type":"CANDIDATE","src":"x","payload":{"candidate":{"candidate":"c"}}})",
	                                   parsed));
}

TEST(SignalingProtocolTest, BuildsOfferThatParsesBack)
{
	const std::string message =
	    buildOfferMessage("room-creator", "mc_1234", ConnectionKind::Media, "v=0\r\n", "Carol", StreamType::Screen);

	JsonParser json(message);
	EXPECT_EQ(json.getString("type"), "OFFER");
	EXPECT_EQ(json.getString("dst"), "room-creator");

	ParsedSignalMessage parsed;
	ASSERT_TRUE(parseSignalingMessage(message, parsed));
	EXPECT_EQ(parsed.connectionKind, ConnectionKind::Media);
	EXPECT_EQ(parsed.sdp, "v=0\r\n");
	EXPECT_EQ(parsed.username, "Carol");
	EXPECT_EQ(parsed.streamType, StreamType::Screen);
}

TEST(SignalingProtocolTest, DataOfferCarriesChannelOptions)
{
	const std::string message =
	    buildOfferMessage("peer", "dc_5678", ConnectionKind::Data, "v=0", "Dan", StreamType::Camera);
	JsonParser payload(JsonParser(message).getObject("payload"));

	EXPECT_EQ(payload.getString("type"), "data");
	EXPECT_EQ(payload.getString("label"), "dc_5678");
	EXPECT_EQ(payload.getString("serialization"), "json");
	EXPECT_TRUE(payload.getBool("reliable"));
}

TEST(SignalingProtocolTest, BuildsAnswerCandidateLeaveAndHeartbeat)
{
	JsonParser answer(buildAnswerMessage("peer", "dc_1", ConnectionKind::Data, "v=0"));
	EXPECT_EQ(answer.getString("type"), "ANSWER");
	EXPECT_EQ(JsonParser(JsonParser(answer.getObject("payload")).getObject("sdp")).getString("type"), "answer");

	JsonParser candidate(buildCandidateMessage("peer", "mc_2", ConnectionKind::Media, "candidate:abc", "1"));
	EXPECT_EQ(candidate.getString("type"), "CANDIDATE");
	JsonParser candidatePayload(candidate.getObject("payload"));
	EXPECT_EQ(candidatePayload.getString("connectionId"), "mc_2");
	EXPECT_EQ(JsonParser(candidatePayload.getObject("candidate")).getString("sdpMid"), "1");

	JsonParser leave(buildLeaveMessage("peer"));
	EXPECT_EQ(leave.getString("type"), "LEAVE");
	EXPECT_EQ(leave.getString("dst"), "peer");

	EXPECT_EQ(buildHeartbeatMessage(), R"({"type":"HEARTBEAT"})");
}

TEST(SignalingProtocolTest, ConnectionIdsCarryKindPrefix)
{
	const std::string data = makeConnectionId(ConnectionKind::Data);
	const std::string media = makeConnectionId(ConnectionKind::Media);
	EXPECT_EQ(data.rfind("dc_", 0), 0u);
	EXPECT_EQ(media.rfind("mc_", 0), 0u);
	EXPECT_NE(data, makeConnectionId(ConnectionKind::Data));

	ConnectionKind kind = ConnectionKind::Data;
	EXPECT_TRUE(connectionKindFromId(media, kind));
	EXPECT_EQ(kind, ConnectionKind::Media);
	EXPECT_FALSE(connectionKindFromId("xx_1", kind));
}

TEST(SignalingProtocolTest, BuildsSignalingUrl)
{
	EXPECT_EQ(buildSignalingUrl("0.peerjs.com", 443, "/", true, "peerjs", "room-creator", "tok"),
	          "wss://0.peerjs.com:443/peerjs?key=peerjs&id=room-creator&token=tok");
	EXPECT_EQ(buildSignalingUrl("localhost", 9000, "myapp", false, "k", "id", "t"),
	          "ws://localhost:9000/myapp/peerjs?key=k&id=id&token=t");
}
