/*
 * PeerMesh
 * Retry and recovery policies
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "peermesh-common.h"

namespace peermesh
{

// Bounded join loop from a joiner to the room creator
class JoinRetryPolicy
{
public:
	JoinRetryPolicy(int maxAttempts, int64_t intervalMs);

	void reset();
	void recordAttempt() { attempts_++; }
	void recordFailure(bool peerUnavailable);

	int attempts() const { return attempts_; }
	int maxAttempts() const { return maxAttempts_; }
	int64_t intervalMs() const { return intervalMs_; }
	bool canRetry() const { return attempts_ < maxAttempts_; }

	// Reason surfaced once attempts are exhausted
	SessionErrorKind terminalError() const;

private:
	int maxAttempts_;
	int64_t intervalMs_;
	int attempts_ = 0;
	bool sawPeerUnavailable_ = false;
};

enum class RecoveryAction { Recall, RecallWithRelay, GiveUp };

// Mid-call media loss: re-call, then force relay, then stop trying
class MediaRecoveryPolicy
{
public:
	MediaRecoveryPolicy(int relayAfterFailures, int maxRecalls);

	RecoveryAction recordFailure(const std::string &peerId);
	void recordSuccess(const std::string &peerId);
	void forget(const std::string &peerId);

	int failures(const std::string &peerId) const;
	bool isRelayForced(const std::string &peerId) const;

private:
	struct State {
		int failures = 0;
		bool relayForced = false;
	};

	int relayAfterFailures_;
	int maxRecalls_;
	std::map<std::string, State> peers_;
};

// Per-peer attempt budget with an optional cooldown between attempts
class RetryBudget
{
public:
	RetryBudget(int maxAttempts, int64_t cooldownMs = 0);

	// Consume one attempt if the budget and cooldown allow it
	bool consume(const std::string &peerId, int64_t now);
	int attempts(const std::string &peerId) const;
	bool exhausted(const std::string &peerId) const;
	void reset(const std::string &peerId);
	void clear() { peers_.clear(); }

private:
	struct State {
		int attempts = 0;
		int64_t lastAttemptAt = 0;
	};

	int maxAttempts_;
	int64_t cooldownMs_;
	std::map<std::string, State> peers_;
};

// Flags a stream once it has had no live track for longer than the grace window
class StreamActivityMonitor
{
public:
	explicit StreamActivityMonitor(int64_t graceMs);

	bool observe(const std::string &peerId, bool active, int64_t now);
	void forget(const std::string &peerId);

private:
	int64_t graceMs_;
	std::map<std::string, int64_t> inactiveSince_;
};

} // namespace peermesh
