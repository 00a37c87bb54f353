/*
 * PeerMesh
 * Retry and recovery policies
 */

#include "peermesh-resilience.h"

#include "peermesh-utils.h"

namespace peermesh
{

JoinRetryPolicy::JoinRetryPolicy(int maxAttempts, int64_t intervalMs)
    : maxAttempts_(maxAttempts < 1 ? 1 : maxAttempts), intervalMs_(intervalMs)
{
}

void JoinRetryPolicy::reset()
{
	attempts_ = 0;
	sawPeerUnavailable_ = false;
}

void JoinRetryPolicy::recordFailure(bool peerUnavailable)
{
	if (peerUnavailable) {
		sawPeerUnavailable_ = true;
	}
}

SessionErrorKind JoinRetryPolicy::terminalError() const
{
	return sawPeerUnavailable_ ? SessionErrorKind::HostNotFound : SessionErrorKind::ConnectionFailed;
}

MediaRecoveryPolicy::MediaRecoveryPolicy(int relayAfterFailures, int maxRecalls)
    : relayAfterFailures_(relayAfterFailures), maxRecalls_(maxRecalls)
{
}

RecoveryAction MediaRecoveryPolicy::recordFailure(const std::string &peerId)
{
	State &state = peers_[peerId];
	state.failures++;

	if (state.failures > maxRecalls_) {
		logWarning("Giving up on media with %s after %d failures", peerId.c_str(), state.failures - 1);
		return RecoveryAction::GiveUp;
	}

	if (!state.relayForced && state.failures >= relayAfterFailures_) {
		state.relayForced = true;
		logInfo("Forcing relay for %s after %d failures", peerId.c_str(), state.failures);
		return RecoveryAction::RecallWithRelay;
	}

	return RecoveryAction::Recall;
}

void MediaRecoveryPolicy::recordSuccess(const std::string &peerId)
{
	auto it = peers_.find(peerId);
	if (it != peers_.end()) {
		// Relay stays forced for the peer; only the failure streak resets
		it->second.failures = 0;
	}
}

void MediaRecoveryPolicy::forget(const std::string &peerId)
{
	peers_.erase(peerId);
}

int MediaRecoveryPolicy::failures(const std::string &peerId) const
{
	auto it = peers_.find(peerId);
	return it == peers_.end() ? 0 : it->second.failures;
}

bool MediaRecoveryPolicy::isRelayForced(const std::string &peerId) const
{
	auto it = peers_.find(peerId);
	return it != peers_.end() && it->second.relayForced;
}

RetryBudget::RetryBudget(int maxAttempts, int64_t cooldownMs) : maxAttempts_(maxAttempts), cooldownMs_(cooldownMs) {}

bool RetryBudget::consume(const std::string &peerId, int64_t now)
{
	State &state = peers_[peerId];
	if (state.attempts >= maxAttempts_) {
		return false;
	}
	if (state.attempts > 0 && now - state.lastAttemptAt < cooldownMs_) {
		return false;
	}
	state.attempts++;
	state.lastAttemptAt = now;
	return true;
}

int RetryBudget::attempts(const std::string &peerId) const
{
	auto it = peers_.find(peerId);
	return it == peers_.end() ? 0 : it->second.attempts;
}

bool RetryBudget::exhausted(const std::string &peerId) const
{
	return attempts(peerId) >= maxAttempts_;
}

void RetryBudget::reset(const std::string &peerId)
{
	peers_.erase(peerId);
}

StreamActivityMonitor::StreamActivityMonitor(int64_t graceMs) : graceMs_(graceMs) {}

bool StreamActivityMonitor::observe(const std::string &peerId, bool active, int64_t now)
{
	if (active) {
		inactiveSince_.erase(peerId);
		return false;
	}

	auto it = inactiveSince_.find(peerId);
	if (it == inactiveSince_.end()) {
		inactiveSince_[peerId] = now;
		return false;
	}
	return now - it->second >= graceMs_;
}

void StreamActivityMonitor::forget(const std::string &peerId)
{
	inactiveSince_.erase(peerId);
}

} // namespace peermesh
