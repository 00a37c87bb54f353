/*
 * Unit tests for retry and recovery policies
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include "peermesh-resilience.h"

using namespace peermesh;

// JoinRetryPolicy Tests

TEST(ResilienceTest, JoinAllowsConfiguredAttempts)
{
	JoinRetryPolicy policy(5, 3000);
	int attempts = 0;
	while (policy.canRetry()) {
		policy.recordAttempt();
		attempts++;
	}
	EXPECT_EQ(attempts, 5);
	EXPECT_EQ(policy.intervalMs(), 3000);

	policy.reset();
	EXPECT_EQ(policy.attempts(), 0);
	EXPECT_TRUE(policy.canRetry());
}

TEST(ResilienceTest, JoinTerminalErrorReflectsCause)
{
	JoinRetryPolicy policy(2, 1000);
	policy.recordFailure(false);
	EXPECT_EQ(policy.terminalError(), SessionErrorKind::ConnectionFailed);
	policy.recordFailure(true);
	EXPECT_EQ(policy.terminalError(), SessionErrorKind::HostNotFound);
	policy.reset();
	EXPECT_EQ(policy.terminalError(), SessionErrorKind::ConnectionFailed);
}

TEST(ResilienceTest, JoinClampsToOneAttempt)
{
	JoinRetryPolicy policy(0, 1000);
	EXPECT_EQ(policy.maxAttempts(), 1);
}

// MediaRecoveryPolicy Tests

TEST(ResilienceTest, MediaRecoveryEscalatesToRelay)
{
	MediaRecoveryPolicy policy(2, 5);
	EXPECT_EQ(policy.recordFailure("p"), RecoveryAction::Recall);
	EXPECT_FALSE(policy.isRelayForced("p"));
	EXPECT_EQ(policy.recordFailure("p"), RecoveryAction::RecallWithRelay);
	EXPECT_TRUE(policy.isRelayForced("p"));
	EXPECT_EQ(policy.recordFailure("p"), RecoveryAction::Recall);
	EXPECT_EQ(policy.failures("p"), 3);
}

TEST(ResilienceTest, MediaRecoveryGivesUp)
{
	MediaRecoveryPolicy policy(2, 3);
	policy.recordFailure("p");
	policy.recordFailure("p");
	policy.recordFailure("p");
	EXPECT_EQ(policy.recordFailure("p"), RecoveryAction::GiveUp);
}

TEST(ResilienceTest, MediaRecoverySuccessKeepsRelay)
{
	MediaRecoveryPolicy policy(2, 5);
	policy.recordFailure("p");
	policy.recordFailure("p");
	policy.recordSuccess("p");
	EXPECT_EQ(policy.failures("p"), 0);
	EXPECT_TRUE(policy.isRelayForced("p"));

	policy.forget("p");
	EXPECT_FALSE(policy.isRelayForced("p"));
}

TEST(ResilienceTest, MediaRecoveryIsPerPeer)
{
	MediaRecoveryPolicy policy(1, 5);
	EXPECT_EQ(policy.recordFailure("a"), RecoveryAction::RecallWithRelay);
	EXPECT_EQ(policy.failures("b"), 0);
	EXPECT_FALSE(policy.isRelayForced("b"));
}

// RetryBudget Tests

TEST(ResilienceTest, BudgetStopsAtLimit)
{
	RetryBudget budget(3);
	EXPECT_TRUE(budget.consume("p", 0));
	EXPECT_TRUE(budget.consume("p", 0));
	EXPECT_TRUE(budget.consume("p", 0));
	EXPECT_FALSE(budget.consume("p", 0));
	EXPECT_TRUE(budget.exhausted("p"));

	budget.reset("p");
	EXPECT_EQ(budget.attempts("p"), 0);
	EXPECT_TRUE(budget.consume("p", 0));
}

TEST(ResilienceTest, BudgetHonorsCooldown)
{
	RetryBudget budget(3, 3000);
	EXPECT_TRUE(budget.consume("p", 1000));
	EXPECT_FALSE(budget.consume("p", 2500));
	EXPECT_TRUE(budget.consume("p", 4000));
	EXPECT_EQ(budget.attempts("p"), 2);
	EXPECT_TRUE(budget.consume("q", 2500));
}

// StreamActivityMonitor Tests

TEST(ResilienceTest, ActivityMonitorFlagsAfterGrace)
{
	StreamActivityMonitor monitor(2000);
	EXPECT_FALSE(monitor.observe("p", false, 0));
	EXPECT_FALSE(monitor.observe("p", false, 1500));
	EXPECT_TRUE(monitor.observe("p", false, 2000));

	EXPECT_FALSE(monitor.observe("p", true, 2100));
	EXPECT_FALSE(monitor.observe("p", false, 2200));
	EXPECT_FALSE(monitor.observe("p", false, 4000));
	EXPECT_TRUE(monitor.observe("p", false, 4200));

	monitor.forget("p");
	EXPECT_FALSE(monitor.observe("p", false, 9000));
}
