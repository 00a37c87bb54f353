/*
 * Unit tests for the event loop and timer table
 * SPDX-License-Identifier: AGPL-3.0-only
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "peermesh-event-loop.h"

using namespace peermesh;

class EventLoopTest : public ::testing::Test
{
protected:
	EventLoop loop{EventLoop::ClockMode::Manual};
	std::vector<std::string> fired;
};

// EventLoop Tests

TEST_F(EventLoopTest, PostedTasksRunInOrder)
{
	loop.post([this]() { fired.push_back("a"); });
	loop.post([this]() { fired.push_back("b"); });
	EXPECT_EQ(loop.pendingTasks(), 2u);
	EXPECT_EQ(loop.runPending(), 2u);
	EXPECT_EQ(fired, (std::vector<std::string>{"a", "b"}));
}

TEST_F(EventLoopTest, TimersFireInDueOrder)
{
	loop.schedule(300, [this]() { fired.push_back("300"); });
	loop.schedule(100, [this]() { fired.push_back("100"); });
	loop.schedule(200, [this]() { fired.push_back("200"); });

	loop.advance(150);
	EXPECT_EQ(fired, (std::vector<std::string>{"100"}));
	EXPECT_EQ(loop.now(), 150);

	loop.advance(200);
	EXPECT_EQ(fired, (std::vector<std::string>{"100", "200", "300"}));
	EXPECT_EQ(loop.pendingTimers(), 0u);
}

TEST_F(EventLoopTest, TimerScheduledFromTimerSeesAdvancedClock)
{
	int64_t innerFiredAt = -1;
	loop.schedule(100, [this, &innerFiredAt]() {
		loop.schedule(50, [this, &innerFiredAt]() { innerFiredAt = loop.now(); });
	});

	loop.advance(1000);
	EXPECT_EQ(innerFiredAt, 150);
}

TEST_F(EventLoopTest, CancelledTimerDoesNotFire)
{
	const auto id = loop.schedule(100, [this]() { fired.push_back("x"); });
	EXPECT_TRUE(loop.cancel(id));
	EXPECT_FALSE(loop.cancel(id));
	loop.advance(500);
	EXPECT_TRUE(fired.empty());
}

TEST_F(EventLoopTest, ThrowingTaskDoesNotStopLoop)
{
	loop.post([]() { throw std::runtime_error("boom"); });
	loop.post([this]() { fired.push_back("after"); });
	EXPECT_EQ(loop.runPending(), 2u);
	EXPECT_EQ(fired, (std::vector<std::string>{"after"}));
}

TEST(EventLoopRealTimeTest, RunProcessesPostFromOtherThread)
{
	EventLoop loop;
	bool ran = false;
	std::thread poster([&loop, &ran]() {
		loop.post([&loop, &ran]() {
			ran = true;
			loop.stop();
		});
	});
	loop.run();
	poster.join();
	EXPECT_TRUE(ran);
	EXPECT_FALSE(loop.isRunning());
}

// TimerTable Tests

TEST_F(EventLoopTest, TableReplacesPendingKey)
{
	TimerTable timers(loop);
	timers.schedule("peer-a", TimerPurpose::Removal, 100, [this]() { fired.push_back("first"); });
	timers.schedule("peer-a", TimerPurpose::Removal, 100, [this]() { fired.push_back("second"); });
	EXPECT_EQ(timers.size(), 1u);

	loop.advance(200);
	EXPECT_EQ(fired, (std::vector<std::string>{"second"}));
	EXPECT_FALSE(timers.isPending("peer-a", TimerPurpose::Removal));
}

TEST_F(EventLoopTest, TableKeysArePerPurpose)
{
	TimerTable timers(loop);
	timers.schedule("peer-a", TimerPurpose::Removal, 100, [this]() { fired.push_back("removal"); });
	timers.schedule("peer-a", TimerPurpose::Transition, 100, [this]() { fired.push_back("transition"); });
	timers.schedule("peer-b", TimerPurpose::Removal, 100, [this]() { fired.push_back("b"); });
	EXPECT_EQ(timers.size(), 3u);

	EXPECT_EQ(timers.cancelPeer("peer-a"), 2u);
	loop.advance(200);
	EXPECT_EQ(fired, (std::vector<std::string>{"b"}));
}

TEST_F(EventLoopTest, RepeatingTimerUntilCancelled)
{
	TimerTable timers(loop);
	int count = 0;
	timers.scheduleRepeating("", TimerPurpose::PeerListBroadcast, 10000, [&count]() { count++; });

	loop.advance(35000);
	EXPECT_EQ(count, 3);
	EXPECT_TRUE(timers.isPending("", TimerPurpose::PeerListBroadcast));

	EXPECT_TRUE(timers.cancel("", TimerPurpose::PeerListBroadcast));
	loop.advance(20000);
	EXPECT_EQ(count, 3);
}

TEST_F(EventLoopTest, RepeatingTaskCanCancelItself)
{
	TimerTable timers(loop);
	int count = 0;
	timers.scheduleRepeating("p", TimerPurpose::ActivityCheck, 100, [&timers, &count]() {
		if (++count == 2) {
			timers.cancel("p", TimerPurpose::ActivityCheck);
		}
	});

	loop.advance(1000);
	EXPECT_EQ(count, 2);
	EXPECT_EQ(timers.size(), 0u);
}

TEST_F(EventLoopTest, CancelAllClearsLoopTimers)
{
	{
		TimerTable timers(loop);
		timers.schedule("a", TimerPurpose::JoinRetry, 100, [this]() { fired.push_back("a"); });
		timers.schedule("b", TimerPurpose::JoinRetry, 100, [this]() { fired.push_back("b"); });
	}
	EXPECT_EQ(loop.pendingTimers(), 0u);
	loop.advance(500);
	EXPECT_TRUE(fired.empty());
}
