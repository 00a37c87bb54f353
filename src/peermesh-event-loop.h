/*
 * PeerMesh
 * Single-actor event loop and scheduled task table
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "peermesh-common.h"

namespace peermesh
{

// Runs posted tasks and timers one at a time on the thread that drives it.
// post() may be called from any thread; everything else belongs to the driving thread.
class EventLoop
{
public:
	using Task = std::function<void()>;
	using TaskId = uint64_t;

	enum class ClockMode { RealTime, Manual };

	explicit EventLoop(ClockMode mode = ClockMode::RealTime);
	~EventLoop();

	EventLoop(const EventLoop &) = delete;
	EventLoop &operator=(const EventLoop &) = delete;

	void post(Task task);
	TaskId schedule(int64_t delayMs, Task task);
	bool cancel(TaskId id);

	int64_t now() const;

	// Run queued tasks and due timers, without blocking. Returns the number of tasks run.
	size_t runPending();

	// Real-time mode: block and process until stop() is called
	void run();
	void stop();
	bool isRunning() const { return running_; }

	// Manual mode: move the clock forward, firing timers in due order
	void advance(int64_t ms);

	size_t pendingTimers() const;
	size_t pendingTasks() const;

private:
	bool popReady(Task &task, int64_t now);
	int64_t clockNow() const;

	const ClockMode mode_;
	mutable std::mutex mutex_;
	std::condition_variable cv_;
	std::deque<Task> tasks_;
	std::map<std::pair<int64_t, TaskId>, Task> timers_;
	std::map<TaskId, int64_t> dueById_;
	TaskId nextId_ = 1;
	int64_t manualNow_ = 0;
	std::atomic<bool> running_{false};
};

// Scheduled tasks keyed by (peer, purpose). Scheduling a pending key cancels the earlier task.
class TimerTable
{
public:
	explicit TimerTable(EventLoop &loop);
	~TimerTable();

	TimerTable(const TimerTable &) = delete;
	TimerTable &operator=(const TimerTable &) = delete;

	void schedule(const std::string &peerId, TimerPurpose purpose, int64_t delayMs, EventLoop::Task task);
	void scheduleRepeating(const std::string &peerId, TimerPurpose purpose, int64_t intervalMs,
	                       EventLoop::Task task);

	bool cancel(const std::string &peerId, TimerPurpose purpose);
	size_t cancelPeer(const std::string &peerId);
	void cancelAll();

	bool isPending(const std::string &peerId, TimerPurpose purpose) const;
	size_t size() const { return entries_.size(); }

private:
	using Key = std::pair<std::string, TimerPurpose>;

	struct Entry {
		uint64_t token = 0;
		EventLoop::TaskId loopId = 0;
	};

	void arm(const Key &key, uint64_t token, int64_t delayMs, EventLoop::Task task, bool repeating);

	EventLoop &loop_;
	std::map<Key, Entry> entries_;
	uint64_t nextToken_ = 1;
};

} // namespace peermesh
