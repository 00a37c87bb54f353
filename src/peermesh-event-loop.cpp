/*
 * PeerMesh
 * Single-actor event loop and scheduled task table
 */

#include "peermesh-event-loop.h"

#include <chrono>
#include <memory>

#include "peermesh-utils.h"

namespace peermesh
{

EventLoop::EventLoop(ClockMode mode) : mode_(mode) {}

EventLoop::~EventLoop()
{
	stop();
}

int64_t EventLoop::clockNow() const
{
	if (mode_ == ClockMode::Manual) {
		return manualNow_;
	}
	using namespace std::chrono;
	return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

int64_t EventLoop::now() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return clockNow();
}

void EventLoop::post(Task task)
{
	if (!task) {
		return;
	}
	{
		std::lock_guard<std::mutex> lock(mutex_);
		tasks_.push_back(std::move(task));
	}
	cv_.notify_one();
}

EventLoop::TaskId EventLoop::schedule(int64_t delayMs, Task task)
{
	TaskId id = 0;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		id = nextId_++;
		const int64_t due = clockNow() + (delayMs < 0 ? 0 : delayMs);
		timers_.emplace(std::make_pair(due, id), std::move(task));
		dueById_[id] = due;
	}
	cv_.notify_one();
	return id;
}

bool EventLoop::cancel(TaskId id)
{
	std::lock_guard<std::mutex> lock(mutex_);
	auto it = dueById_.find(id);
	if (it == dueById_.end()) {
		return false;
	}
	timers_.erase(std::make_pair(it->second, id));
	dueById_.erase(it);
	return true;
}

bool EventLoop::popReady(Task &task, int64_t now)
{
	std::lock_guard<std::mutex> lock(mutex_);
	if (!tasks_.empty()) {
		task = std::move(tasks_.front());
		tasks_.pop_front();
		return true;
	}

	auto it = timers_.begin();
	if (it != timers_.end() && it->first.first <= now) {
		task = std::move(it->second);
		dueById_.erase(it->first.second);
		timers_.erase(it);
		return true;
	}
	return false;
}

size_t EventLoop::runPending()
{
	size_t count = 0;
	Task task;
	while (popReady(task, now())) {
		try {
			task();
		} catch (const std::exception &e) {
			logError("Event loop task threw: %s", e.what());
		}
		task = nullptr;
		count++;
	}
	return count;
}

void EventLoop::run()
{
	running_ = true;
	while (running_) {
		runPending();

		std::unique_lock<std::mutex> lock(mutex_);
		if (!running_) {
			break;
		}
		if (!tasks_.empty()) {
			continue;
		}
		if (timers_.empty()) {
			cv_.wait(lock, [this] { return !tasks_.empty() || !timers_.empty() || !running_; });
		} else {
			const int64_t wait = timers_.begin()->first.first - clockNow();
			if (wait > 0) {
				cv_.wait_for(lock, std::chrono::milliseconds(wait),
				             [this] { return !tasks_.empty() || !running_; });
			}
		}
	}
}

void EventLoop::stop()
{
	{
		std::lock_guard<std::mutex> lock(mutex_);
		running_ = false;
	}
	cv_.notify_all();
}

void EventLoop::advance(int64_t ms)
{
	int64_t target = 0;
	{
		std::lock_guard<std::mutex> lock(mutex_);
		target = manualNow_ + (ms < 0 ? 0 : ms);
	}

	runPending();
	while (true) {
		{
			std::lock_guard<std::mutex> lock(mutex_);
			auto it = timers_.begin();
			if (it == timers_.end() || it->first.first > target) {
				manualNow_ = target;
				break;
			}
			if (it->first.first > manualNow_) {
				manualNow_ = it->first.first;
			}
		}
		runPending();
	}
	runPending();
}

size_t EventLoop::pendingTimers() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return timers_.size();
}

size_t EventLoop::pendingTasks() const
{
	std::lock_guard<std::mutex> lock(mutex_);
	return tasks_.size();
}

TimerTable::TimerTable(EventLoop &loop) : loop_(loop) {}

TimerTable::~TimerTable()
{
	cancelAll();
}

void TimerTable::arm(const Key &key, uint64_t token, int64_t delayMs, EventLoop::Task task, bool repeating)
{
	auto shared = std::make_shared<EventLoop::Task>(std::move(task));
	const EventLoop::TaskId loopId = loop_.schedule(delayMs, [this, key, token, delayMs, shared, repeating]() {
		auto it = entries_.find(key);
		if (it == entries_.end() || it->second.token != token) {
			return;
		}
		if (!repeating) {
			entries_.erase(it);
		}

		(*shared)();

		if (repeating) {
			auto current = entries_.find(key);
			if (current != entries_.end() && current->second.token == token) {
				arm(key, token, delayMs, *shared, true);
			}
		}
	});
	entries_[key] = Entry{token, loopId};
}

void TimerTable::schedule(const std::string &peerId, TimerPurpose purpose, int64_t delayMs, EventLoop::Task task)
{
	const Key key(peerId, purpose);
	cancel(peerId, purpose);
	arm(key, nextToken_++, delayMs, std::move(task), false);
}

void TimerTable::scheduleRepeating(const std::string &peerId, TimerPurpose purpose, int64_t intervalMs,
                                   EventLoop::Task task)
{
	const Key key(peerId, purpose);
	cancel(peerId, purpose);
	arm(key, nextToken_++, intervalMs, std::move(task), true);
}

bool TimerTable::cancel(const std::string &peerId, TimerPurpose purpose)
{
	auto it = entries_.find(Key(peerId, purpose));
	if (it == entries_.end()) {
		return false;
	}
	loop_.cancel(it->second.loopId);
	entries_.erase(it);
	return true;
}

size_t TimerTable::cancelPeer(const std::string &peerId)
{
	size_t count = 0;
	auto it = entries_.begin();
	while (it != entries_.end()) {
		if (it->first.first == peerId) {
			loop_.cancel(it->second.loopId);
			it = entries_.erase(it);
			count++;
		} else {
			++it;
		}
	}
	return count;
}

void TimerTable::cancelAll()
{
	for (const auto &pair : entries_) {
		loop_.cancel(pair.second.loopId);
	}
	entries_.clear();
}

bool TimerTable::isPending(const std::string &peerId, TimerPurpose purpose) const
{
	return entries_.find(Key(peerId, purpose)) != entries_.end();
}

} // namespace peermesh
