/* @file LoopScheduler.cpp
 * @brief cooperative timer loop; callbacks run on the loop thread
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// labcomm headers
#include "core/LoopScheduler.hpp"

using namespace labcomm::core;

Scheduler::Handle LoopScheduler::arm(std::chrono::milliseconds period, TimerMode mode,
                                     Callback cb) {
  if (period.count() <= 0)
    throw std::invalid_argument("[LoopScheduler] timer period must be positive");
  if (!cb)
    throw std::invalid_argument("[LoopScheduler] timer callback is empty");

  std::lock_guard lock(mtx_);
  const Handle handle = next_++;
  timers_.emplace(handle, Timer{ period, mode, Clock::now() + period, std::move(cb) });
  cv_.notify_all();
  return handle;
}

void LoopScheduler::cancel(Handle handle) {
  std::unique_lock lock(mtx_);
  timers_.erase(handle);

  // from another thread: wait out a callback that is already running
  if (std::this_thread::get_id() != loopThread_)
    cv_.wait(lock, [&] { return dispatching_ != handle; });

  cv_.notify_all();
}

bool LoopScheduler::isArmed(Handle handle) const {
  std::lock_guard lock(mtx_);
  return timers_.count(handle) != 0;
}

void LoopScheduler::run() { loop(false, Clock::time_point{}); }

void LoopScheduler::runFor(std::chrono::milliseconds duration) {
  loop(true, Clock::now() + duration);
}

void LoopScheduler::stop() {
  stopRequested_ = true;
  std::lock_guard lock(mtx_);
  cv_.notify_all();
}

void LoopScheduler::loop(bool bounded, Clock::time_point deadline) {
  std::unique_lock lock(mtx_);
  loopThread_ = std::this_thread::get_id();

  while (!stopRequested_) {
    const auto now = Clock::now();
    if (bounded && now >= deadline)
      break;

    auto next = timers_.end();
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
      if (next == timers_.end() || it->second.due < next->second.due)
        next = it;
    }

    if (next == timers_.end()) {
      if (bounded)
        cv_.wait_until(lock, deadline);
      else
        cv_.wait(lock);
      continue;
    }

    if (next->second.due > now) {
      auto wake = next->second.due;
      if (bounded && deadline < wake)
        wake = deadline;
      cv_.wait_until(lock, wake);
      continue;
    }

    const Handle handle = next->first;
    Callback cb = next->second.cb;
    if (next->second.mode == TimerMode::Repeating) {
      auto& timer = next->second;
      timer.due += timer.period;
      if (timer.due <= now)
        timer.due = now + timer.period; // fell behind: skip, don't burst
    } else {
      timers_.erase(next);
    }

    dispatching_ = handle;
    lock.unlock();
    try {
      cb();
    } catch (...) {
      lock.lock();
      dispatching_ = kNoTimer;
      loopThread_ = std::thread::id{};
      stopRequested_ = false;
      cv_.notify_all();
      throw;
    }
    lock.lock();
    dispatching_ = kNoTimer;
    cv_.notify_all();
  }

  // cleared on exit, so a stop() issued before run() still ends it
  loopThread_ = std::thread::id{};
  stopRequested_ = false;
}
