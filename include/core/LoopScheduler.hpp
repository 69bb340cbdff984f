#pragma once
/** @file  LoopScheduler.hpp
 *  @brief Cooperative single-thread timer loop.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include "core/Scheduler.hpp"

namespace labcomm::core {

  /**
 * @class LoopScheduler
 * @brief Runs timer callbacks on whichever thread calls `run()` / `runFor()`.
 *
 *  * `arm()`, `cancel()` and `stop()` may be called from any thread.
 *  * A repeating timer that falls behind skips the missed periods instead of
 *    firing in a burst.
 *  * An exception thrown by a callback propagates out of `run()`.
 */
  class LoopScheduler : public Scheduler {
  public:
    LoopScheduler() = default;
    ~LoopScheduler() override = default;

    Handle arm(std::chrono::milliseconds period, TimerMode mode, Callback cb) override;
    void cancel(Handle handle) override;
    bool isArmed(Handle handle) const override;

    void run(); ///< until stop()
    void runFor(std::chrono::milliseconds duration);
    void stop();

    LoopScheduler(const LoopScheduler&) = delete;
    LoopScheduler& operator=(const LoopScheduler&) = delete;

  private:
    using Clock = std::chrono::steady_clock;

    struct Timer {
      std::chrono::milliseconds period;
      TimerMode mode;
      Clock::time_point due;
      Callback cb;
    };

    void loop(bool bounded, Clock::time_point deadline);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<Handle, Timer> timers_;
    Handle next_{ 1 };
    Handle dispatching_{ kNoTimer }; ///< timer whose callback is running
    std::thread::id loopThread_{};
    std::atomic<bool> stopRequested_{ false };
  };

} // namespace labcomm::core
