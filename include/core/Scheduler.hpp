#pragma once
/** @file  Scheduler.hpp
 *  @brief Timer interface (arm / cancel by handle) used by polling devices.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <cstdint>
#include <functional>

namespace labcomm::core {

  enum class TimerMode { Repeating, SingleShot };

  /**
 * @class Scheduler
 * @brief Abstract timer source. Production code uses LoopScheduler; tests
 *        inject a fake they can fire by hand.
 */
  class Scheduler {
  public:
    using Handle = std::uint64_t; ///< 0 is never a valid handle
    using Callback = std::function<void()>;

    static constexpr Handle kNoTimer = 0;

    virtual ~Scheduler() = default;

    /// Throws std::invalid_argument if @p period is not positive.
    virtual Handle arm(std::chrono::milliseconds period, TimerMode mode, Callback cb) = 0;

    /**
     * Disarm @p handle. Unknown handles are ignored. Once this returns the
     * callback will not start again, and a run already in progress on another
     * thread has finished.
     */
    virtual void cancel(Handle handle) = 0;

    virtual bool isArmed(Handle handle) const = 0;
  };

} // namespace labcomm::core
