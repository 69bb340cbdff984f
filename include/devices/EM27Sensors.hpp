#pragma once
/** @file  EM27Sensors.hpp
 *  @brief EM27 sensor table poller, fed by an external scraping client.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

#include "core/NoiseProducer.hpp"
#include "core/TaskWorker.hpp"
#include "devices/SensorsBase.hpp"

namespace labcomm::core {
  class Logger;
}

namespace labcomm::devices {

  /** Endpoint unreachable or the sensor table is missing from the page. */
  class SourceUnavailable : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  /**
 * @class SensorSource
 * @brief What the scraping client looks like from here. `fetch()` may block;
 *        it throws SourceUnavailable on any failure.
 */
  class SensorSource {
  public:
    virtual ~SensorSource() = default;
    virtual std::vector<core::SensorReading> fetch() = 0;
  };

  /**
 * @class DummyEM27Source
 * @brief Fixed PSF27 sensor table with seeded noise on every value.
 */
  class DummyEM27Source : public SensorSource {
  public:
    explicit DummyEM27Source(std::uint32_t seed = 42);
    std::vector<core::SensorReading> fetch() override;

  private:
    std::vector<core::SensorReading> baseline_;
    core::NoiseProducer noise_;
  };

  /**
 * @class EM27Sensors
 * @brief `requestReadings()` queues a fetch on a background worker and
 *        returns; the worker publishes the readings, or an ErrorMessage when
 *        the source is unavailable (no readings that cycle).
 *
 *  * At most one fetch is queued or running; ticks that arrive meanwhile are
 *    skipped.
 */
  class EM27Sensors : public SensorsBase {
  public:
    EM27Sensors(std::shared_ptr<core::MessageChannel> channel,
                std::shared_ptr<core::Scheduler> scheduler, std::shared_ptr<SensorSource> source,
                std::shared_ptr<core::Logger> logger, double pollInterval = kNoPolling,
                bool startPolling = true);
    ~EM27Sensors() override;

    void requestReadings() override;

    /// Stop polling, drop queued fetches and join the worker. Nothing is
    /// published after this returns.
    void close() override;

    /// Block until queued fetches are done. For one-shot callers and tests.
    void waitIdle() { worker_.waitIdle(); }

  private:
    void fetchAndPublish();

    std::shared_ptr<SensorSource> source_;
    std::shared_ptr<core::Logger> logger_;
    std::atomic<bool> closed_{ false };
    std::atomic<bool> fetchPending_{ false };
    core::TaskWorker worker_;
  };

} // namespace labcomm::devices
