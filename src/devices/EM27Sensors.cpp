/* @file EM27Sensors.cpp
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <stdexcept>

// labcomm headers
#include "core/Logger.hpp"
#include "devices/EM27Sensors.hpp"

namespace labcomm::devices {

  namespace {
    constexpr const char* kComponent = "EM27Sensors";
  }

  //---DummyEM27Source-----------------------------------------------------

  DummyEM27Source::DummyEM27Source(std::uint32_t seed)
      : baseline_{ { "PSF27_TEMP", 26.5, "deg. C" },
                   { "PSF27_HUMIDITY", 36.2, "%" },
                   { "PSF27_PRESSURE", 1009.3, "hPa" },
                   { "PSF27_HEATER", 1.0, "V" } },
        noise_(core::NoiseParameters{ 0.0, 0.05, seed }) {}

  std::vector<core::SensorReading> DummyEM27Source::fetch() {
    auto readings = baseline_;
    for (auto& r : readings)
      r.value += noise_();
    return readings;
  }

  //---EM27Sensors---------------------------------------------------------

  EM27Sensors::EM27Sensors(std::shared_ptr<core::MessageChannel> channel,
                           std::shared_ptr<core::Scheduler> scheduler,
                           std::shared_ptr<SensorSource> source,
                           std::shared_ptr<core::Logger> logger, double pollInterval,
                           bool startPolling)
      : SensorsBase(std::move(channel), std::move(scheduler), pollInterval, startPolling),
        source_(std::move(source)), logger_(std::move(logger)),
        worker_([this](const std::string& what) {
          logger_->error(kComponent, what);
          publishError(what);
        }) {
    if (!source_)
      throw std::invalid_argument("[EM27Sensors] sensor source is nullptr");
    assert(logger_ && "[EM27Sensors] logger is nullptr");
  }

  EM27Sensors::~EM27Sensors() { EM27Sensors::close(); }

  void EM27Sensors::requestReadings() {
    if (closed_)
      return;
    if (fetchPending_.exchange(true)) {
      logger_->debug(kComponent, "previous fetch still pending; skipping this cycle");
      return;
    }
    if (!worker_.post([this] { fetchAndPublish(); }))
      fetchPending_ = false;
  }

  void EM27Sensors::close() {
    closed_ = true;
    SensorsBase::close();
    worker_.stop();
  }

  void EM27Sensors::fetchAndPublish() {
    // cleared on every exit, a throwing fetch included
    struct PendingGuard {
      std::atomic<bool>& flag;
      ~PendingGuard() { flag = false; }
    } pending{ fetchPending_ };

    std::vector<core::SensorReading> readings;
    try {
      readings = source_->fetch();
    } catch (const SourceUnavailable& e) {
      logger_->warn(kComponent, std::string("sensor data unavailable: ") + e.what());
      if (!closed_)
        publishError(e.what());
      return;
    }

    if (!closed_)
      sendReadingsMessage(std::move(readings));
  }

} // namespace labcomm::devices
