/* @file BuiltinDevices.cpp
 * @brief the fixed list of driver variants and their creators
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// labcomm headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceRegistry.hpp"
#include "devices/BuiltinDevices.hpp"
#include "devices/DummySpectrometer.hpp"
#include "devices/DummyTemperatureController.hpp"
#include "devices/EM27Sensors.hpp"
#include "devices/FTSW500.hpp"
#include "devices/TC4820.hpp"
#include "io/SerialChannel.hpp"
#include "io/TcpChannel.hpp"

namespace labcomm::devices {

  using core::DeviceContext;
  using core::DeviceParameter;
  using core::DeviceParams;
  using core::DeviceType;
  using core::DeviceVariant;

  namespace {

    std::string formatSeconds(double seconds) {
      std::ostringstream os;
      os << seconds;
      return os.str();
    }

    double parseSeconds(const DeviceParams& params, const std::string& key) {
      const auto& text = params.at(key);
      try {
        std::size_t used = 0;
        const double value = std::stod(text, &used);
        if (used != text.size())
          throw std::invalid_argument(text);
        return value;
      } catch (const std::logic_error&) {
        throw std::invalid_argument("Parameter " + key + " is not a number: " + text);
      }
    }

    int parseInteger(const DeviceParams& params, const std::string& key) {
      const auto& text = params.at(key);
      try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size())
          throw std::invalid_argument(text);
        return value;
      } catch (const std::logic_error&) {
        throw std::invalid_argument("Parameter " + key + " is not an integer: " + text);
      }
    }

    std::chrono::milliseconds toMillis(double seconds, const std::string& key) {
      const auto ms = std::llround(seconds * 1000.0);
      if (!std::isfinite(seconds) || ms <= 0)
        throw std::invalid_argument("Parameter " + key + " must be positive");
      return std::chrono::milliseconds(ms);
    }

    DeviceParameter nameParameter() {
      return DeviceParameter(
          "name", std::vector<std::string>(kControllerNames.begin(), kControllerNames.end()),
          std::string(kControllerNames.front()));
    }

    DeviceVariant tc4820Variant(const core::AppConfig& config) {
      std::vector<std::string> baudrates;
      for (int baud : config.baudrates)
        baudrates.push_back(std::to_string(baud));

      // free-form; default to the first USB serial port if there is one
      const auto ports = io::listSerialPorts();
      std::optional<std::string> defaultPort;
      if (!ports.empty())
        defaultPort = ports.front();

      DeviceType type{ kTemperatureControllerDescription,
                       { nameParameter(), DeviceParameter("port", {}, defaultPort),
                         DeviceParameter("baudrate", baudrates,
                                         std::to_string(config.tc4820.defaultBaudrate)) } };

      auto create = [](const DeviceParams& params, const DeviceContext& ctx) -> std::unique_ptr<Device> {
        const auto& port = params.at("port");
        const speed_t baud = io::toSpeed(std::stoi(params.at("baudrate")));

        auto serial = std::make_unique<io::SerialChannel>();
        if (!serial->open(port, baud))
          throw io::SerialError("[TC4820] serial device: " + port + " open failed");

        return std::make_unique<TC4820>(ctx.channel, params.at("name"), std::move(serial),
                                        ctx.logger, ctx.config.tc4820.maxAttempts,
                                        std::chrono::milliseconds(ctx.config.tc4820.readTimeoutMs));
      };

      return DeviceVariant{ "tc4820", "TC4820", std::move(type), std::move(create) };
    }

    DeviceVariant dummyTemperatureVariant() {
      DeviceType type{ kTemperatureControllerDescription, { nameParameter() } };
      auto create = [](const DeviceParams& params, const DeviceContext& ctx) -> std::unique_ptr<Device> {
        return std::make_unique<DummyTemperatureController>(ctx.channel, params.at("name"));
      };
      return DeviceVariant{ "dummy_temperature_controller", "Dummy temperature controller",
                            std::move(type), std::move(create) };
    }

    DeviceVariant dummyEM27Variant(const core::AppConfig& config) {
      DeviceType type{ kSensorsDescription,
                       { DeviceParameter("poll_interval", {},
                                         formatSeconds(config.sensorPollInterval)) } };
      auto create = [](const DeviceParams& params, const DeviceContext& ctx) -> std::unique_ptr<Device> {
        return std::make_unique<EM27Sensors>(ctx.channel, ctx.scheduler,
                                             std::make_shared<DummyEM27Source>(), ctx.logger,
                                             parseSeconds(params, "poll_interval"));
      };
      return DeviceVariant{ "dummy_em27_sensors", "Dummy EM27 sensors", std::move(type),
                            std::move(create) };
    }

    DeviceVariant dummySpectrometerVariant(const core::AppConfig& config) {
      DeviceType type{ kSpectrometerDescription,
                       { DeviceParameter("measure_duration", {},
                                         formatSeconds(config.measureDuration)) } };
      auto create = [](const DeviceParams& params, const DeviceContext& ctx) -> std::unique_ptr<Device> {
        return std::make_unique<DummySpectrometer>(ctx.channel, ctx.scheduler, ctx.logger,
                                                   parseSeconds(params, "measure_duration"));
      };
      return DeviceVariant{ "dummy_spectrometer", "Dummy spectrometer", std::move(type),
                            std::move(create) };
    }

    DeviceVariant ftsw500Variant(const core::AppConfig& config) {
      DeviceType type{ kSpectrometerDescription,
                       { DeviceParameter("host", {}, config.ftsw500.host),
                         DeviceParameter("port", {}, std::to_string(config.ftsw500.port)),
                         DeviceParameter("poll_interval", {},
                                         formatSeconds(config.ftsw500.pollInterval)) } };

      auto create = [](const DeviceParams& params, const DeviceContext& ctx) -> std::unique_ptr<Device> {
        const auto& host = params.at("host");
        const int port = parseInteger(params, "port");
        if (port < 1 || port > 65535)
          throw std::invalid_argument("Parameter port is not a TCP port: " + params.at("port"));

        auto link = std::make_unique<io::TcpChannel>();
        if (!link->connect(host, static_cast<std::uint16_t>(port),
                           std::chrono::milliseconds(ctx.config.ftsw500.timeoutMs)))
          throw FTSW500Error("[FTSW500] could not connect to " + host + ":" + params.at("port"));

        return std::make_unique<FTSW500>(ctx.channel, ctx.scheduler, std::move(link), ctx.logger,
                                         toMillis(parseSeconds(params, "poll_interval"),
                                                  "poll_interval"),
                                         std::chrono::milliseconds(ctx.config.ftsw500.timeoutMs));
      };
      return DeviceVariant{ "ftsw500", "FTSW500 spectrometer", std::move(type), std::move(create) };
    }

  } // namespace

  int registerBuiltinDevices(core::DeviceRegistry& registry, const core::AppConfig& config) {
    int added = 0;
    for (auto& variant : { tc4820Variant(config), dummyTemperatureVariant(),
                           dummyEM27Variant(config), dummySpectrometerVariant(config),
                           ftsw500Variant(config) }) {
      if (registry.registerVariant(variant))
        ++added;
    }
    return added;
  }

} // namespace labcomm::devices
