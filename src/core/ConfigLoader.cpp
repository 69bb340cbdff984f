/* @file ConfigLoader.cpp
 * @brief JSON config file -> AppConfig
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <fstream>
#include <limits>
#include <stdexcept>

// third-party headers
#include <nlohmann/json.hpp>

// labcomm headers
#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"
#include "io/SerialChannel.hpp"

namespace labcomm::core {

  namespace {
    template <typename T> T get(const nlohmann::json& obj, const char* key, T fallback) {
      if (!obj.contains(key))
        return fallback;
      try {
        return obj.at(key).get<T>();
      } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error(std::string("[ConfigLoader] bad value for '") + key +
                                 "': " + e.what());
      }
    }

    void requirePositive(int value, const char* key) {
      if (value < 1)
        throw std::runtime_error(std::string("[ConfigLoader] '") + key + "' must be >= 1");
    }
  } // namespace

  AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig cfg;
    if (!j.is_object())
      throw std::runtime_error("[ConfigLoader] top level must be a JSON object");

    cfg.logLevel = get(j, "log_level", cfg.logLevel);
    try {
      parseLogLevel(cfg.logLevel);
    } catch (const std::invalid_argument& e) {
      throw std::runtime_error(e.what());
    }

    if (j.contains("tc4820")) {
      const auto& tc = j.at("tc4820");
      cfg.tc4820.maxAttempts = get(tc, "max_attempts", cfg.tc4820.maxAttempts);
      cfg.tc4820.readTimeoutMs = get(tc, "read_timeout_ms", cfg.tc4820.readTimeoutMs);
      cfg.tc4820.defaultBaudrate = get(tc, "default_baudrate", cfg.tc4820.defaultBaudrate);
      requirePositive(cfg.tc4820.maxAttempts, "tc4820.max_attempts");
      requirePositive(cfg.tc4820.readTimeoutMs, "tc4820.read_timeout_ms");
    }

    cfg.baudrates = get(j, "baudrates", cfg.baudrates);
    if (cfg.baudrates.empty())
      throw std::runtime_error("[ConfigLoader] 'baudrates' must not be empty");
    for (int baud : cfg.baudrates) {
      try {
        io::toSpeed(baud);
      } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("[ConfigLoader] ") + e.what());
      }
    }

    bool defaultListed = false;
    for (int baud : cfg.baudrates)
      defaultListed = defaultListed || baud == cfg.tc4820.defaultBaudrate;
    if (!defaultListed)
      throw std::runtime_error("[ConfigLoader] tc4820.default_baudrate not in 'baudrates'");

    if (j.contains("sensors")) {
      const auto& sensors = j.at("sensors");
      // null means "poll once"
      if (sensors.contains("poll_interval") && sensors.at("poll_interval").is_null())
        cfg.sensorPollInterval = std::numeric_limits<double>::quiet_NaN();
      else
        cfg.sensorPollInterval = get(sensors, "poll_interval", cfg.sensorPollInterval);
      if (cfg.sensorPollInterval <= 0.0)
        throw std::runtime_error("[ConfigLoader] 'sensors.poll_interval' must be positive");
    }

    if (j.contains("spectrometer")) {
      cfg.measureDuration = get(j.at("spectrometer"), "measure_duration", cfg.measureDuration);
      if (!(cfg.measureDuration > 0.0))
        throw std::runtime_error("[ConfigLoader] 'spectrometer.measure_duration' must be positive");
    }

    if (j.contains("ftsw500")) {
      const auto& ftsw = j.at("ftsw500");
      cfg.ftsw500.host = get(ftsw, "host", cfg.ftsw500.host);
      cfg.ftsw500.port = get(ftsw, "port", cfg.ftsw500.port);
      cfg.ftsw500.pollInterval = get(ftsw, "poll_interval", cfg.ftsw500.pollInterval);
      cfg.ftsw500.timeoutMs = get(ftsw, "timeout_ms", cfg.ftsw500.timeoutMs);
      requirePositive(cfg.ftsw500.timeoutMs, "ftsw500.timeout_ms");
      if (cfg.ftsw500.port < 1 || cfg.ftsw500.port > 65535)
        throw std::runtime_error("[ConfigLoader] 'ftsw500.port' must be in 1..65535");
      if (!(cfg.ftsw500.pollInterval > 0.0))
        throw std::runtime_error("[ConfigLoader] 'ftsw500.poll_interval' must be positive");
    }

    return cfg;
  }

  ConfigLoader::ConfigLoader(std::string configPath) : path_(std::move(configPath)) {}

  nlohmann::json ConfigLoader::load() const {
    std::ifstream in(path_);
    if (!in)
      throw std::runtime_error("[ConfigLoader] cannot open " + path_);

    try {
      return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("[ConfigLoader] " + path_ + ": " + e.what());
    }
  }

  AppConfig ConfigLoader::loadConfig() const { return parseConfig(load()); }

} // namespace labcomm::core
