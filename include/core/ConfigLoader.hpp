#pragma once
/** @file  ConfigLoader.hpp
 *  @brief Loads run-time configuration (JSON) from the host FS.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace labcomm::core {

  /** Tunables for the drivers. Every field has a working default. */
  struct AppConfig {
    std::string logLevel{ "info" };

    struct {
      int maxAttempts{ 3 };
      int readTimeoutMs{ 1000 };
      int defaultBaudrate{ 115200 };
    } tc4820;

    std::vector<int> baudrates{ 9600, 19200, 38400, 57600, 115200 };

    double sensorPollInterval{ 60.0 }; ///< seconds; NaN = poll once
    double measureDuration{ 1.0 };     ///< dummy spectrometer, seconds

    struct {
      std::string host{ "127.0.0.1" };
      int port{ 50000 };
      double pollInterval{ 1.0 }; ///< seconds
      int timeoutMs{ 5000 };
    } ftsw500;
  };

  /// Overlay the keys present in @p j onto the defaults. Throws std::runtime_error.
  AppConfig parseConfig(const nlohmann::json& j);

  /**
 * @class ConfigLoader
 * @brief Thin helper that reads a JSON file and hands the parsed object to
 *        the caller.
 *
 *  * No caching — every call to `load()` re-reads the file (cheap, tiny file).
 *  * Schema checks live in `parseConfig()`.
 */
  class ConfigLoader {
  public:
    /// @param configPath  Absolute or relative path on the host FS.
    explicit ConfigLoader(std::string configPath);

    /// Parse the file into a nlohmann::json object or throw `std::runtime_error`.
    nlohmann::json load() const;

    /// `parseConfig(load())`
    AppConfig loadConfig() const;

  private:
    std::string path_;
  };

} // namespace labcomm::core
