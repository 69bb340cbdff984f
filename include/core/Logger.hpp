#pragma once
/** @file  Logger.hpp
 *  @brief Thread-safe levelled logger shared by drivers and the manager.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <mutex>
#include <string>

namespace labcomm {
  namespace core {

    enum class LogLevel { Debug, Info, Warning, Error };

    const char* toString(LogLevel level);

    /// Parse "debug" / "info" / "warning" / "error". Throws std::invalid_argument.
    LogLevel parseLogLevel(const std::string& text);

    /**
 * @class Logger
 * @brief Writes `[LEVEL] component: message` lines to a sink (stderr by default).
 *
 *  * Messages below the threshold are dropped before formatting reaches the sink.
 *  * The sink is swappable so tests can capture output.
 */
    class Logger {

    public:
      using Sink = std::function<void(LogLevel, const std::string& line)>;

      Logger(); ///< stderr sink
      explicit Logger(Sink sink);
      ~Logger() = default;

      // --- public API ---
      void log(LogLevel level, const std::string& component, const std::string& message);

      void debug(const std::string& component, const std::string& message) {
        log(LogLevel::Debug, component, message);
      }
      void info(const std::string& component, const std::string& message) {
        log(LogLevel::Info, component, message);
      }
      void warn(const std::string& component, const std::string& message) {
        log(LogLevel::Warning, component, message);
      }
      void error(const std::string& component, const std::string& message) {
        log(LogLevel::Error, component, message);
      }

      void setLevel(LogLevel level);
      LogLevel level() const;

    private:
      mutable std::mutex mtx_;
      Sink sink_;
      LogLevel threshold_{ LogLevel::Info };
    };

  } // namespace core
} // namespace labcomm
