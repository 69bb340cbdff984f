/* @file Logger.cpp
 * @brief levelled stderr logger
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <iostream>
#include <stdexcept>

// labcomm headers
#include "core/Logger.hpp"

namespace labcomm {
  namespace core {

    const char* toString(LogLevel level) {
      switch (level) {
      case LogLevel::Debug:
        return "DEBUG";
      case LogLevel::Info:
        return "INFO";
      case LogLevel::Warning:
        return "WARN";
      case LogLevel::Error:
        return "ERROR";
      default:
        return "?";
      }
    }

    LogLevel parseLogLevel(const std::string& text) {
      if (text == "debug")
        return LogLevel::Debug;
      if (text == "info")
        return LogLevel::Info;
      if (text == "warning" || text == "warn")
        return LogLevel::Warning;
      if (text == "error")
        return LogLevel::Error;
      throw std::invalid_argument("[Logger] unknown log level: " + text);
    }

    Logger::Logger()
        : sink_([](LogLevel, const std::string& line) { std::cerr << line << '\n'; }) {}

    Logger::Logger(Sink sink) : sink_(std::move(sink)) {}

    void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
      std::lock_guard lock(mtx_);
      if (level < threshold_ || !sink_)
        return;

      std::string line = "[";
      line += toString(level);
      line += "] ";
      line += component;
      line += ": ";
      line += message;
      sink_(level, line);
    }

    void Logger::setLevel(LogLevel level) {
      std::lock_guard lock(mtx_);
      threshold_ = level;
    }

    LogLevel Logger::level() const {
      std::lock_guard lock(mtx_);
      return threshold_;
    }

  } // namespace core
} // namespace labcomm
