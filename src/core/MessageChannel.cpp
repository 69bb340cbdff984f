/* @file MessageChannel.cpp
 * @brief subscriber bookkeeping + fan-out
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <vector>

// labcomm headers
#include "core/MessageChannel.hpp"

using namespace labcomm::core;

MessageChannel::Token MessageChannel::subscribe(Subscriber fn) {
  std::lock_guard lock(mtx_);
  const Token token = next_++;
  subscribers_.emplace(token, std::move(fn));
  return token;
}

void MessageChannel::unsubscribe(Token token) {
  std::lock_guard lock(mtx_);
  subscribers_.erase(token);
}

void MessageChannel::publish(const Message& msg) const {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard lock(mtx_);
    snapshot.reserve(subscribers_.size());
    for (const auto& [token, fn] : subscribers_)
      snapshot.push_back(fn);
  }

  for (const auto& fn : snapshot)
    fn(msg);
}

//---Messages.hpp helpers-------------------------------------------------

namespace labcomm::core {

  std::string SensorReading::valueString() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.6f", value);
    return std::string(buf) + " " + unit;
  }

  std::string SensorReading::toString() const { return name + " = " + valueString(); }

  const char* toString(SpectrometerStatus s) {
    switch (s) {
    case SpectrometerStatus::Idle:
      return "Idle";
    case SpectrometerStatus::Connecting:
      return "Connecting";
    case SpectrometerStatus::Connected:
      return "Connected";
    case SpectrometerStatus::Measuring:
      return "Measuring";
    case SpectrometerStatus::Finishing:
      return "Finishing current measurement";
    case SpectrometerStatus::Cancelling:
      return "Cancelling";
    default:
      return "Undefined";
    }
  }

} // namespace labcomm::core
