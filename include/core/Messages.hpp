#pragma once
/** @file  Messages.hpp
 *  @brief Plain data exchanged between devices and the presentation layer.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace labcomm {
  namespace core {

    /** One physical quantity reported by a sensor. */
    struct SensorReading {
      std::string name;
      double value{ 0.0 };
      std::string unit;

      /// "<name> = <value> <unit>", six decimals
      std::string toString() const;
      /// "<value> <unit>", six decimals
      std::string valueString() const;

      bool operator==(const SensorReading&) const = default;
    };

    /** Spectrometer state; values match the status codes in the EM27 manual. */
    enum class SpectrometerStatus {
      Idle = 0,
      Connecting = 1,
      Connected = 2,
      Measuring = 3,
      Finishing = 4,
      Cancelling = 5,
      Undefined = 6,
    };

    const char* toString(SpectrometerStatus s);
    inline bool isConnected(SpectrometerStatus s) {
      const int v = static_cast<int>(s);
      return v >= 2 && v <= 5;
    }

    struct TemperatureProperties {
      double temperature{ 0.0 };
      int power{ 0 };
      int alarmStatus{ 0 };
      double setPoint{ 0.0 };

      bool operator==(const TemperatureProperties&) const = default;
    };

    /// description -> variant identifiers
    using PluginCatalog = std::map<std::string, std::set<std::string>>;

    //---message variants-----------------------------------------------

    struct CatalogMessage {
      PluginCatalog catalog;
    };

    struct ReadingsMessage {
      std::string topic;
      std::string tag{ "data" };
      std::vector<SensorReading> readings;
    };

    struct PropertiesMessage {
      std::string topic;
      TemperatureProperties properties;
    };

    struct StatusMessage {
      std::string topic;
      SpectrometerStatus status{ SpectrometerStatus::Undefined };
    };

    struct ErrorMessage {
      std::string topic;
      std::string message;
    };

    struct DeviceEventMessage {
      enum class Event { Opened, Closed };

      std::string instance;
      std::string identifier; ///< variant; empty for Closed
      Event event{ Event::Opened };
    };

    using Message = std::variant<CatalogMessage, ReadingsMessage, PropertiesMessage,
                                 StatusMessage, ErrorMessage, DeviceEventMessage>;

  } // namespace core
} // namespace labcomm
