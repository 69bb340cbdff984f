#pragma once
/** @file  BuiltinDevices.hpp
 *  @brief Explicit registration of every driver variant shipped here.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

namespace labcomm::core {
  class DeviceRegistry;
  struct AppConfig;
} // namespace labcomm::core

namespace labcomm::devices {

  /**
   * Register the built-in variants into @p registry:
   *  * "Temperature controller": tc4820, dummy_temperature_controller
   *  * "Sensor devices": dummy_em27_sensors
   *  * "Spectrometer": dummy_spectrometer, ftsw500
   *
   * Idempotent: variants already present are left alone.
   * @returns the number of variants newly added.
   */
  int registerBuiltinDevices(core::DeviceRegistry& registry, const core::AppConfig& config);

} // namespace labcomm::devices
