#pragma once
/** @file  DeviceManager.hpp
 *  @brief Owns the open devices and mediates between registry and callers.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <map>
#include <memory>
#include <string>
#include <vector>

// labcomm headers
#include "core/DeviceRegistry.hpp"

namespace labcomm::devices {
  class Device;
}

namespace labcomm::core {

  class ErrorMonitor;

  /**
 * @class DeviceManager
 * @brief Open / replace / close devices by instance name.
 *
 *  * Every open and close is announced as a DeviceEventMessage.
 *  * Failures to open are reported through the ErrorMonitor and rethrown.
 *  * Failures to close are reported only; the device is dropped regardless.
 *  * Not thread-safe: drive it from the scheduler's loop thread.
 */
  class DeviceManager {
  public:
    DeviceManager(std::shared_ptr<const DeviceRegistry> registry, DeviceContext context,
                  std::shared_ptr<ErrorMonitor> errorMonitor);
    ~DeviceManager(); ///< closeAll()

    //---public API---------------------------------------------------------
    void initialize(); ///< publish the catalog

    /// Returns the new device, owned by the manager.
    devices::Device& openDevice(const std::string& instance, const std::string& identifier,
                                const DeviceParams& params = {});
    void closeDevice(const std::string& instance);
    void closeAll();

    /// nullptr if no device is open under @p instance.
    devices::Device* device(const std::string& instance) const;

    /// Like device(), but cast to the expected driver type (nullptr on mismatch).
    template <typename T> T* deviceAs(const std::string& instance) const {
      return dynamic_cast<T*>(device(instance));
    }

    std::vector<std::string> openInstances() const;

    DeviceManager(const DeviceManager&) = delete;
    DeviceManager& operator=(const DeviceManager&) = delete;

  private:
    void shutDown(const std::string& instance, devices::Device& dev);

    std::shared_ptr<const DeviceRegistry> registry_;
    DeviceContext context_;
    std::shared_ptr<ErrorMonitor> errorMonitor_;
    std::map<std::string, std::unique_ptr<devices::Device>> devices_;
  };

} // namespace labcomm::core
