/* @file DeviceManager.cpp
 * @brief instance table on top of the registry; lifecycle events and fault reporting
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cassert>
#include <stdexcept>

// labcomm headers
#include "core/DeviceManager.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/MessageChannel.hpp"
#include "devices/Device.hpp"

using namespace labcomm::core;

namespace {
  constexpr const char* kComponent = "DeviceManager";

  std::string managerTopic(const std::string& instance) { return "device_manager." + instance; }
} // namespace

DeviceManager::DeviceManager(std::shared_ptr<const DeviceRegistry> registry,
                             DeviceContext context, std::shared_ptr<ErrorMonitor> errorMonitor)
    : registry_(std::move(registry)), context_(std::move(context)),
      errorMonitor_(std::move(errorMonitor)) {
  if (!registry_)
    throw std::invalid_argument("[DeviceManager] registry is nullptr");
  if (!context_.channel)
    throw std::invalid_argument("[DeviceManager] message channel is nullptr");
  assert(context_.logger && "[DeviceManager] logger is nullptr");
  assert(errorMonitor_ && "[DeviceManager] error monitor is nullptr");
}

DeviceManager::~DeviceManager() { closeAll(); }

void DeviceManager::initialize() {
  context_.logger->debug(kComponent, std::to_string(registry_->size()) +
                                         " device variants registered");
  registry_->publishCatalog(*context_.channel);
}

labcomm::devices::Device& DeviceManager::openDevice(const std::string& instance,
                                                    const std::string& identifier,
                                                    const DeviceParams& params) {
  closeDevice(instance);

  std::unique_ptr<devices::Device> dev;
  try {
    dev = registry_->create(identifier, params, context_);
  } catch (const std::exception& e) {
    const std::string errMsg = "Failed to open " + identifier + " as " + instance + ": " + e.what();
    errorMonitor_->notifyFailure(managerTopic(instance), errMsg);
    throw;
  }
  if (!dev) {
    const std::string errMsg = "[DeviceManager] creator for " + identifier + " returned nullptr";
    errorMonitor_->notifyFailure(managerTopic(instance), errMsg);
    throw std::runtime_error(errMsg);
  }

  auto& ref = *dev;
  devices_[instance] = std::move(dev);
  context_.logger->info(kComponent, "Opened " + identifier + " as " + instance);
  context_.channel->publish(
      DeviceEventMessage{ instance, identifier, DeviceEventMessage::Event::Opened });
  return ref;
}

void DeviceManager::closeDevice(const std::string& instance) {
  auto it = devices_.find(instance);
  if (it == devices_.end())
    return;

  auto dev = std::move(it->second);
  devices_.erase(it);
  shutDown(instance, *dev);
}

void DeviceManager::closeAll() {
  while (!devices_.empty())
    closeDevice(devices_.begin()->first);
}

labcomm::devices::Device* DeviceManager::device(const std::string& instance) const {
  auto it = devices_.find(instance);
  return it == devices_.end() ? nullptr : it->second.get();
}

std::vector<std::string> DeviceManager::openInstances() const {
  std::vector<std::string> names;
  names.reserve(devices_.size());
  for (const auto& [name, dev] : devices_)
    names.push_back(name);
  return names;
}

void DeviceManager::shutDown(const std::string& instance, devices::Device& dev) {
  try {
    dev.close();
  } catch (const std::exception& e) {
    errorMonitor_->notifyFailure(dev.topic(), "Error while closing " + instance + ": " + e.what());
  }

  context_.logger->info(kComponent, "Closed " + instance);
  context_.channel->publish(
      DeviceEventMessage{ instance, std::string{}, DeviceEventMessage::Event::Closed });
}
