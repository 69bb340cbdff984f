/* @file DeviceRegistry.cpp
 * @brief variant table, catalog grouping and parameter resolution
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// labcomm headers
#include "core/DeviceRegistry.hpp"
#include "core/MessageChannel.hpp"
#include "devices/Device.hpp"

namespace labcomm::core {

  DeviceParameter::DeviceParameter(std::string name, std::vector<std::string> possibleValues,
                                   std::optional<std::string> defaultValue)
      : name(std::move(name)), possibleValues(std::move(possibleValues)),
        defaultValue(std::move(defaultValue)) {
    if (this->defaultValue && !this->possibleValues.empty() &&
        std::find(this->possibleValues.begin(), this->possibleValues.end(),
                  *this->defaultValue) == this->possibleValues.end()) {
      throw std::invalid_argument("Default value of " + *this->defaultValue +
                                  " not in possible values for " + this->name);
    }
  }

  bool DeviceRegistry::registerVariant(DeviceVariant variant) {
    if (variant.identifier.empty() || !variant.create)
      throw std::invalid_argument("[DeviceRegistry] variant needs an identifier and a creator");

    const auto key = variant.identifier;
    return variants_.emplace(key, std::move(variant)).second;
  }

  PluginCatalog DeviceRegistry::catalog() const {
    PluginCatalog out;
    for (const auto& [id, variant] : variants_)
      out[variant.type.description].insert(id);
    return out;
  }

  const DeviceVariant& DeviceRegistry::variant(const std::string& identifier) const {
    auto it = variants_.find(identifier);
    if (it == variants_.end())
      throw std::out_of_range("[DeviceRegistry] unknown device variant: " + identifier);
    return it->second;
  }

  bool DeviceRegistry::contains(const std::string& identifier) const {
    return variants_.count(identifier) != 0;
  }

  DeviceParams DeviceRegistry::resolveParams(const std::string& identifier,
                                             const DeviceParams& params) const {
    const auto& v = variant(identifier);

    for (const auto& [name, value] : params) {
      const bool known = std::any_of(v.type.params.begin(), v.type.params.end(),
                                     [&](const DeviceParameter& p) { return p.name == name; });
      if (!known)
        throw std::invalid_argument("[DeviceRegistry] " + identifier +
                                    " has no parameter named " + name);
    }

    DeviceParams resolved;
    for (const auto& p : v.type.params) {
      auto it = params.find(p.name);
      if (it == params.end()) {
        if (!p.defaultValue)
          throw std::invalid_argument("[DeviceRegistry] missing parameter " + p.name +
                                      " for " + identifier);
        resolved[p.name] = *p.defaultValue;
        continue;
      }

      if (!p.possibleValues.empty() &&
          std::find(p.possibleValues.begin(), p.possibleValues.end(), it->second) ==
              p.possibleValues.end()) {
        throw std::invalid_argument("[DeviceRegistry] value " + it->second +
                                    " not allowed for parameter " + p.name);
      }
      resolved[p.name] = it->second;
    }
    return resolved;
  }

  std::unique_ptr<devices::Device> DeviceRegistry::create(const std::string& identifier,
                                                          const DeviceParams& params,
                                                          const DeviceContext& context) const {
    const auto resolved = resolveParams(identifier, params);
    return variant(identifier).create(resolved, context);
  }

  void DeviceRegistry::publishCatalog(const MessageChannel& channel) const {
    channel.publish(CatalogMessage{ catalog() });
  }

} // namespace labcomm::core
