#pragma once
/** @file  DeviceRegistry.hpp
 *  @brief Runtime registry that maps device variants to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/ConfigLoader.hpp"
#include "core/Messages.hpp"

namespace labcomm::devices {
  class Device;
}

namespace labcomm::core {

  class Logger;
  class MessageChannel;
  class Scheduler;

  /** A parameter a device needs (e.g. baudrate). */
  struct DeviceParameter {
    /// Throws std::invalid_argument if @p defaultValue is not in a non-empty
    /// @p possibleValues.
    DeviceParameter(std::string name, std::vector<std::string> possibleValues,
                    std::optional<std::string> defaultValue = std::nullopt);

    std::string name;
    std::vector<std::string> possibleValues; ///< empty = free-form
    std::optional<std::string> defaultValue;
  };

  /** Immutable description of a device type; `description` groups variants. */
  struct DeviceType {
    std::string description;
    std::vector<DeviceParameter> params;
  };

  using DeviceParams = std::map<std::string, std::string>;

  /** Everything a creator may hand to the device it builds. */
  struct DeviceContext {
    std::shared_ptr<MessageChannel> channel;
    std::shared_ptr<Scheduler> scheduler;
    std::shared_ptr<Logger> logger;
    AppConfig config;
  };

  struct DeviceVariant {
    using Creator = std::function<std::unique_ptr<devices::Device>(const DeviceParams&,
                                                                   const DeviceContext&)>;

    std::string identifier; ///< unique key, e.g. "tc4820"
    std::string label;      ///< human-readable variant name, e.g. "TC4820"
    DeviceType type;
    Creator create;
  };

  /**
 * @class DeviceRegistry
 * @brief Register & instantiate device variants by identifier.
 *
 *  * Keeps the presentation layer decoupled from concrete drivers.
 *  * Filled by explicit registration calls; iteration order is deterministic.
 */
  class DeviceRegistry {
  public:
    /// Register a variant.  Returns false on duplicate identifier.
    bool registerVariant(DeviceVariant variant);

    /// description -> identifiers, one snapshot.
    PluginCatalog catalog() const;

    /// Throws `std::out_of_range` if unknown.
    const DeviceVariant& variant(const std::string& identifier) const;

    bool contains(const std::string& identifier) const;
    std::size_t size() const { return variants_.size(); }

    /**
     * Fill defaults and check @p params against the variant's parameters.
     * Throws `std::out_of_range` for an unknown identifier, `std::invalid_argument`
     * for a missing, unknown or disallowed parameter.
     */
    DeviceParams resolveParams(const std::string& identifier, const DeviceParams& params) const;

    /// Create a fresh device. Same errors as resolveParams(), plus whatever the creator throws.
    std::unique_ptr<devices::Device> create(const std::string& identifier,
                                            const DeviceParams& params,
                                            const DeviceContext& context) const;

    /// Publish the catalog as a single CatalogMessage.
    void publishCatalog(const MessageChannel& channel) const;

  private:
    std::map<std::string, DeviceVariant> variants_;
  };

} // namespace labcomm::core
