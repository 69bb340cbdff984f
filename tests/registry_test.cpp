// labcomm headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceRegistry.hpp"
#include "core/Logger.hpp"
#include "devices/BuiltinDevices.hpp"
#include "devices/DummySpectrometer.hpp"
#include "devices/DummyTemperatureController.hpp"
#include "devices/EM27Sensors.hpp"
#include "devices/FTSW500.hpp"
#include "io/SerialChannel.hpp"

// labcomm fakes
#include "FakeScheduler.hpp"
#include "RecordingChannel.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <algorithm>

namespace labcomm::test {

  using core::DeviceParameter;
  using core::DeviceParams;
  using core::DeviceRegistry;
  using core::DeviceVariant;
  using core::PluginCatalog;

  namespace {

    class NullDevice : public devices::Device {
    public:
      explicit NullDevice(std::shared_ptr<core::MessageChannel> channel)
          : Device(std::move(channel), "device.null") {}
      void close() override {}
    };

    DeviceVariant variant(const std::string& id, const std::string& description,
                          std::vector<DeviceParameter> params = {}) {
      return DeviceVariant{ id, id, core::DeviceType{ description, std::move(params) },
                            [](const DeviceParams&, const core::DeviceContext& ctx) {
                              return std::make_unique<NullDevice>(ctx.channel);
                            } };
    }

  } // namespace

  class RegistryTest : public ::testing::Test {
  protected:
    core::DeviceContext context() const {
      return core::DeviceContext{ channel, scheduler, logger, config };
    }

    std::shared_ptr<RecordingChannel> channel = std::make_shared<RecordingChannel>();
    std::shared_ptr<FakeScheduler> scheduler = std::make_shared<FakeScheduler>();
    std::shared_ptr<core::Logger> logger =
        std::make_shared<core::Logger>([](core::LogLevel, const std::string&) {});
    core::AppConfig config;
    DeviceRegistry registry;
  };

  TEST_F(RegistryTest, catalog_groups_variants_by_description) {
    registry.registerVariant(variant("A", "Spectrometer"));
    registry.registerVariant(variant("B", "Spectrometer"));
    registry.registerVariant(variant("C", "Sensor array"));

    const PluginCatalog expected{ { "Spectrometer", { "A", "B" } }, { "Sensor array", { "C" } } };
    EXPECT_EQ(registry.catalog(), expected);
  }

  TEST_F(RegistryTest, publishes_catalog_once) {
    registry.registerVariant(variant("A", "Spectrometer"));
    registry.publishCatalog(*channel);

    const auto catalogs = channel->all<core::CatalogMessage>();
    ASSERT_EQ(catalogs.size(), 1u);
    EXPECT_EQ(catalogs[0].catalog, registry.catalog());
  }

  TEST_F(RegistryTest, duplicate_identifier_is_refused) {
    EXPECT_TRUE(registry.registerVariant(variant("A", "Spectrometer")));
    EXPECT_FALSE(registry.registerVariant(variant("A", "Sensor array")));
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.variant("A").type.description, "Spectrometer");
  }

  TEST_F(RegistryTest, rejects_incomplete_variants) {
    auto noCreator = variant("A", "Spectrometer");
    noCreator.create = nullptr;
    EXPECT_THROW(registry.registerVariant(noCreator), std::invalid_argument);
    EXPECT_THROW(registry.registerVariant(variant("", "Spectrometer")), std::invalid_argument);
  }

  TEST_F(RegistryTest, unknown_variant_is_out_of_range) {
    EXPECT_FALSE(registry.contains("nope"));
    EXPECT_THROW(registry.variant("nope"), std::out_of_range);
    EXPECT_THROW(registry.create("nope", {}, context()), std::out_of_range);
  }

  TEST_F(RegistryTest, resolves_defaults_and_checks_values) {
    registry.registerVariant(variant("A", "Spectrometer",
                                     { DeviceParameter("baudrate", { "9600", "115200" }, "9600"),
                                       DeviceParameter("port", {}) }));

    EXPECT_EQ(registry.resolveParams("A", { { "port", "/dev/ttyUSB0" } }),
              (DeviceParams{ { "baudrate", "9600" }, { "port", "/dev/ttyUSB0" } }));
    EXPECT_EQ(registry.resolveParams("A", { { "port", "x" }, { "baudrate", "115200" } })
                  .at("baudrate"),
              "115200");

    EXPECT_THROW(registry.resolveParams("A", {}), std::invalid_argument); // port missing
    EXPECT_THROW(registry.resolveParams("A", { { "port", "x" }, { "baudrate", "14400" } }),
                 std::invalid_argument);
    EXPECT_THROW(registry.resolveParams("A", { { "port", "x" }, { "parity", "odd" } }),
                 std::invalid_argument);
  }

  TEST(device_parameter, default_must_be_allowed) {
    EXPECT_THROW(DeviceParameter("name", { "hot_bb", "cold_bb" }, "warm_bb"),
                 std::invalid_argument);
    EXPECT_NO_THROW(DeviceParameter("port", {}, "/dev/ttyUSB0"));
    EXPECT_NO_THROW(DeviceParameter("name", { "hot_bb" }));
  }

  //---built-in variants----------------------------------------------------

  TEST_F(RegistryTest, builtin_catalog) {
    EXPECT_EQ(devices::registerBuiltinDevices(registry, config), 5);

    const PluginCatalog expected{
      { "Temperature controller", { "dummy_temperature_controller", "tc4820" } },
      { "Sensor devices", { "dummy_em27_sensors" } },
      { "Spectrometer", { "dummy_spectrometer", "ftsw500" } },
    };
    EXPECT_EQ(registry.catalog(), expected);
    EXPECT_EQ(registry.variant("tc4820").label, "TC4820");
  }

  TEST_F(RegistryTest, builtin_registration_is_idempotent) {
    devices::registerBuiltinDevices(registry, config);
    EXPECT_EQ(devices::registerBuiltinDevices(registry, config), 0);
    EXPECT_EQ(registry.size(), 5u);
  }

  TEST_F(RegistryTest, tc4820_offers_configured_baud_rates) {
    config.baudrates = { 9600, 57600 };
    config.tc4820.defaultBaudrate = 57600;
    devices::registerBuiltinDevices(registry, config);

    const auto& params = registry.variant("tc4820").type.params;
    const auto baud = std::find_if(params.begin(), params.end(),
                                   [](const DeviceParameter& p) { return p.name == "baudrate"; });
    ASSERT_NE(baud, params.end());
    EXPECT_THAT(baud->possibleValues, ::testing::ElementsAre("9600", "57600"));
    EXPECT_EQ(baud->defaultValue, "57600");
  }

  TEST_F(RegistryTest, creates_dummy_devices) {
    devices::registerBuiltinDevices(registry, config);

    auto tc = registry.create("dummy_temperature_controller", { { "name", "cold_bb" } }, context());
    auto* dummyTc = dynamic_cast<devices::DummyTemperatureController*>(tc.get());
    ASSERT_NE(dummyTc, nullptr);
    EXPECT_EQ(dummyTc->name(), "cold_bb");
    EXPECT_DOUBLE_EQ(dummyTc->setPoint(), 70.0);

    auto spec = registry.create("dummy_spectrometer", { { "measure_duration", "0.5" } }, context());
    EXPECT_NE(dynamic_cast<devices::DummySpectrometer*>(spec.get()), nullptr);

    auto sensors = registry.create("dummy_em27_sensors", { { "poll_interval", "2" } }, context());
    auto* em27 = dynamic_cast<devices::EM27Sensors*>(sensors.get());
    ASSERT_NE(em27, nullptr);
    EXPECT_DOUBLE_EQ(em27->pollInterval(), 2.0);
    EXPECT_EQ(scheduler->timer(scheduler->onlyTimer()).period, std::chrono::milliseconds(2000));
  }

  TEST_F(RegistryTest, sensors_default_poll_interval_comes_from_config) {
    config.sensorPollInterval = 30.0;
    devices::registerBuiltinDevices(registry, config);

    auto sensors = registry.create("dummy_em27_sensors", {}, context());
    EXPECT_DOUBLE_EQ(dynamic_cast<devices::EM27Sensors&>(*sensors).pollInterval(), 30.0);
  }

  TEST_F(RegistryTest, sensors_accept_nan_poll_interval) {
    devices::registerBuiltinDevices(registry, config);

    auto sensors = registry.create("dummy_em27_sensors", { { "poll_interval", "nan" } }, context());
    EXPECT_EQ(scheduler->arm_calls, 0);
  }

  TEST_F(RegistryTest, bad_numeric_parameter_is_invalid_argument) {
    devices::registerBuiltinDevices(registry, config);
    EXPECT_THROW(registry.create("dummy_spectrometer", { { "measure_duration", "soon" } }, context()),
                 std::invalid_argument);
  }

  TEST_F(RegistryTest, tc4820_open_failure_is_serial_error) {
    devices::registerBuiltinDevices(registry, config);
    EXPECT_THROW(registry.create("tc4820",
                                 { { "name", "hot_bb" }, { "port", "/dev/labcomm-missing" } },
                                 context()),
                 io::SerialError);
  }

  TEST_F(RegistryTest, ftsw500_defaults_come_from_config) {
    config.ftsw500.host = "10.0.0.7";
    config.ftsw500.port = 6000;
    devices::registerBuiltinDevices(registry, config);

    const auto params = registry.resolveParams("ftsw500", {});
    EXPECT_EQ(params.at("host"), "10.0.0.7");
    EXPECT_EQ(params.at("port"), "6000");
    EXPECT_EQ(params.at("poll_interval"), "1");
  }

  TEST_F(RegistryTest, ftsw500_connect_failure_is_ftsw500_error) {
    devices::registerBuiltinDevices(registry, config);
    EXPECT_THROW(registry.create("ftsw500", { { "host", "not-an-address" } }, context()),
                 devices::FTSW500Error);
    EXPECT_THROW(registry.create("ftsw500", { { "port", "70000" } }, context()),
                 std::invalid_argument);
    EXPECT_THROW(registry.create("ftsw500", { { "port", "http" } }, context()),
                 std::invalid_argument);
  }

} // namespace labcomm::test
