/* @file main.cpp
 * @brief labcomm command line: list the device catalog or talk to a TC4820
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <cstdio>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

// Linux headers
#include <getopt.h>

// labcomm headers
#include "core/ConfigLoader.hpp"
#include "core/DeviceManager.hpp"
#include "core/DeviceRegistry.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/LoopScheduler.hpp"
#include "core/MessageChannel.hpp"
#include "devices/BuiltinDevices.hpp"
#include "devices/TC4820.hpp"

using namespace labcomm;

namespace {

  struct Options {
    std::string configPath;
    bool list{ false };
    std::string port;
    std::string baudrate;
    std::string name{ "hot_bb" };
    std::string setPoint;
  };

  void printUsage(const char* prog) {
    std::cerr << "Usage: " << prog
              << " [--config FILE] [--list] [--tc4820 PORT [--baud N] [--name hot_bb|cold_bb]"
                 " [--set-point T]]\n"
              << "  -c, --config FILE     JSON configuration file\n"
              << "  -l, --list            print the device catalog\n"
              << "  -t, --tc4820 PORT     open a TC4820 on PORT and print its properties\n"
              << "  -b, --baud N          baud rate (default from configuration)\n"
              << "  -n, --name NAME       controller instance name (default hot_bb)\n"
              << "  -s, --set-point T     set point in degrees C, applied before reading\n"
              << "  -h, --help            show this text\n";
  }

  /// 0 = ok, 1 = bad usage, 2 = help shown
  int parseArgs(int argc, char* argv[], Options& opts) {
    static const option longOptions[] = {
      { "config", required_argument, nullptr, 'c' },
      { "list", no_argument, nullptr, 'l' },
      { "tc4820", required_argument, nullptr, 't' },
      { "baud", required_argument, nullptr, 'b' },
      { "name", required_argument, nullptr, 'n' },
      { "set-point", required_argument, nullptr, 's' },
      { "help", no_argument, nullptr, 'h' },
      { nullptr, 0, nullptr, 0 },
    };

    int c;
    while ((c = getopt_long(argc, argv, "c:lt:b:n:s:h", longOptions, nullptr)) != -1) {
      switch (c) {
      case 'c':
        opts.configPath = optarg;
        break;
      case 'l':
        opts.list = true;
        break;
      case 't':
        opts.port = optarg;
        break;
      case 'b':
        opts.baudrate = optarg;
        break;
      case 'n':
        opts.name = optarg;
        break;
      case 's':
        opts.setPoint = optarg;
        break;
      case 'h':
        return 2;
      default:
        return 1;
      }
    }

    if (optind < argc) {
      std::cerr << "Unexpected argument: " << argv[optind] << "\n";
      return 1;
    }
    if (!opts.list && opts.port.empty()) {
      std::cerr << "Nothing to do: give --list and/or --tc4820 PORT\n";
      return 1;
    }
    if (opts.port.empty() && (!opts.baudrate.empty() || !opts.setPoint.empty())) {
      std::cerr << "--baud and --set-point need --tc4820 PORT\n";
      return 1;
    }
    return 0;
  }

  void printCatalog(const core::PluginCatalog& catalog) {
    for (const auto& [description, identifiers] : catalog) {
      std::cout << description << ":\n";
      for (const auto& id : identifiers)
        std::cout << "  " << id << "\n";
    }
  }

  void printProperties(const std::string& name, const core::TemperatureProperties& props) {
    char line[128];
    std::snprintf(line, sizeof(line), "%s: temperature %.1f, power %d, alarm %d, set point %.1f",
                  name.c_str(), props.temperature, props.power, props.alarmStatus,
                  props.setPoint);
    std::cout << line << "\n";
  }

} // namespace

int main(int argc, char* argv[]) {
  Options opts;
  switch (parseArgs(argc, argv, opts)) {
  case 0:
    break;
  case 2:
    printUsage(argv[0]);
    return 0;
  default:
    printUsage(argv[0]);
    return 1;
  }

  try {
    core::AppConfig config;
    if (!opts.configPath.empty())
      config = core::ConfigLoader(opts.configPath).loadConfig();

    auto logger = std::make_shared<core::Logger>();
    logger->setLevel(core::parseLogLevel(config.logLevel));

    auto channel = std::make_shared<core::MessageChannel>();
    auto scheduler = std::make_shared<core::LoopScheduler>();
    auto errorMonitor = std::make_shared<core::ErrorMonitor>(channel, logger);

    auto registry = std::make_shared<core::DeviceRegistry>();
    devices::registerBuiltinDevices(*registry, config);

    if (opts.list) {
      channel->subscribe([](const core::Message& msg) {
        if (auto* catalog = std::get_if<core::CatalogMessage>(&msg))
          printCatalog(catalog->catalog);
      });
    }

    core::DeviceManager manager(registry, core::DeviceContext{ channel, scheduler, logger, config },
                                errorMonitor);
    manager.initialize();

    if (opts.port.empty())
      return 0;

    core::DeviceParams params{ { "name", opts.name }, { "port", opts.port } };
    if (!opts.baudrate.empty())
      params["baudrate"] = opts.baudrate;

    manager.openDevice(opts.name, "tc4820", params);
    auto* tc = manager.deviceAs<devices::TC4820>(opts.name);
    if (!tc)
      throw std::runtime_error("tc4820 variant did not produce a TC4820");

    if (!opts.setPoint.empty())
      tc->setSetPoint(std::stod(opts.setPoint));

    printProperties(opts.name, tc->getProperties());
    manager.closeAll();
  } catch (const std::exception& e) {
    std::cerr << "labcomm: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
