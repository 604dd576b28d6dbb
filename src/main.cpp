/* @file main.cpp
 * @brief geoedge-node: runs the agent or device half of the locator on one host
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

// 3rd-party headers
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>

// GeoEdge headers
#include "core/ConfigLoader.hpp"
#include "core/EdgeAgent.hpp"
#include "core/EdgeDevice.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/GeoServiceClient.hpp"
#include "core/Locator.hpp"
#include "core/Logger.hpp"
#include "core/NodeConfig.hpp"
#include "io/AsioScheduler.hpp"
#include "io/BeastHttpClient.hpp"
#include "io/IwWifiScanner.hpp"
#include "io/SerialChannel.hpp"
#include "io/SerialTransport.hpp"

using namespace geoedge;

namespace {

  struct Options {
    std::string configPath;
    bool locate{ false };
    bool fresh{ false };
    bool timezone{ false };
  };

  void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <config.json> [--locate] [--fresh] [--timezone]\n"
              << "  --locate    run one locate cycle and print the result\n"
              << "  --fresh     force a new WiFi scan (usePrevious = false)\n"
              << "  --timezone  refresh the timezone only\n";
  }

  bool parseArgs(int argc, char** argv, Options& opts) {
    if (argc < 2)
      return false;
    opts.configPath = argv[1];
    for (int i = 2; i < argc; ++i) {
      if (std::strcmp(argv[i], "--locate") == 0)
        opts.locate = true;
      else if (std::strcmp(argv[i], "--fresh") == 0)
        opts.fresh = true;
      else if (std::strcmp(argv[i], "--timezone") == 0)
        opts.timezone = true;
      else
        return false;
    }
    return true;
  }

  void printLocation(const core::Locator& locator) {
    const auto reading = locator.getLocation();
    if (auto* err = std::get_if<protocols::ReadError>(&reading)) {
      std::cout << "location: error: " << err->error << "\n";
      return;
    }
    const auto& loc = std::get<protocols::LocationResult>(reading);
    std::cout << "location: " << loc.latitude << "," << loc.longitude << "\n";
    if (loc.placeData.is_array() && !loc.placeData.empty() && loc.placeData[0].is_object()) {
      const auto address = loc.placeData[0].value("formatted_address", nlohmann::json());
      if (address.is_string())
        std::cout << "place: " << address.get<std::string>() << "\n";
    }
  }

  void printTimezone(const core::Locator& locator) {
    const auto reading = locator.getTimezone();
    if (auto* err = std::get_if<protocols::ReadError>(&reading)) {
      std::cout << "timezone: error: " << err->error << "\n";
      return;
    }
    const auto& tz = std::get<protocols::TimezoneResult>(reading);
    std::cout << "timezone: " << tz.offsetLabel << " local " << tz.localDateLabel << "\n";
  }

} // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!parseArgs(argc, argv, opts)) {
    usage(argv[0]);
    return 2;
  }

  try {
    // --- load config, init subsystems ---
    const auto config = core::ConfigLoader(opts.configPath).loadNodeConfig();
    core::Logger log(config.debug);
    log.info("geoedge-node", std::string("starting as ") + core::toString(config.role));

    const auto speed = io::SerialChannel::toSpeed(config.baud);
    if (!speed)
      throw std::invalid_argument("[geoedge-node] unsupported baud rate " +
                                  std::to_string(config.baud));

    boost::asio::io_context io;
    auto work = boost::asio::make_work_guard(io);

    io::SerialChannel channel(io, log);
    if (!channel.open(config.serialDevice, *speed))
      throw std::runtime_error("[geoedge-node] cannot open " + config.serialDevice);
    io::SerialTransport transport(channel, log);
    io::AsioScheduler scheduler(io);

    auto errorMonitor = std::make_shared<core::ErrorMonitor>();
    errorMonitor->registerEscalation(
        [&log](const std::string& msg) { log.error("Operator", msg); });

    std::unique_ptr<io::BeastHttpClient> http;
    std::unique_ptr<core::GeoServiceClient> geo;
    std::unique_ptr<io::IwWifiScanner> scanner;
    std::unique_ptr<core::Locator> locator;

    if (config.role == core::Role::Agent) {
      http = std::make_unique<io::BeastHttpClient>(io, log);
      geo = std::make_unique<core::GeoServiceClient>(*http, *config.keys, config.endpoints);
      locator = std::make_unique<core::Locator>(std::make_unique<core::EdgeAgent>(
          transport, *geo, scheduler, scheduler, log, errorMonitor));
    } else {
      scanner = std::make_unique<io::IwWifiScanner>(io, config.wifiInterface, log);
      locator = std::make_unique<core::Locator>(
          std::make_unique<core::EdgeDevice>(transport, *scanner, log));
    }
    transport.start();

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int) {
      if (ec)
        return;
      log.info("geoedge-node", "shutting down");
      work.reset();
      channel.close();
      io.stop();
    });

    if (opts.locate) {
      locator->locate(!opts.fresh, [&locator]() {
        printLocation(*locator);
        printTimezone(*locator);
      });
    }
    if (opts.timezone)
      locator->refreshTimezone([&locator]() { printTimezone(*locator); });

    io.run();
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  return 0;
}
