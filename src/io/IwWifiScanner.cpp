/* @file IwWifiScanner.cpp
 * @brief `iw` based scan primitive for Linux edge nodes
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

// 3rd-party headers
#include <boost/asio/post.hpp>

// GeoEdge headers
#include "core/Logger.hpp"
#include "io/IwWifiScanner.hpp"

using namespace geoedge::io;
using geoedge::protocols::NetworkObservation;
using geoedge::protocols::ObservationList;

namespace {
  constexpr const char* kTag = "IwWifiScanner";

  std::string trimLeft(const std::string& s) {
    const auto pos = s.find_first_not_of(" \t");
    return pos == std::string::npos ? std::string{} : s.substr(pos);
  }
} // namespace

IwWifiScanner::IwWifiScanner(boost::asio::io_context& io, std::string interface,
                             core::Logger& log)
    : io_(io), interface_(std::move(interface)), log_(log) {}

IwWifiScanner::~IwWifiScanner() {
  if (worker_.joinable())
    worker_.join();
}

void IwWifiScanner::requestScan(Callback cb) {
  // previous worker has already posted its result by the time a new scan is asked for
  if (worker_.joinable())
    worker_.join();

  worker_ = std::thread([this, cb = std::move(cb)]() {
    auto observations = parseScanOutput(runScanCommand());
    boost::asio::post(io_, [cb, observations = std::move(observations)]() mutable {
      cb(std::move(observations));
    });
  });
}

std::string IwWifiScanner::runScanCommand() const {
  const std::string cmd = "iw dev " + interface_ + " scan 2>/dev/null";
  FILE* pipe = ::popen(cmd.c_str(), "r");
  if (pipe == nullptr) {
    log_.error(kTag, std::string("popen: ") + strerror(errno));
    return {};
  }

  std::string out;
  std::array<char, 512> buf{};
  std::size_t n;
  while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0)
    out.append(buf.data(), n);

  const int rc = ::pclose(pipe);
  if (rc != 0)
    log_.error(kTag, "`" + cmd + "` exited with status " + std::to_string(rc));
  return out;
}

// BSS 00:11:22:33:44:55(on wlan0) -- associated
// 	signal: -48.00 dBm
ObservationList IwWifiScanner::parseScanOutput(const std::string& text) {
  ObservationList observations;
  std::optional<NetworkObservation> current;
  bool haveSignal = false;

  auto flush = [&]() {
    if (current && haveSignal)
      observations.push_back(*current);
    current.reset();
    haveSignal = false;
  };

  std::istringstream in(text);
  std::string raw;
  while (std::getline(in, raw)) {
    if (raw.rfind("BSS ", 0) == 0) {
      flush();
      auto bssid = protocols::parseBssid(raw.substr(4, 17));
      if (bssid)
        current = NetworkObservation{ *bssid, 0 };
      continue;
    }

    const auto line = trimLeft(raw);
    if (current && line.rfind("signal:", 0) == 0) {
      const double dbm = std::strtod(line.c_str() + 7, nullptr);
      current->signalStrengthDbm = static_cast<int>(dbm);
      haveSignal = true;
    }
  }
  flush();

  std::stable_sort(observations.begin(), observations.end(),
                   [](const NetworkObservation& a, const NetworkObservation& b) {
                     return a.signalStrengthDbm > b.signalStrengthDbm;
                   });
  return observations;
}
