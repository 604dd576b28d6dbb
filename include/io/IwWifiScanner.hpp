#pragma once
/** @file  IwWifiScanner.hpp
 *  @brief Linux WifiScanner that shells out to `iw dev <if> scan`.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <thread>

#include <boost/asio/io_context.hpp>

#include "io/WifiScanner.hpp"

namespace geoedge {
  namespace core {
    class Logger;
  }

  namespace io {

    /**
 * @class IwWifiScanner
 * @brief Runs the (blocking, ~2-4 s) scan on a worker thread and posts the
 *        parsed list back onto the io_context.
 *
 *  * One scan at a time; the caller (EdgeDevice) already guarantees that.
 *  * Needs CAP_NET_ADMIN for a fresh scan; without it `iw` fails and the
 *    callback receives an empty list.
 */
    class IwWifiScanner : public WifiScanner {
    public:
      IwWifiScanner(boost::asio::io_context& io, std::string interface, core::Logger& log);
      ~IwWifiScanner() override; ///< joins the worker

      void requestScan(Callback cb) override;

      /// Pulls BSS/signal pairs out of `iw` output, strongest first.
      static protocols::ObservationList parseScanOutput(const std::string& text);

      IwWifiScanner(const IwWifiScanner&) = delete;
      IwWifiScanner& operator=(const IwWifiScanner&) = delete;

    private:
      std::string runScanCommand() const;

      boost::asio::io_context& io_;
      std::string interface_;
      core::Logger& log_;
      std::thread worker_;
    };

  } // namespace io
} // namespace geoedge
