#pragma once
/** @file  WifiScanner.hpp
 *  @brief Platform WiFi scan primitive.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>

#include "protocols/NetworkObservation.hpp"

namespace geoedge {
  namespace io {

    class WifiScanner {
    public:
      using Callback = std::function<void(protocols::ObservationList)>;

      virtual ~WifiScanner() = default;

      /// Starts a scan; `cb` runs on the event loop with whatever was seen (may be empty).
      virtual void requestScan(Callback cb) = 0;
    };

  } // namespace io
} // namespace geoedge
