#pragma once

/** @file  Locator.hpp
 *  @brief Public API for geoedge::core::Locator, the host application's entry point.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <memory>

#include "core/LocateNode.hpp"
#include "core/NodeConfig.hpp"

namespace geoedge {
  namespace core {

    class EdgeAgent;
    class EdgeDevice;

    /**
 * @class Locator
 * @brief Owns whichever half (agent or device) this node runs and forwards to it.
 *
 *  The role is fixed at construction; both halves expose the same LocateNode API.
 */
    class Locator : public LocateNode {

    public:
      explicit Locator(std::unique_ptr<EdgeAgent> agent);
      explicit Locator(std::unique_ptr<EdgeDevice> device);
      ~Locator() override;

      Role role() const { return role_; }

      // ---- LocateNode ---------------------------------------------------------
      void locate(bool usePrevious = true, Callback onComplete = {}) override;
      void refreshTimezone(Callback onComplete = {}) override;
      protocols::LocationReading getLocation() const override;
      protocols::TimezoneReading getTimezone() const override;
      LocateState state() const override;

      /// nullptr unless role() matches.
      EdgeAgent* agent() const { return agent_.get(); }
      EdgeDevice* device() const { return device_.get(); }

    private:
      LocateNode& node() const;

      Role role_;
      std::unique_ptr<EdgeAgent> agent_;
      std::unique_ptr<EdgeDevice> device_;
    };

  } // namespace core
} // namespace geoedge
