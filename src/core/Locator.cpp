/* @file Locator.cpp
 * @brief role-selecting facade over EdgeAgent / EdgeDevice
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <stdexcept>

// GeoEdge headers
#include "core/EdgeAgent.hpp"
#include "core/EdgeDevice.hpp"
#include "core/Locator.hpp"

using namespace geoedge::core;

Locator::Locator(std::unique_ptr<EdgeAgent> agent) : role_(Role::Agent), agent_(std::move(agent)) {
  if (!agent_)
    throw std::invalid_argument("[Locator] agent is nullptr");
}

Locator::Locator(std::unique_ptr<EdgeDevice> device)
    : role_(Role::Device), device_(std::move(device)) {
  if (!device_)
    throw std::invalid_argument("[Locator] device is nullptr");
}

Locator::~Locator() = default;

void Locator::locate(bool usePrevious, Callback onComplete) {
  node().locate(usePrevious, std::move(onComplete));
}

void Locator::refreshTimezone(Callback onComplete) {
  node().refreshTimezone(std::move(onComplete));
}

geoedge::protocols::LocationReading Locator::getLocation() const { return node().getLocation(); }

geoedge::protocols::TimezoneReading Locator::getTimezone() const { return node().getTimezone(); }

LocateState Locator::state() const { return node().state(); }

LocateNode& Locator::node() const {
  if (agent_)
    return *agent_;
  return *device_;
}
