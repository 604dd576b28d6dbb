/* @file SerialTransport.cpp
 * @brief topic dispatch for the agent <-> device serial link
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

#include "io/SerialTransport.hpp"
#include "core/Logger.hpp"
#include "io/SerialChannel.hpp"
#include "protocols/Message.hpp"

using namespace geoedge::io;

namespace {
  constexpr const char* kTag = "SerialTransport";
} // namespace

SerialTransport::SerialTransport(SerialChannel& channel, core::Logger& log)
    : channel_(channel), log_(log) {}

void SerialTransport::start() {
  channel_.startReading([this](const std::string& line) { dispatch(line); });
}

void SerialTransport::onMessage(const std::string& topic, Handler handler) {
  handlers_[topic] = std::move(handler);
}

void SerialTransport::send(const std::string& topic, const nlohmann::json& payload) {
  const protocols::Message msg{ topic, payload };
  log_.debug(kTag, "-> " + topic);
  if (!channel_.writeLine(msg.toWire()))
    log_.error(kTag, "failed to send " + topic);
}

void SerialTransport::dispatch(const std::string& line) {
  auto msg = protocols::Message::fromWire(line);
  if (!msg) {
    log_.error(kTag, "dropping unparsable line");
    return;
  }

  auto it = handlers_.find(msg->topic);
  if (it == handlers_.end()) {
    log_.debug(kTag, "no handler for " + msg->topic);
    return;
  }
  log_.debug(kTag, "<- " + msg->topic);
  it->second(msg->payload);
}
