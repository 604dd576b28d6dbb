#pragma once
/** @file  SerialTransport.hpp
 *  @brief Transport over a SerialChannel: one `{"topic","payload"}` JSON line per message.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <string>
#include <unordered_map>

#include "io/Transport.hpp"

namespace geoedge {
  namespace core {
    class Logger;
  }

  namespace io {

    class SerialChannel;

    /**
 * @class SerialTransport
 * @brief Topic multiplexer on top of a point-to-point serial link.
 *
 *  * Serial lines arrive in order, so per-topic ordering comes for free.
 *  * Unknown topics and unparsable lines are logged and dropped.
 *  * `send()` never throws; a failed write is logged (fire-and-forget).
 */
    class SerialTransport : public Transport {
    public:
      SerialTransport(SerialChannel& channel, core::Logger& log);
      ~SerialTransport() override = default;

      /// Begin reading from the channel; call once the handlers are registered.
      void start();

      void onMessage(const std::string& topic, Handler handler) override;
      void send(const std::string& topic, const nlohmann::json& payload) override;

      /// Decode one wire line and invoke the matching handler.
      void dispatch(const std::string& line);

    private:
      SerialChannel& channel_;
      core::Logger& log_;
      std::unordered_map<std::string, Handler> handlers_;
    };

  } // namespace io
} // namespace geoedge
