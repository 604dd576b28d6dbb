#pragma once
/** @file  Transport.hpp
 *  @brief Topic-addressed message channel between the agent and device nodes.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace geoedge {
  namespace io {

    /**
 * @class Transport
 * @brief Reliable, ordered per topic, fire-and-forget from the sender's side.
 *
 *  * One handler per topic; registering again replaces it.
 *  * Handlers run on the node's event loop.
 */
    class Transport {
    public:
      using Handler = std::function<void(const nlohmann::json& payload)>;

      virtual ~Transport() = default;

      virtual void onMessage(const std::string& topic, Handler handler) = 0;
      virtual void send(const std::string& topic, const nlohmann::json& payload) = 0;
    };

  } // namespace io
} // namespace geoedge
