#pragma once
/** @file  HttpClient.hpp
 *  @brief Asynchronous request/response seam used by the provider client.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <string>

namespace geoedge {
  namespace io {

    enum class HttpMethod { Get, Post };

    struct HttpRequest {
      HttpMethod method{ HttpMethod::Get };
      std::string url;  ///< full URL including the query string
      std::string body; ///< JSON for POST, empty for GET
    };

    struct HttpReply {
      int status{ 0 };  ///< 0 = no HTTP response (DNS, connect, TLS...)
      std::string body;
      std::string transportError; ///< set when status == 0
    };

    class HttpClient {
    public:
      using Handler = std::function<void(HttpReply)>;

      virtual ~HttpClient() = default;

      /// Returns immediately; `handler` runs exactly once on the event loop.
      virtual void request(const HttpRequest& req, Handler handler) = 0;
    };

  } // namespace io
} // namespace geoedge
