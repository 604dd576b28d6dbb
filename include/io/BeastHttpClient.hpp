#pragma once
/** @file  BeastHttpClient.hpp
 *  @brief HTTPS HttpClient on Boost.Beast / OpenSSL, one connection per request.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "io/HttpClient.hpp"

namespace geoedge {
  namespace core {
    class Logger;
  }

  namespace io {

    struct HttpsUrl {
      std::string host;
      std::string port{ "443" };
      std::string target{ "/" }; ///< path + query
    };

    /**
 * @class BeastHttpClient
 * @brief Resolve → connect → TLS handshake → write → read, all asynchronous.
 *
 *  * Peer certificates are verified against the system trust store.
 *  * Any failure before a response is read is reported as status 0 with
 *    `transportError` set; the handler still runs exactly once.
 */
    class BeastHttpClient : public HttpClient {
    public:
      BeastHttpClient(boost::asio::io_context& io, core::Logger& log);
      ~BeastHttpClient() override = default;

      void request(const HttpRequest& req, Handler handler) override;

      /// Only `https://host[:port][/path][?query]` is accepted.
      static std::optional<HttpsUrl> parseUrl(const std::string& url);

      BeastHttpClient(const BeastHttpClient&) = delete;
      BeastHttpClient& operator=(const BeastHttpClient&) = delete;

    private:
      boost::asio::io_context& io_;
      boost::asio::ssl::context ssl_;
      core::Logger& log_;
    };

  } // namespace io
} // namespace geoedge
