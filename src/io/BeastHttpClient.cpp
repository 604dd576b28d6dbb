/* @file BeastHttpClient.cpp
 * @brief asynchronous HTTPS session per provider request
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <memory>
#include <utility>

// 3rd-party headers
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

// GeoEdge headers
#include "core/Logger.hpp"
#include "io/BeastHttpClient.hpp"

using namespace geoedge::io;

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace {

  constexpr const char* kTag = "BeastHttpClient";
  constexpr std::chrono::seconds kTimeout{ 30 };

  class HttpsSession : public std::enable_shared_from_this<HttpsSession> {
  public:
    HttpsSession(net::io_context& io, ssl::context& ctx, geoedge::core::Logger& log,
                 HttpClient::Handler handler)
        : resolver_(net::make_strand(io)), stream_(net::make_strand(io), ctx), log_(log),
          handler_(std::move(handler)) {}

    void run(const HttpsUrl& url, const HttpRequest& req) {
      // SNI, most provider front-ends refuse the handshake without it
      if (!SSL_set_tlsext_host_name(stream_.native_handle(), url.host.c_str())) {
        beast::error_code ec{ static_cast<int>(::ERR_get_error()), net::error::get_ssl_category() };
        return fail(ec, "sni");
      }
      stream_.set_verify_mode(ssl::verify_peer);
      stream_.set_verify_callback(ssl::host_name_verification(url.host));

      req_.version(11);
      req_.method(req.method == HttpMethod::Post ? http::verb::post : http::verb::get);
      req_.target(url.target);
      req_.set(http::field::host, url.host);
      req_.set(http::field::user_agent, "geoedge");
      req_.set(http::field::accept, "application/json");
      if (req.method == HttpMethod::Post) {
        req_.set(http::field::content_type, "application/json");
        req_.body() = req.body;
      }
      req_.prepare_payload();

      resolver_.async_resolve(url.host, url.port,
                              beast::bind_front_handler(&HttpsSession::onResolve,
                                                        shared_from_this()));
    }

  private:
    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
      if (ec)
        return fail(ec, "resolve");

      beast::get_lowest_layer(stream_).expires_after(kTimeout);
      beast::get_lowest_layer(stream_).async_connect(
          results, beast::bind_front_handler(&HttpsSession::onConnect, shared_from_this()));
    }

    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
      if (ec)
        return fail(ec, "connect");

      stream_.async_handshake(ssl::stream_base::client,
                              beast::bind_front_handler(&HttpsSession::onHandshake,
                                                        shared_from_this()));
    }

    void onHandshake(beast::error_code ec) {
      if (ec)
        return fail(ec, "handshake");

      beast::get_lowest_layer(stream_).expires_after(kTimeout);
      http::async_write(stream_, req_,
                        beast::bind_front_handler(&HttpsSession::onWrite, shared_from_this()));
    }

    void onWrite(beast::error_code ec, std::size_t) {
      if (ec)
        return fail(ec, "write");

      http::async_read(stream_, buffer_, res_,
                       beast::bind_front_handler(&HttpsSession::onRead, shared_from_this()));
    }

    void onRead(beast::error_code ec, std::size_t) {
      if (ec)
        return fail(ec, "read");

      HttpReply reply;
      reply.status = static_cast<int>(res_.result_int());
      reply.body = std::move(res_.body());
      deliver(std::move(reply));

      beast::get_lowest_layer(stream_).expires_after(kTimeout);
      stream_.async_shutdown(
          beast::bind_front_handler(&HttpsSession::onShutdown, shared_from_this()));
    }

    void onShutdown(beast::error_code ec) {
      // servers routinely skip close_notify; the reply is already delivered
      if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated)
        log_.debug(kTag, "shutdown: " + ec.message());
    }

    void fail(beast::error_code ec, const char* what) {
      HttpReply reply;
      reply.transportError = std::string(what) + ": " + ec.message();
      log_.error(kTag, reply.transportError);
      deliver(std::move(reply));
    }

    void deliver(HttpReply reply) {
      auto handler = std::move(handler_);
      handler_ = nullptr;
      if (handler)
        handler(std::move(reply));
    }

    tcp::resolver resolver_;
    beast::ssl_stream<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    geoedge::core::Logger& log_;
    HttpClient::Handler handler_;
  };

} // namespace

BeastHttpClient::BeastHttpClient(net::io_context& io, core::Logger& log)
    : io_(io), ssl_(ssl::context::tls_client), log_(log) {
  ssl_.set_default_verify_paths();
  ssl_.set_verify_mode(ssl::verify_peer);
}

void BeastHttpClient::request(const HttpRequest& req, Handler handler) {
  auto url = parseUrl(req.url);
  if (!url) {
    log_.error(kTag, "unsupported URL " + req.url);
    // keep the "handler runs on the loop" contract
    net::post(io_, [handler = std::move(handler), target = req.url]() {
      HttpReply reply;
      reply.transportError = "unsupported URL " + target;
      handler(std::move(reply));
    });
    return;
  }

  log_.debug(kTag, std::string(req.method == HttpMethod::Post ? "POST " : "GET ") + url->host +
                       url->target.substr(0, url->target.find('?')));
  std::make_shared<HttpsSession>(io_, ssl_, log_, std::move(handler))->run(*url, req);
}

std::optional<HttpsUrl> BeastHttpClient::parseUrl(const std::string& url) {
  static const std::string kScheme = "https://";
  if (url.compare(0, kScheme.size(), kScheme) != 0)
    return std::nullopt;

  const auto rest = url.substr(kScheme.size());
  const auto slash = rest.find_first_of("/?");
  std::string authority = rest.substr(0, slash);
  if (authority.empty())
    return std::nullopt;

  HttpsUrl out;
  if (slash != std::string::npos) {
    out.target = rest.substr(slash);
    if (out.target.front() == '?')
      out.target.insert(0, "/");
  }

  if (auto colon = authority.find(':'); colon != std::string::npos) {
    out.port = authority.substr(colon + 1);
    authority.resize(colon);
    if (authority.empty() || out.port.empty() ||
        out.port.find_first_not_of("0123456789") != std::string::npos)
      return std::nullopt;
  }
  out.host = authority;
  return out;
}
