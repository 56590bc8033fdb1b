#ifndef DBRIDGE_HTTP_BEAST_TRANSPORT_HPP
#define DBRIDGE_HTTP_BEAST_TRANSPORT_HPP

#include <chrono>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>
#include "http/http_transport.hpp"
#include "http/url.hpp"

namespace dbridge {
namespace http {

// HTTP(S) client on Boost.Beast. Every send() opens its own connection and
// io_context, runs the exchange against a single deadline, and closes it.
class BeastTransport : public HttpTransport {
public:
  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{30000};

  // Delete copy operations, the SSL context is not copyable
  BeastTransport(const BeastTransport&) = delete;
  BeastTransport& operator=(const BeastTransport&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BeastTransport(Url base_url,
                          std::chrono::milliseconds timeout = DEFAULT_TIMEOUT,
                          bool verify_certificates = true);
  ~BeastTransport() override = default;


  // ---- REQUEST OPERATIONS ----
  HttpResponse send(const HttpRequest& request) override;

private:
  using Clock = std::chrono::steady_clock;
  using BeastRequest = boost::beast::http::request<boost::beast::http::string_body>;

  // ---- PARAMETERS ----
  Url base_url_;
  std::chrono::milliseconds timeout_;
  boost::asio::ssl::context ssl_context_;


  // ---- EXCHANGE SUPPORT ----
  BeastRequest build_request(const HttpRequest& request) const;
  HttpResponse send_plain(const BeastRequest& request, Clock::time_point deadline);
  HttpResponse send_secure(const BeastRequest& request, Clock::time_point deadline);
};

} // namespace http
} // namespace dbridge

#endif // DBRIDGE_HTTP_BEAST_TRANSPORT_HPP
