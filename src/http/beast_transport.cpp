#include "http/beast_transport.hpp"
#include <string>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>
#include <openssl/ssl.h>

namespace dbridge {
namespace http {

namespace beast = boost::beast;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

boost::beast::http::verb to_verb(Method method) {
  switch (method) {
    case Method::GET:  return beast::http::verb::get;
    case Method::POST: return beast::http::verb::post;
    case Method::PUT:  return beast::http::verb::put;
  }
  return beast::http::verb::unknown;
}

// Runs one asynchronous step on the io_context until it completes or the
// deadline passes. The io_context is local to a single send(), so abandoned
// handlers are destroyed with it and never invoked.
template <typename Initiate>
void run_step(asio::io_context& ioc, std::chrono::steady_clock::time_point deadline,
              const char* step, Initiate&& initiate) {
  boost::system::error_code result = asio::error::would_block;
  bool completed = false;

  initiate([&result, &completed](boost::system::error_code ec, auto&&...) {
    result = ec;
    completed = true;
  });

  ioc.restart();
  ioc.run_until(deadline);

  if (!completed) {
    ioc.stop();
    BOOST_LOG_TRIVIAL(error) << "HTTP transport: Deadline exceeded during " << step;
    throw TransportError(std::string(step) + " timed out");
  }
  if (result) {
    BOOST_LOG_TRIVIAL(error) << "HTTP transport: " << step << " failed: " << result.message();
    throw TransportError(std::string(step) + " failed: " + result.message());
  }
}

template <typename Stream>
HttpResponse exchange(asio::io_context& ioc, Stream& stream,
                      const beast::http::request<beast::http::string_body>& request,
                      std::chrono::steady_clock::time_point deadline) {
  run_step(ioc, deadline, "write", [&](auto handler) {
    beast::http::async_write(stream, request, std::move(handler));
  });

  beast::flat_buffer buffer;
  beast::http::response<beast::http::string_body> response;
  run_step(ioc, deadline, "read", [&](auto handler) {
    beast::http::async_read(stream, buffer, response, std::move(handler));
  });

  HttpResponse result;
  result.status = response.result_int();
  result.body = std::move(response.body());
  return result;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BeastTransport::BeastTransport(Url base_url, std::chrono::milliseconds timeout, bool verify_certificates)
  : base_url_(std::move(base_url))
  , timeout_(timeout)
  , ssl_context_(asio::ssl::context::tls_client) {
  if (verify_certificates) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(asio::ssl::verify_peer);
  } else {
    BOOST_LOG_TRIVIAL(warning) << "HTTP transport: Certificate verification disabled";
    ssl_context_.set_verify_mode(asio::ssl::verify_none);
  }

  BOOST_LOG_TRIVIAL(info) << "HTTP transport: Using " << base_url_.scheme << "://" << base_url_.host
                          << ":" << base_url_.port << base_url_.base_path
                          << " (timeout " << timeout_.count() << " ms)";
}


//==============================================
// REQUEST OPERATIONS
//==============================================

HttpResponse BeastTransport::send(const HttpRequest& request) {
  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: " << method_to_string(request.method) << " " << request.target;

  auto deadline = Clock::now() + timeout_;
  BeastRequest beast_request = build_request(request);

  HttpResponse response = base_url_.is_secure() ? send_secure(beast_request, deadline)
                                                : send_plain(beast_request, deadline);

  BOOST_LOG_TRIVIAL(debug) << "HTTP transport: " << request.target << " answered with status " << response.status;
  return response;
}


//==============================================
// EXCHANGE SUPPORT
//==============================================

BeastTransport::BeastRequest BeastTransport::build_request(const HttpRequest& request) const {
  BeastRequest beast_request{to_verb(request.method), base_url_.base_path + request.target, 11};
  beast_request.set(beast::http::field::host, base_url_.host);
  for (const auto& [name, value] : request.headers) {
    beast_request.set(name, value);
  }
  beast_request.body() = request.body;
  beast_request.prepare_payload();
  return beast_request;
}

HttpResponse BeastTransport::send_plain(const BeastRequest& request, Clock::time_point deadline) {
  asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);

  tcp::resolver::results_type endpoints;
  run_step(ioc, deadline, "resolve", [&](auto handler) {
    resolver.async_resolve(base_url_.host, std::to_string(base_url_.port),
        [&endpoints, handler](boost::system::error_code ec, tcp::resolver::results_type results) mutable {
          endpoints = std::move(results);
          handler(ec);
        });
  });

  run_step(ioc, deadline, "connect", [&](auto handler) {
    stream.async_connect(endpoints, std::move(handler));
  });

  HttpResponse response = exchange(ioc, stream, request, deadline);

  boost::system::error_code ec;
  stream.socket().shutdown(tcp::socket::shutdown_both, ec);
  if (ec && ec != beast::errc::not_connected) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Socket shutdown reported: " << ec.message();
  }
  return response;
}

HttpResponse BeastTransport::send_secure(const BeastRequest& request, Clock::time_point deadline) {
  asio::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_context_);

  // SNI and host name verification
  if (!SSL_set_tlsext_host_name(stream.native_handle(), base_url_.host.c_str())) {
    BOOST_LOG_TRIVIAL(error) << "HTTP transport: Failed to set SNI host name";
    throw TransportError("Failed to set SNI host name " + base_url_.host);
  }
  stream.set_verify_callback(asio::ssl::host_name_verification(base_url_.host));

  tcp::resolver::results_type endpoints;
  run_step(ioc, deadline, "resolve", [&](auto handler) {
    resolver.async_resolve(base_url_.host, std::to_string(base_url_.port),
        [&endpoints, handler](boost::system::error_code ec, tcp::resolver::results_type results) mutable {
          endpoints = std::move(results);
          handler(ec);
        });
  });

  run_step(ioc, deadline, "connect", [&](auto handler) {
    beast::get_lowest_layer(stream).async_connect(endpoints, std::move(handler));
  });

  run_step(ioc, deadline, "TLS handshake", [&](auto handler) {
    stream.async_handshake(asio::ssl::stream_base::client, std::move(handler));
  });

  HttpResponse response = exchange(ioc, stream, request, deadline);

  // Servers often drop the connection without close_notify; that is not a failure
  try {
    run_step(ioc, deadline, "TLS shutdown", [&](auto handler) {
      stream.async_shutdown(std::move(handler));
    });
  } catch (const TransportError& e) {
    BOOST_LOG_TRIVIAL(debug) << "HTTP transport: Ignoring TLS shutdown result: " << e.what();
  }
  return response;
}

} // namespace http
} // namespace dbridge
