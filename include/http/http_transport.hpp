#ifndef DBRIDGE_HTTP_TRANSPORT_HPP
#define DBRIDGE_HTTP_TRANSPORT_HPP

#include <map>
#include <stdexcept>
#include <string>

namespace dbridge {
namespace http {

// Sent on every request to the cloud API
constexpr const char* USER_AGENT = "LevitonCrestronDriver/1.0";

enum class Method {
    GET,
    POST,
    PUT
};

inline const char* method_to_string(Method method) {
    switch (method) {
        case Method::GET:  return "GET";
        case Method::POST: return "POST";
        case Method::PUT:  return "PUT";
        default:           return "UNKNOWN";
    }
}

struct HttpRequest {
    Method method{Method::GET};
    // Path relative to the transport's base URL, e.g. "/devices/42/state"
    std::string target;
    std::map<std::string, std::string> headers;
    std::string body;
};

struct HttpResponse {
    unsigned status{0};
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Resolve, connect, TLS, read/write or deadline failure. A response with a
// non-success status is not a transport error.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error("Transport error: " + message) {}
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Sends one request and waits for the full response
    virtual HttpResponse send(const HttpRequest& request) = 0;

protected:
    HttpTransport() = default;
};

} // namespace http
} // namespace dbridge

#endif // DBRIDGE_HTTP_TRANSPORT_HPP
