#ifndef DBRIDGE_HTTP_URL_HPP
#define DBRIDGE_HTTP_URL_HPP

#include <cstdint>
#include <string>

namespace dbridge {
namespace http {

struct Url {
  std::string scheme;      // "http" or "https"
  std::string host;
  uint16_t port{0};
  std::string base_path;   // no trailing slash, empty for the root

  bool is_secure() const { return scheme == "https"; }

  // Parses scheme://host[:port][/path]. Throws std::invalid_argument.
  static Url parse(const std::string& text);

  // Percent-encodes everything except RFC 3986 unreserved characters
  static std::string escape_segment(const std::string& segment);
};

} // namespace http
} // namespace dbridge

#endif // DBRIDGE_HTTP_URL_HPP
