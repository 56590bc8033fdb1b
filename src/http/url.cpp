#include "http/url.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dbridge {
namespace http {

Url Url::parse(const std::string& text) {
  Url url;

  size_t scheme_end = text.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument("URL has no scheme: " + text);
  }
  url.scheme = text.substr(0, scheme_end);
  for (auto& c : url.scheme) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (url.scheme != "http" && url.scheme != "https") {
    throw std::invalid_argument("Unsupported URL scheme: " + url.scheme);
  }

  size_t authority_start = scheme_end + 3;
  size_t path_start = text.find('/', authority_start);
  std::string authority = text.substr(authority_start, path_start - authority_start);
  std::string path = path_start == std::string::npos ? "" : text.substr(path_start);

  // Split host and optional port
  size_t colon_pos = authority.rfind(':');
  if (colon_pos == std::string::npos) {
    url.host = authority;
    url.port = url.is_secure() ? 443 : 80;
  } else {
    url.host = authority.substr(0, colon_pos);
    std::string port_str = authority.substr(colon_pos + 1);
    int port = 0;
    try {
      size_t consumed = 0;
      port = std::stoi(port_str, &consumed);
      if (consumed != port_str.size()) {
        port = 0;
      }
    } catch (const std::exception&) {
      port = 0;
    }
    if (port < 1 || port > 65535) {
      throw std::invalid_argument("Invalid URL port: " + port_str);
    }
    url.port = static_cast<uint16_t>(port);
  }

  if (url.host.empty()) {
    throw std::invalid_argument("URL has no host: " + text);
  }

  while (!path.empty() && path.back() == '/') {
    path.pop_back();
  }
  url.base_path = path;
  return url;
}

std::string Url::escape_segment(const std::string& segment) {
  std::ostringstream escaped;
  escaped << std::hex << std::uppercase << std::setfill('0');
  for (unsigned char c : segment) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << c;
    } else {
      escaped << '%' << std::setw(2) << static_cast<int>(c);
    }
  }
  return escaped.str();
}

} // namespace http
} // namespace dbridge
