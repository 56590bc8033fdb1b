#ifndef DBRIDGE_SESSION_TOKEN_CACHE_HPP
#define DBRIDGE_SESSION_TOKEN_CACHE_HPP

#include <mutex>
#include <optional>
#include <string>
#include "session/clock.hpp"

namespace dbridge {
namespace session {

struct SessionToken {
  std::string token;
  TimePoint expires_at;

  bool is_expired(TimePoint now) const { return now >= expires_at; }
};

// Owns the cached (token, expiry) pair and the only lock guarding it.
// The pair is read and replaced as a whole, never field by field.
class TokenCache {
public:
  std::optional<SessionToken> snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
  }

  void store(SessionToken token) {
    std::lock_guard<std::mutex> lock(mutex_);
    token_ = std::move(token);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    token_.reset();
  }

private:
  mutable std::mutex mutex_;
  std::optional<SessionToken> token_;
};

} // namespace session
} // namespace dbridge

#endif // DBRIDGE_SESSION_TOKEN_CACHE_HPP
