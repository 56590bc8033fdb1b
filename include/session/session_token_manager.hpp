#ifndef DBRIDGE_SESSION_TOKEN_MANAGER_HPP
#define DBRIDGE_SESSION_TOKEN_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "http/http_transport.hpp"
#include "session/clock.hpp"
#include "session/session_error.hpp"
#include "session/session_state.hpp"
#include "session/token_cache.hpp"

namespace dbridge {
namespace session {

struct AuthResult {
  std::string access_token;
  int64_t expires_in{0};     // seconds
  TimePoint expires_at;
};

/**
 * Obtains a bearer token from the login endpoint and caches it with its
 * expiry. Safe to share between threads.
 *
 * authenticate() performs its network call outside the cache lock and only
 * takes the lock to commit the result, so concurrent calls race and the last
 * one to finish wins. Nothing here retries.
 */
class SessionTokenManager {
public:
  static constexpr std::chrono::seconds REFRESH_THRESHOLD{300};
  static constexpr int64_t DEFAULT_EXPIRES_IN = 3600;
  // Longest token lifetime accepted from the server (one year)
  static constexpr int64_t MAX_EXPIRES_IN = 365LL * 24 * 60 * 60;
  static constexpr const char* DEFAULT_LOGIN_TARGET = "/user/login";

  // Delete copy operations, the cache lock is owned by this instance
  SessionTokenManager(const SessionTokenManager&) = delete;
  SessionTokenManager& operator=(const SessionTokenManager&) = delete;


  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit SessionTokenManager(std::shared_ptr<http::HttpTransport> transport,
                               std::shared_ptr<Clock> clock = std::make_shared<SystemClock>(),
                               std::string login_target = DEFAULT_LOGIN_TARGET);


  // ---- AUTHENTICATION ----
  // Exchanges credentials for a token and caches it. Throws AuthError on
  // transport failure, a non-success status, or a response without a token.
  AuthResult authenticate(const std::string& username, const std::string& password);
  // Authenticates only when needs_refresh(); returns whether it did
  bool refresh_if_needed(const std::string& username, const std::string& password);
  // Drops the cached token
  void clear();


  // ---- TOKEN CHECKS ----
  // True when no token is cached or it expires within REFRESH_THRESHOLD
  bool needs_refresh() const;
  AuthStatus check_authenticated() const;
  // Throws NotAuthenticatedError or TokenExpiredError
  void validate_authenticated() const;
  // Validates and returns one consistent snapshot of the cached pair
  SessionToken require_token() const;


  // ---- GETTERS ----
  std::optional<SessionToken> snapshot() const { return cache_.snapshot(); }
  SessionState::State state() const;

private:
  // ---- PARAMETERS ----
  std::shared_ptr<http::HttpTransport> transport_;
  std::shared_ptr<Clock> clock_;
  std::string login_target_;
  TokenCache cache_;
  std::atomic<int> authentications_in_flight_{0};


  // ---- AUTHENTICATION SUPPORT ----
  http::HttpResponse post_credentials(const std::string& username, const std::string& password);
  AuthResult parse_auth_response(const http::HttpResponse& response) const;
  static AuthStatus status_of(const std::optional<SessionToken>& token, TimePoint now);
};

} // namespace session
} // namespace dbridge

#endif // DBRIDGE_SESSION_TOKEN_MANAGER_HPP
