#include "session/session_token_manager.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>

namespace dbridge {
namespace session {

namespace {

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c); });
}

// Counts an authentication as in flight for the lifetime of the guard
class InFlightGuard {
public:
  explicit InFlightGuard(std::atomic<int>& counter) : counter_(counter) { ++counter_; }
  ~InFlightGuard() { --counter_; }

  InFlightGuard(const InFlightGuard&) = delete;
  InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
  std::atomic<int>& counter_;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SessionTokenManager::SessionTokenManager(std::shared_ptr<http::HttpTransport> transport,
                                         std::shared_ptr<Clock> clock,
                                         std::string login_target)
  : transport_(std::move(transport))
  , clock_(std::move(clock))
  , login_target_(std::move(login_target)) {
  if (!transport_ || !clock_) {
    throw std::invalid_argument("Session manager requires a transport and a clock");
  }
  BOOST_LOG_TRIVIAL(debug) << "Session: Token manager created for login target " << login_target_;
}


//==============================================
// AUTHENTICATION
//==============================================

AuthResult SessionTokenManager::authenticate(const std::string& username, const std::string& password) {
  if (is_blank(username)) {
    throw std::invalid_argument("Username cannot be empty");
  }
  if (is_blank(password)) {
    throw std::invalid_argument("Password cannot be empty");
  }

  BOOST_LOG_TRIVIAL(info) << "Session: Authenticating user " << username;
  InFlightGuard in_flight(authentications_in_flight_);

  // Network I/O happens without holding the cache lock
  http::HttpResponse response = post_credentials(username, password);
  AuthResult result = parse_auth_response(response);

  cache_.store(SessionToken{result.access_token, result.expires_at});
  BOOST_LOG_TRIVIAL(info) << "Session: Authenticated, token valid for " << result.expires_in << " s";
  return result;
}

bool SessionTokenManager::refresh_if_needed(const std::string& username, const std::string& password) {
  if (!needs_refresh()) {
    BOOST_LOG_TRIVIAL(trace) << "Session: Token still fresh";
    return false;
  }
  BOOST_LOG_TRIVIAL(info) << "Session: Token missing or close to expiry, re-authenticating";
  authenticate(username, password);
  return true;
}

void SessionTokenManager::clear() {
  cache_.clear();
  BOOST_LOG_TRIVIAL(info) << "Session: Cached token cleared";
}


//==============================================
// TOKEN CHECKS
//==============================================

bool SessionTokenManager::needs_refresh() const {
  auto token = cache_.snapshot();
  if (!token || token->token.empty()) {
    return true;
  }
  return clock_->now() + REFRESH_THRESHOLD >= token->expires_at;
}

AuthStatus SessionTokenManager::check_authenticated() const {
  return status_of(cache_.snapshot(), clock_->now());
}

void SessionTokenManager::validate_authenticated() const {
  require_token();
}

SessionToken SessionTokenManager::require_token() const {
  auto token = cache_.snapshot();
  AuthStatus status = status_of(token, clock_->now());
  if (status != AuthStatus::OK) {
    BOOST_LOG_TRIVIAL(warning) << "Session: Request rejected: " << auth_status_to_string(status);
    if (status == AuthStatus::TOKEN_EXPIRED) {
      throw TokenExpiredError();
    }
    throw NotAuthenticatedError();
  }
  return *token;
}

SessionState::State SessionTokenManager::state() const {
  auto token = cache_.snapshot();
  AuthStatus status = status_of(token, clock_->now());
  return SessionState::derive(status != AuthStatus::NOT_AUTHENTICATED,
                              status == AuthStatus::TOKEN_EXPIRED,
                              authentications_in_flight_.load() > 0);
}


//==============================================
// AUTHENTICATION SUPPORT
//==============================================

http::HttpResponse SessionTokenManager::post_credentials(const std::string& username,
                                                         const std::string& password) {
  nlohmann::json body = {
    {"username", username},
    {"password", password},
    {"remember_me", true}
  };

  http::HttpRequest request;
  request.method = http::Method::POST;
  request.target = login_target_;
  request.headers["Content-Type"] = "application/json";
  request.headers["Accept"] = "application/json";
  request.headers["User-Agent"] = http::USER_AGENT;
  request.body = body.dump();

  try {
    return transport_->send(request);
  } catch (const http::TransportError& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Could not reach login endpoint: " << e.what();
    throw AuthError(std::string("could not reach login endpoint: ") + e.what());
  }
}

AuthResult SessionTokenManager::parse_auth_response(const http::HttpResponse& response) const {
  if (!response.ok()) {
    BOOST_LOG_TRIVIAL(error) << "Session: Login endpoint answered with status " << response.status;
    throw AuthError("login endpoint answered with status " + std::to_string(response.status));
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Session: Login response is not JSON: " << e.what();
    throw AuthError("login response is not valid JSON");
  }

  if (!document.is_object()) {
    throw AuthError("login response is not a JSON object");
  }

  auto token_it = document.find("access_token");
  if (token_it == document.end() || !token_it->is_string() ||
      token_it->get<std::string>().empty()) {
    BOOST_LOG_TRIVIAL(error) << "Session: Login response carries no access token";
    throw AuthError("no access token returned from authentication endpoint");
  }

  AuthResult result;
  result.access_token = token_it->get<std::string>();
  result.expires_in = DEFAULT_EXPIRES_IN;

  auto expires_it = document.find("expires_in");
  if (expires_it != document.end() && !expires_it->is_null()) {
    if (!expires_it->is_number_integer()) {
      BOOST_LOG_TRIVIAL(error) << "Session: Login response has a non-integer expires_in";
      throw AuthError("expires_in is not an integer");
    }
    // Unsigned values above the cap are rejected before they can wrap into int64
    bool in_range = expires_it->is_number_unsigned()
                      ? expires_it->get<uint64_t>() <= static_cast<uint64_t>(MAX_EXPIRES_IN)
                      : expires_it->get<int64_t>() <= MAX_EXPIRES_IN;
    if (!in_range || expires_it->get<int64_t>() <= 0) {
      BOOST_LOG_TRIVIAL(error) << "Session: Login response has expires_in out of range: " << expires_it->dump();
      throw AuthError("expires_in must be between 1 and " + std::to_string(MAX_EXPIRES_IN) + " seconds");
    }
    result.expires_in = expires_it->get<int64_t>();
  }

  result.expires_at = clock_->now() + std::chrono::seconds(result.expires_in);
  return result;
}

AuthStatus SessionTokenManager::status_of(const std::optional<SessionToken>& token, TimePoint now) {
  if (!token || token->token.empty()) {
    return AuthStatus::NOT_AUTHENTICATED;
  }
  if (token->is_expired(now)) {
    return AuthStatus::TOKEN_EXPIRED;
  }
  return AuthStatus::OK;
}

} // namespace session
} // namespace dbridge
