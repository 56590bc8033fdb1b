#ifndef DBRIDGE_SESSION_STATE_HPP
#define DBRIDGE_SESSION_STATE_HPP

#include <ostream>
#include <string>

namespace dbridge {
namespace session {

/**
 * Lifecycle of the cached bearer token:
 *
 *   UNAUTHENTICATED -> AUTHENTICATING -> AUTHENTICATED -> EXPIRED -> AUTHENTICATING -> ...
 *
 * clear() returns any state to UNAUTHENTICATED. The state is not stored; it
 * is derived from the cached token, the clock and the authentications in flight.
 */
class SessionState {
public:
    enum class State {
        UNAUTHENTICATED,
        AUTHENTICATING,
        AUTHENTICATED,
        EXPIRED
    };

    /**
     * Derive the state from a snapshot of the session.
     * An authentication in flight takes precedence over the cached token.
     */
    static State derive(bool has_token, bool expired, bool authenticating) {
        if (authenticating) {
            return State::AUTHENTICATING;
        }
        if (!has_token) {
            return State::UNAUTHENTICATED;
        }
        return expired ? State::EXPIRED : State::AUTHENTICATED;
    }

    // Convert state to string for logging
    static std::string state_to_string(State state) {
        switch (state) {
            case State::UNAUTHENTICATED: return "UNAUTHENTICATED";
            case State::AUTHENTICATING:  return "AUTHENTICATING";
            case State::AUTHENTICATED:   return "AUTHENTICATED";
            case State::EXPIRED:         return "EXPIRED";
            default:                     return "UNKNOWN";
        }
    }
};

// Stream operator for SessionState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const SessionState::State& state) {
    os << SessionState::state_to_string(state);
    return os;
}

} // namespace session
} // namespace dbridge

#endif // DBRIDGE_SESSION_STATE_HPP
