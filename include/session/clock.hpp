#ifndef DBRIDGE_SESSION_CLOCK_HPP
#define DBRIDGE_SESSION_CLOCK_HPP

#include <chrono>

namespace dbridge {
namespace session {

using TimePoint = std::chrono::system_clock::time_point;

// UTC time source, replaceable in tests
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;

protected:
    Clock() = default;
};

class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

} // namespace session
} // namespace dbridge

#endif // DBRIDGE_SESSION_CLOCK_HPP
