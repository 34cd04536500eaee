#ifndef SYNC_CLOCK_HPP
#define SYNC_CLOCK_HPP

#include <chrono>
#include <cstdint>


// Every timestamp and timer in the sync core comes from one of these
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::system_clock::now(); }
};


inline int64_t toMillis(Clock::time_point when) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
}

inline Clock::time_point fromMillis(int64_t millis) {
    return Clock::time_point(std::chrono::milliseconds(millis));
}

inline int64_t millisBetween(Clock::time_point from, Clock::time_point to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}


#endif
