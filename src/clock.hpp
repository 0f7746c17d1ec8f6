#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <chrono>

/*
 * Time source of the presence engine.
 *
 * Presence timeouts are computed on the monotonic clock. Wall clock
 * time is only used to timestamp emitted events.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::steady_clock::time_point now() const = 0;
    virtual std::chrono::system_clock::time_point wallNow() const = 0;
};

class SystemClock : public Clock {
public:
    std::chrono::steady_clock::time_point now() const override;
    std::chrono::system_clock::time_point wallNow() const override;
};

#endif
