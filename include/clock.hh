// Header file for the Clock hierarchy
// Time sources used by accounts with time-dependent rules

#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>
#include <ctime>
#include <string>

// Abstract base class for time sources
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    virtual time_point now() const = 0;
};

// Wall-clock time
class SystemClock : public Clock {
public:
    time_point now() const override { return std::chrono::system_clock::now(); }
};

// Clock that only moves when told to (deterministic lock-period tests)
class ManualClock : public Clock {
public:
    explicit ManualClock(time_point start = time_point{}) : current_(start) {}

    time_point now() const override { return current_; }

    void set(time_point t) { current_ = t; }
    void advance(std::chrono::system_clock::duration d) { current_ += d; }
    void advance_days(int days) { current_ += std::chrono::hours(24) * days; }

private:
    time_point current_;
};

// Calendar date in the local time zone, formatted YYYY-MM-DD
std::string format_local_date(std::time_t t);

#endif
