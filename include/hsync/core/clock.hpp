#pragma once

#include "hsync/core/date.hpp"

namespace hsync {

/**
 * @brief Source of "now" and "today" for the engine
 *
 * Streak recomputation depends on what today is, and the resolver stamps
 * merged records with a fresh time, so both orchestrators take a Clock
 * instead of reading the system time directly.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual Timestamp now() const = 0;
    virtual Date today() const = 0;
};

/// Wall clock; today() is the calendar day in the local timezone
class SystemClock : public Clock {
public:
    Timestamp now() const override;
    Date today() const override;
};

class FixedClock : public Clock {
public:
    FixedClock(Timestamp now, Date today) : now_(now), today_(today) {}
    explicit FixedClock(Date today)
        : now_(today.to_timestamp_utc() + std::chrono::hours(12)), today_(today) {}

    Timestamp now() const override { return now_; }
    Date today() const override { return today_; }

    void set_now(Timestamp now) { now_ = now; }
    void set_today(Date today) { today_ = today; }
    void advance(std::chrono::milliseconds delta) { now_ += delta; }

private:
    Timestamp now_;
    Date today_;
};

} // namespace hsync
