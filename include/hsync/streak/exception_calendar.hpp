#pragma once

#include "hsync/core/date.hpp"

#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace hsync::streak {

/// Per-user days that neither break nor extend a streak
class ExceptionCalendar {
public:
    virtual ~ExceptionCalendar() = default;
    virtual bool is_exception_day(Date date, const std::string& user_id) const = 0;
};

class NoExceptions : public ExceptionCalendar {
public:
    bool is_exception_day(Date, const std::string&) const override { return false; }
};

struct VacationPeriod {
    Date start;
    Date end;   // inclusive

    bool contains(Date date) const { return date >= start && date <= end; }
};

/// Vacation periods per user, kept in memory
class VacationCalendar : public ExceptionCalendar {
public:
    void add_period(const std::string& user_id, Date start, Date end) {
        std::unique_lock lock(mutex_);
        if (end < start) {
            std::swap(start, end);
        }
        periods_[user_id].push_back(VacationPeriod{start, end});
    }

    void clear(const std::string& user_id) {
        std::unique_lock lock(mutex_);
        periods_.erase(user_id);
    }

    bool is_exception_day(Date date, const std::string& user_id) const override {
        std::shared_lock lock(mutex_);
        auto it = periods_.find(user_id);
        if (it == periods_.end()) {
            return false;
        }
        for (const auto& period : it->second) {
            if (period.contains(date)) {
                return true;
            }
        }
        return false;
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<VacationPeriod>> periods_;
};

} // namespace hsync::streak
