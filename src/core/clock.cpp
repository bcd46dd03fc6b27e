#include "hsync/core/clock.hpp"

#include <ctime>

namespace hsync {

Timestamp SystemClock::now() const {
    return std::chrono::system_clock::now();
}

Date SystemClock::today() const {
    const std::time_t raw = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &raw);
#else
    localtime_r(&raw, &local);
#endif
    auto date = Date::from_ymd(local.tm_year + 1900,
                               static_cast<unsigned>(local.tm_mon + 1),
                               static_cast<unsigned>(local.tm_mday));
    return date.value_or(Date::from_timestamp_utc(std::chrono::system_clock::now()));
}

} // namespace hsync
