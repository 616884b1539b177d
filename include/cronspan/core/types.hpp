#pragma once

#include <chrono>
#include <compare>

#include <nlohmann/json.hpp>

namespace cronspan {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
/// Seconds precision, so any year 0001-9999 fits without overflow.
using Timestamp = std::chrono::time_point<Clock, std::chrono::seconds>;

/// A proleptic Gregorian calendar date, interpreted in UTC.
struct CivilDate {
    int year = 1970;
    int month = 1;   // 1-12
    int day = 1;     // 1-31

    auto operator<=>(const CivilDate&) const = default;
};

} // namespace cronspan
