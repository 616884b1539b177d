#pragma once

#include <string_view>

#include "cronspan/core/error.hpp"

namespace cronspan::cron {

/// How day-of-month and day-of-week matches are combined for one expression.
enum class DayMatchMode {
    Union,      // either day field may match
    Intersect,  // both day fields must match
};

/// Configured policy from which each expression's DayMatchMode is resolved.
enum class DayMatchPolicy {
    Vixie,      // keyed on the first character of each raw day field
    Contains,   // keyed on a '*' anywhere in each raw day field
    Union,
    Intersect,
};

/// Parse `vixie`, `contains`, `union` or `intersect` (exact, lower case).
/// Any other value fails with InvalidConfiguration.
auto parse_day_match_policy(std::string_view name) -> Result<DayMatchPolicy>;

auto to_string(DayMatchPolicy policy) -> std::string_view;
auto to_string(DayMatchMode mode) -> std::string_view;

/// Resolve the day match mode of one expression from its raw, unexpanded
/// day-of-month and day-of-week field strings.
///
/// Vixie: Union when neither field starts with '*', Intersect otherwise.
/// Only the first character is examined, so "1,*" counts as restricted.
/// Contains: the same test against a '*' anywhere in the field.
/// Union / Intersect: fixed, regardless of the fields.
auto resolve_day_match_mode(std::string_view day_of_month, std::string_view day_of_week,
                            DayMatchPolicy policy) -> DayMatchMode;

} // namespace cronspan::cron
