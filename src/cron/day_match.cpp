#include "cronspan/cron/day_match.hpp"

#include <string>

namespace cronspan::cron {

auto parse_day_match_policy(std::string_view name) -> Result<DayMatchPolicy> {
    if (name == "vixie") return DayMatchPolicy::Vixie;
    if (name == "contains") return DayMatchPolicy::Contains;
    if (name == "union") return DayMatchPolicy::Union;
    if (name == "intersect") return DayMatchPolicy::Intersect;

    return std::unexpected(make_error(
        ErrorCode::InvalidConfiguration,
        "Unknown day match mode",
        "'" + std::string(name) + "' (expected vixie, contains, union or intersect)"));
}

auto to_string(DayMatchPolicy policy) -> std::string_view {
    switch (policy) {
        case DayMatchPolicy::Vixie: return "vixie";
        case DayMatchPolicy::Contains: return "contains";
        case DayMatchPolicy::Union: return "union";
        case DayMatchPolicy::Intersect: return "intersect";
    }
    return "vixie";
}

auto to_string(DayMatchMode mode) -> std::string_view {
    return mode == DayMatchMode::Union ? "union" : "intersect";
}

auto resolve_day_match_mode(std::string_view day_of_month, std::string_view day_of_week,
                            DayMatchPolicy policy) -> DayMatchMode {
    switch (policy) {
        case DayMatchPolicy::Union:
            return DayMatchMode::Union;
        case DayMatchPolicy::Intersect:
            return DayMatchMode::Intersect;
        case DayMatchPolicy::Vixie: {
            bool dom_star = day_of_month.starts_with('*');
            bool dow_star = day_of_week.starts_with('*');
            return (!dom_star && !dow_star) ? DayMatchMode::Union : DayMatchMode::Intersect;
        }
        case DayMatchPolicy::Contains: {
            bool dom_star = day_of_month.find('*') != std::string_view::npos;
            bool dow_star = day_of_week.find('*') != std::string_view::npos;
            return (!dom_star && !dow_star) ? DayMatchMode::Union : DayMatchMode::Intersect;
        }
    }
    return DayMatchMode::Intersect;
}

} // namespace cronspan::cron
