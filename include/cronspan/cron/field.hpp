#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "cronspan/core/error.hpp"

namespace cronspan::cron {

/// The five positional fields of a cron expression, in order.
enum class FieldKind {
    Minute,
    Hour,
    DayOfMonth,
    Month,
    DayOfWeek,
};

inline constexpr FieldKind kAllFields[] = {
    FieldKind::Minute, FieldKind::Hour, FieldKind::DayOfMonth,
    FieldKind::Month, FieldKind::DayOfWeek,
};

/// Smallest value of the field's domain.
[[nodiscard]] constexpr auto field_min(FieldKind kind) noexcept -> int {
    switch (kind) {
        case FieldKind::DayOfMonth:
        case FieldKind::Month: return 1;
        default: return 0;
    }
}

/// Largest value of the field's domain. Day-of-week is 0-6; the alias 7
/// for Sunday is folded into 0 by the parser.
[[nodiscard]] constexpr auto field_max(FieldKind kind) noexcept -> int {
    switch (kind) {
        case FieldKind::Minute: return 59;
        case FieldKind::Hour: return 23;
        case FieldKind::DayOfMonth: return 31;
        case FieldKind::Month: return 12;
        case FieldKind::DayOfWeek: return 6;
    }
    return 0;
}

auto field_name(FieldKind kind) -> std::string_view;

/// One comma-separated unit of a field, after wildcard and name
/// substitution: every value v with range_start <= v <= range_end and
/// (v - range_start) % step == 0.
///
/// Invariant: field_min <= range_start <= range_end <= field_max, step >= 1.
struct FieldSubentry {
    int range_start = 0;
    int range_end = 0;
    int step = 1;
    std::string text;  // normalized subentry text, e.g. "*/15" -> "0-59/15"

    auto operator==(const FieldSubentry&) const -> bool = default;
};

/// Parse one cron field into its subentries.
///
/// Supported syntax per subentry:
///   - `*`          the field's full domain
///   - `N`          single value
///   - `N-M`        range from N to M inclusive
///   - `N/S`        from N to the domain maximum, step S
///   - `N-M/S`      range with step S
///   - `*/S`        full domain with step S
///
/// Month names (jan-dec) and day names (sun-sat) are accepted
/// (case-insensitive); day-of-week 7 means Sunday.
///
/// @returns  The subentries in comma order, or MalformedField.
auto parse_field(std::string_view text, FieldKind kind) -> Result<std::vector<FieldSubentry>>;

} // namespace cronspan::cron
