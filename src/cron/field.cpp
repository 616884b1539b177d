#include "cronspan/cron/field.hpp"
#include "cronspan/core/utils.hpp"

#include <optional>
#include <unordered_map>

namespace cronspan::cron {

namespace {

// ---------------------------------------------------------------------------
// Named value maps
// ---------------------------------------------------------------------------

const std::unordered_map<std::string, int> kMonthNames = {
    {"jan", 1}, {"feb", 2},  {"mar", 3},  {"apr", 4},
    {"may", 5}, {"jun", 6},  {"jul", 7},  {"aug", 8},
    {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12},
};

const std::unordered_map<std::string, int> kDayNames = {
    {"sun", 0}, {"mon", 1}, {"tue", 2}, {"wed", 3},
    {"thu", 4}, {"fri", 5}, {"sat", 6},
};

constexpr int kSundayAlias = 7;

auto malformed(FieldKind kind, std::string message, std::string_view token) -> Error {
    return make_error(ErrorCode::MalformedField, std::move(message),
                      std::string(field_name(kind)) + " '" + std::string(token) + "'");
}

auto names_for(FieldKind kind) -> const std::unordered_map<std::string, int>* {
    switch (kind) {
        case FieldKind::Month: return &kMonthNames;
        case FieldKind::DayOfWeek: return &kDayNames;
        default: return nullptr;
    }
}

/// Resolve a token to an integer, checking named values first.
/// Day-of-week accepts 7 here; the caller folds it into Sunday.
auto resolve_value(std::string_view token, FieldKind kind) -> Result<int> {
    if (auto* names = names_for(kind); names && token.size() == 3) {
        if (auto it = names->find(utils::to_lower(token)); it != names->end()) {
            return it->second;
        }
    }

    auto value = utils::parse_int(token);
    if (!value) {
        return std::unexpected(malformed(kind, "Invalid cron value", token));
    }

    int upper = kind == FieldKind::DayOfWeek ? kSundayAlias : field_max(kind);
    if (*value < field_min(kind) || *value > upper) {
        return std::unexpected(make_error(
            ErrorCode::MalformedField,
            "Cron value out of range",
            std::string(field_name(kind)) + " '" + std::string(token) + "' (expected " +
                std::to_string(field_min(kind)) + "-" + std::to_string(upper) + ")"));
    }
    return *value;
}

/// Parse one comma subentry. Usually yields one FieldSubentry; a
/// day-of-week range ending at 7 yields two (the 0-6 part and Sunday).
auto parse_subentry(std::string_view elem, FieldKind kind, std::vector<FieldSubentry>& out)
    -> VoidResult
{
    if (elem.empty()) {
        return std::unexpected(malformed(kind, "Empty cron subentry", elem));
    }

    // Step: split on '/'. An empty step means 1.
    int step = 1;
    bool has_step = false;
    std::string_view range_part = elem;
    std::string step_text;

    if (auto slash = elem.find('/'); slash != std::string_view::npos) {
        has_step = true;
        range_part = elem.substr(0, slash);
        auto step_part = elem.substr(slash + 1);

        if (!step_part.empty()) {
            auto s = utils::parse_int(step_part);
            if (!s || *s <= 0) {
                return std::unexpected(malformed(kind, "Invalid step value", elem));
            }
            step = *s;
            step_text = std::string(step_part);
        }
    }

    int start = 0;
    int end = 0;
    bool explicit_end = false;

    if (range_part == "*") {
        start = field_min(kind);
        end = field_max(kind);
        explicit_end = true;
    } else {
        auto dash = range_part.find('-');
        auto start_str = range_part.substr(0, dash);
        if (start_str.empty()) {
            return std::unexpected(malformed(kind, "Invalid range", elem));
        }

        auto start_result = resolve_value(start_str, kind);
        if (!start_result) return std::unexpected(start_result.error());
        start = *start_result;

        if (dash != std::string_view::npos) {
            auto end_str = range_part.substr(dash + 1);
            if (end_str.empty() || end_str.find('-') != std::string_view::npos) {
                return std::unexpected(malformed(kind, "Invalid range", elem));
            }
            auto end_result = resolve_value(end_str, kind);
            if (!end_result) return std::unexpected(end_result.error());
            end = *end_result;
            explicit_end = true;
        } else {
            // N/S runs to the domain maximum; a bare N is a single value.
            end = has_step ? field_max(kind) : start;
        }
    }

    if (kind == FieldKind::DayOfWeek && start == kSundayAlias) {
        if (explicit_end && end != kSundayAlias) {
            return std::unexpected(malformed(kind, "Invalid range", elem));
        }
        start = 0;
        end = (explicit_end || !has_step) ? 0 : field_max(kind);
    }

    if (start > end) {
        return std::unexpected(malformed(kind, "Invalid range", elem));
    }

    std::string text = std::to_string(start);
    if (explicit_end && end != start) text += "-" + std::to_string(end);
    if (!explicit_end && has_step) text += "-" + std::to_string(end);
    if (has_step) text += "/" + (step_text.empty() ? std::string("1") : step_text);

    if (kind == FieldKind::DayOfWeek && end == kSundayAlias) {
        out.push_back(FieldSubentry{
            .range_start = start, .range_end = field_max(kind), .step = step, .text = text});
        if ((kSundayAlias - start) % step == 0) {
            out.push_back(FieldSubentry{.range_start = 0, .range_end = 0, .step = 1, .text = text});
        }
        return {};
    }

    out.push_back(FieldSubentry{.range_start = start, .range_end = end, .step = step, .text = std::move(text)});
    return {};
}

} // anonymous namespace

auto field_name(FieldKind kind) -> std::string_view {
    switch (kind) {
        case FieldKind::Minute: return "minute";
        case FieldKind::Hour: return "hour";
        case FieldKind::DayOfMonth: return "day_of_month";
        case FieldKind::Month: return "month";
        case FieldKind::DayOfWeek: return "day_of_week";
    }
    return "unknown";
}

auto parse_field(std::string_view text, FieldKind kind) -> Result<std::vector<FieldSubentry>> {
    std::vector<FieldSubentry> subentries;

    for (const auto& part : utils::split(text, ',')) {
        if (auto result = parse_subentry(part, kind, subentries); !result) {
            return std::unexpected(result.error());
        }
    }

    return subentries;
}

} // namespace cronspan::cron
