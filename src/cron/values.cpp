#include "cronspan/cron/values.hpp"

#include <algorithm>

namespace cronspan::cron {

auto FieldValues::is_full() const noexcept -> bool {
    for (int v = field_min(kind_); v <= field_max(kind_); ++v) {
        if (!bits_.test(static_cast<std::size_t>(v))) return false;
    }
    return true;
}

auto FieldValues::values() const -> std::vector<int> {
    std::vector<int> result;
    result.reserve(count());
    for (int v = field_min(kind_); v <= field_max(kind_); ++v) {
        if (bits_.test(static_cast<std::size_t>(v))) result.push_back(v);
    }
    return result;
}

void FieldValues::insert(int value) {
    if (value >= field_min(kind_) && value <= field_max(kind_)) {
        bits_.set(static_cast<std::size_t>(value));
    }
}

auto expand_subentry(const FieldSubentry& subentry, FieldKind kind) -> FieldValues {
    FieldValues values(kind);
    int first = std::max(subentry.range_start, field_min(kind));
    int last = std::min(subentry.range_end, field_max(kind));
    int step = std::max(subentry.step, 1);

    for (int v = first; v <= last; ++v) {
        if ((v - subentry.range_start) % step == 0) {
            values.insert(v);
        }
    }
    return values;
}

auto expand_field(const std::vector<FieldSubentry>& subentries, FieldKind kind) -> FieldValues {
    FieldValues values(kind);
    for (const auto& subentry : subentries) {
        values.merge(expand_subentry(subentry, kind));
    }
    return values;
}

auto trace_field(const std::vector<FieldSubentry>& subentries, FieldKind kind)
    -> std::map<int, std::vector<std::string>>
{
    std::map<int, std::vector<std::string>> trace;
    for (const auto& subentry : subentries) {
        for (int v : expand_subentry(subentry, kind).values()) {
            auto& matched = trace[v];
            // A day-of-week range ending at 7 is stored as two subentries
            // sharing one text; list it once.
            if (std::ranges::find(matched, subentry.text) == matched.end()) {
                matched.push_back(subentry.text);
            }
        }
    }
    return trace;
}

} // namespace cronspan::cron
