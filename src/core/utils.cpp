#include "cronspan/core/utils.hpp"
#include "cronspan/core/calendar.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>

namespace cronspan::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto split_whitespace(std::string_view s) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
        if (i >= s.size()) break;

        size_t start = i;
        while (i < s.size() && s[i] != ' ' && s[i] != '\t') ++i;
        tokens.emplace_back(s.substr(start, i - start));
    }
    return tokens;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto to_upper(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return result;
}

auto parse_int(std::string_view s) -> std::optional<int> {
    if (s.empty()) return std::nullopt;
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

auto format_date(const CivilDate& date) -> std::string {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", date.year, date.month, date.day);
    return buf;
}

auto format_timestamp(Timestamp ts) -> std::string {
    auto tm_val = calendar::to_tm(ts);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_val);
    return buf;
}

namespace {

/// Parses exactly `width` digits at `pos`.
auto fixed_digits(std::string_view s, size_t pos, size_t width) -> std::optional<int> {
    if (pos + width > s.size()) return std::nullopt;
    auto part = s.substr(pos, width);
    if (!std::ranges::all_of(part, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    return parse_int(part);
}

} // anonymous namespace

auto parse_date(std::string_view s) -> std::optional<CivilDate> {
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return std::nullopt;

    auto year = fixed_digits(s, 0, 4);
    auto month = fixed_digits(s, 5, 2);
    auto day = fixed_digits(s, 8, 2);
    if (!year || !month || !day) return std::nullopt;

    CivilDate date{.year = *year, .month = *month, .day = *day};
    if (!calendar::is_valid(date)) return std::nullopt;
    return date;
}

auto parse_timestamp(std::string_view s) -> std::optional<Timestamp> {
    auto text = trim(s);
    std::string_view view(text);

    auto date = parse_date(view.substr(0, std::min<size_t>(view.size(), 10)));
    if (!date) return std::nullopt;
    if (view.size() == 10) return calendar::to_timestamp(*date);

    auto time = view.substr(11);
    if (view[10] != ' ' && view[10] != 'T') return std::nullopt;
    if (time.ends_with('Z')) time.remove_suffix(1);
    if (time.size() != 5 && time.size() != 8) return std::nullopt;
    if (time[2] != ':' || (time.size() == 8 && time[5] != ':')) return std::nullopt;

    auto hour = fixed_digits(time, 0, 2);
    auto minute = fixed_digits(time, 3, 2);
    auto second = time.size() == 8 ? fixed_digits(time, 6, 2) : std::optional<int>(0);
    if (!hour || !minute || !second) return std::nullopt;
    if (*hour > 23 || *minute > 59 || *second > 59) return std::nullopt;

    return calendar::to_timestamp(*date, *hour, *minute, *second);
}

} // namespace cronspan::utils
