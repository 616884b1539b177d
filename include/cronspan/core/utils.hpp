#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cronspan/core/types.hpp"

namespace cronspan::utils {

auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
auto split_whitespace(std::string_view s) -> std::vector<std::string>;
auto to_lower(std::string_view s) -> std::string;
auto to_upper(std::string_view s) -> std::string;

/// Parse a base-10 integer occupying the whole of `s`.
auto parse_int(std::string_view s) -> std::optional<int>;

/// Formats as `YYYY-MM-DD`.
auto format_date(const CivilDate& date) -> std::string;

/// Formats as `YYYY-MM-DDTHH:MM:SSZ` (UTC, seconds precision).
auto format_timestamp(Timestamp ts) -> std::string;

/// Parses `YYYY-MM-DD`. Rejects dates that do not exist (e.g. 2023-02-29).
auto parse_date(std::string_view s) -> std::optional<CivilDate>;

/// Parses a UTC timestamp. Accepted forms:
///   YYYY-MM-DD
///   YYYY-MM-DD HH:MM[:SS]
///   YYYY-MM-DDTHH:MM[:SS][Z]
auto parse_timestamp(std::string_view s) -> std::optional<Timestamp>;

} // namespace cronspan::utils
