#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "cronspan/core/error.hpp"
#include "cronspan/cron/field.hpp"
#include "cronspan/cron/values.hpp"

namespace cronspan::cron {

/// A parsed, immutable 5-field cron expression
/// (`minute hour day-of-month month day-of-week`).
///
/// Identity is the original string: "*/1 * * * *" and "* * * * *" match
/// the same instants but are different expressions.
class CronExpression {
public:
    /// Parse a cron expression of exactly five whitespace-separated fields.
    ///
    /// @param expr  The cron expression, e.g. "0 */2 * * 1-5".
    /// @returns     The expression, or MalformedField naming the offending
    ///              field and the full expression.
    static auto parse(std::string_view expr) -> Result<CronExpression>;

    /// The expression exactly as supplied.
    [[nodiscard]] auto raw() const noexcept -> const std::string& { return raw_; }

    /// Raw, unexpanded text of one field.
    [[nodiscard]] auto field(FieldKind kind) const -> const std::string& {
        return fields_[index(kind)];
    }

    [[nodiscard]] auto subentries(FieldKind kind) const -> const std::vector<FieldSubentry>& {
        return subentries_[index(kind)];
    }

    [[nodiscard]] auto values(FieldKind kind) const -> const FieldValues& {
        return values_[index(kind)];
    }

    auto operator==(const CronExpression& other) const -> bool { return raw_ == other.raw_; }

private:
    CronExpression() = default;

    static constexpr auto index(FieldKind kind) noexcept -> std::size_t {
        return static_cast<std::size_t>(kind);
    }

    std::string raw_;
    std::array<std::string, 5> fields_;
    std::array<std::vector<FieldSubentry>, 5> subentries_;
    std::array<FieldValues, 5> values_;
};

/// Convenience wrapper for CronExpression::parse.
auto parse_cron(std::string_view expr) -> Result<CronExpression>;

} // namespace cronspan::cron
