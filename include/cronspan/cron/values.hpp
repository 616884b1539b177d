#pragma once

#include <bitset>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "cronspan/cron/field.hpp"

namespace cronspan::cron {

/// The set of concrete values a field matches, within its domain.
class FieldValues {
public:
    FieldValues() = default;
    explicit FieldValues(FieldKind kind) : kind_(kind) {}

    [[nodiscard]] auto kind() const noexcept -> FieldKind { return kind_; }

    [[nodiscard]] auto contains(int value) const noexcept -> bool {
        return value >= 0 && value < static_cast<int>(bits_.size()) &&
               bits_.test(static_cast<std::size_t>(value));
    }

    [[nodiscard]] auto count() const noexcept -> std::size_t { return bits_.count(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return bits_.none(); }

    /// True when every value of the field's domain matches.
    [[nodiscard]] auto is_full() const noexcept -> bool;

    /// Matched values in ascending order.
    [[nodiscard]] auto values() const -> std::vector<int>;

    void insert(int value);
    void merge(const FieldValues& other) { bits_ |= other.bits_; }

    auto operator==(const FieldValues& other) const -> bool {
        return kind_ == other.kind_ && bits_ == other.bits_;
    }

private:
    FieldKind kind_ = FieldKind::Minute;
    std::bitset<64> bits_;
};

/// Values matched by a single subentry.
auto expand_subentry(const FieldSubentry& subentry, FieldKind kind) -> FieldValues;

/// Values matched by any of a field's subentries (comma lists are inclusive-or).
auto expand_field(const std::vector<FieldSubentry>& subentries, FieldKind kind) -> FieldValues;

/// Diagnostic trace: each matched value mapped to the normalized texts of
/// the subentries that matched it, in comma order.
auto trace_field(const std::vector<FieldSubentry>& subentries, FieldKind kind)
    -> std::map<int, std::vector<std::string>>;

} // namespace cronspan::cron
