#pragma once

#include <cstddef>
#include <functional>
#include <set>
#include <vector>

#include "cronspan/core/config.hpp"
#include "cronspan/core/error.hpp"
#include "cronspan/core/types.hpp"
#include "cronspan/cron/day_match.hpp"
#include "cronspan/cron/expression.hpp"
#include "cronspan/cron/window.hpp"

namespace cronspan::cron {

/// Expands cron expressions into the concrete instants at which they fire
/// within a bounded window.
///
/// Stateless apart from its configuration; one instance may be shared by
/// any number of threads.
class TimestampExpander {
public:
    /// Callback for streaming expansion. Return false to stop early.
    using Visitor = std::function<bool(Timestamp)>;

    /// Build an expander, validating `config` (InvalidConfiguration on an
    /// unknown day_match_mode or non-positive limits).
    static auto create(ExpanderConfig config = {}) -> Result<TimestampExpander>;

    [[nodiscard]] auto config() const noexcept -> const ExpanderConfig& { return config_; }
    [[nodiscard]] auto policy() const noexcept -> DayMatchPolicy { return policy_; }

    /// Day match mode this expander resolves for `expr`.
    [[nodiscard]] auto day_match_mode(const CronExpression& expr) const -> DayMatchMode;

    /// Every instant `expr` fires within a shared global window.
    auto expand(const CronExpression& expr, const GlobalWindow& window) const
        -> Result<std::set<Timestamp>>;

    /// Every instant `expr` fires within [start_at, end_at], both inclusive.
    auto expand(const CronExpression& expr, Timestamp start_at, Timestamp end_at) const
        -> Result<std::set<Timestamp>>;

    /// Streaming forms: visit instants in ascending order without
    /// materializing them. Not subject to max_results.
    auto for_each_trigger(const CronExpression& expr, const GlobalWindow& window,
                          const Visitor& visit) const -> VoidResult;
    auto for_each_trigger(const CronExpression& expr, Timestamp start_at, Timestamp end_at,
                          const Visitor& visit) const -> VoidResult;

    /// Upper bound on the number of instants `expand` would produce:
    /// surviving dates x matched hours x matched minutes.
    auto count_upper_bound(const CronExpression& expr, const GlobalWindow& window) const
        -> Result<std::size_t>;
    auto count_upper_bound(const CronExpression& expr, Timestamp start_at, Timestamp end_at) const
        -> Result<std::size_t>;

private:
    TimestampExpander(ExpanderConfig config, DayMatchPolicy policy);

    /// Dates of `range` that pass the month filter and the day filter.
    auto matching_dates(const CronExpression& expr, const DateRange& range) const
        -> std::vector<CivilDate>;

    auto expand_range(const CronExpression& expr, const DateRange& range) const
        -> Result<std::set<Timestamp>>;

    /// Fan surviving dates across matched hours x minutes, in ascending
    /// order, keeping instants within the range's bounds.
    void fan_out(const CronExpression& expr, const std::vector<CivilDate>& dates,
                 const DateRange& range, const Visitor& visit) const;

    ExpanderConfig config_;
    DayMatchPolicy policy_ = DayMatchPolicy::Vixie;
};

} // namespace cronspan::cron
