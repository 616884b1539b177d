#include "cronspan/cron/expander.hpp"
#include "cronspan/core/calendar.hpp"
#include "cronspan/core/logger.hpp"
#include "cronspan/cron/day_filter.hpp"

#include <chrono>

namespace cronspan::cron {

namespace {

auto next_day(CivilDate date) -> CivilDate {
    if (date.day < calendar::days_in_month(date.year, date.month)) {
        ++date.day;
        return date;
    }
    date.day = 1;
    if (date.month == 12) {
        date.month = 1;
        ++date.year;
    } else {
        ++date.month;
    }
    return date;
}

} // anonymous namespace

TimestampExpander::TimestampExpander(ExpanderConfig config, DayMatchPolicy policy)
    : config_(std::move(config)), policy_(policy)
{
}

auto TimestampExpander::create(ExpanderConfig config) -> Result<TimestampExpander> {
    if (auto valid = validate_config(config); !valid) {
        return std::unexpected(valid.error());
    }
    auto policy = parse_day_match_policy(config.day_match_mode);
    if (!policy) return std::unexpected(policy.error());

    return TimestampExpander(std::move(config), *policy);
}

auto TimestampExpander::day_match_mode(const CronExpression& expr) const -> DayMatchMode {
    return resolve_day_match_mode(expr.field(FieldKind::DayOfMonth),
                                  expr.field(FieldKind::DayOfWeek), policy_);
}

auto TimestampExpander::matching_dates(const CronExpression& expr, const DateRange& range) const
    -> std::vector<CivilDate>
{
    std::vector<CivilDate> dates;
    if (range.day_count <= 0) return dates;

    const auto& months = expr.values(FieldKind::Month);
    const auto& dom = expr.values(FieldKind::DayOfMonth);
    const auto& dow = expr.values(FieldKind::DayOfWeek);
    auto mode = day_match_mode(expr);

    // Candidate dates are real calendar dates, so day-of-month values past
    // a month's last day (Feb 30) never match.
    auto date = range.first;
    int wday = calendar::weekday(date);
    for (int i = 0; i < range.day_count; ++i) {
        if (months.contains(date.month) && day_matches(date.day, wday, dom, dow, mode)) {
            dates.push_back(date);
        }
        date = next_day(date);
        wday = (wday + 1) % 7;
    }

    LOG_TRACE("Cron '{}' ({} mode): {} of {} days match", expr.raw(), to_string(mode),
              dates.size(), range.day_count);
    return dates;
}

void TimestampExpander::fan_out(const CronExpression& expr, const std::vector<CivilDate>& dates,
                                const DateRange& range, const Visitor& visit) const
{
    auto hours = expr.values(FieldKind::Hour).values();
    auto minutes = expr.values(FieldKind::Minute).values();

    for (const auto& date : dates) {
        auto midnight = calendar::to_timestamp(date);
        for (int hour : hours) {
            for (int minute : minutes) {
                auto at = midnight + std::chrono::hours(hour) + std::chrono::minutes(minute);
                if (at < range.lower) continue;
                if (at > range.upper) return;
                if (!visit(at)) return;
            }
        }
    }
}

auto TimestampExpander::expand_range(const CronExpression& expr, const DateRange& range) const
    -> Result<std::set<Timestamp>>
{
    auto dates = matching_dates(expr, range);

    auto bound = dates.size() * expr.values(FieldKind::Hour).count() *
                 expr.values(FieldKind::Minute).count();
    if (bound > config_.max_results) {
        return std::unexpected(make_error(
            ErrorCode::ResultTooLarge,
            "Expansion exceeds max_results",
            "'" + expr.raw() + "' yields up to " + std::to_string(bound) +
                " instants (max " + std::to_string(config_.max_results) + ")"));
    }

    std::set<Timestamp> instants;
    fan_out(expr, dates, range, [&instants](Timestamp at) {
        instants.insert(at);
        return true;
    });

    LOG_DEBUG("Expanded '{}' to {} instants over {} days", expr.raw(), instants.size(),
              range.day_count);
    return instants;
}

auto TimestampExpander::expand(const CronExpression& expr, const GlobalWindow& window) const
    -> Result<std::set<Timestamp>>
{
    auto range = resolve_window(window, config_.max_date_range);
    if (!range) return std::unexpected(range.error());
    return expand_range(expr, *range);
}

auto TimestampExpander::expand(const CronExpression& expr, Timestamp start_at,
                               Timestamp end_at) const -> Result<std::set<Timestamp>>
{
    auto range = resolve_window(start_at, end_at, config_.max_date_range);
    if (!range) return std::unexpected(range.error());
    return expand_range(expr, *range);
}

auto TimestampExpander::for_each_trigger(const CronExpression& expr, const GlobalWindow& window,
                                         const Visitor& visit) const -> VoidResult
{
    auto range = resolve_window(window, config_.max_date_range);
    if (!range) return std::unexpected(range.error());
    fan_out(expr, matching_dates(expr, *range), *range, visit);
    return {};
}

auto TimestampExpander::for_each_trigger(const CronExpression& expr, Timestamp start_at,
                                         Timestamp end_at, const Visitor& visit) const
    -> VoidResult
{
    auto range = resolve_window(start_at, end_at, config_.max_date_range);
    if (!range) return std::unexpected(range.error());
    fan_out(expr, matching_dates(expr, *range), *range, visit);
    return {};
}

auto TimestampExpander::count_upper_bound(const CronExpression& expr,
                                          const GlobalWindow& window) const
    -> Result<std::size_t>
{
    auto range = resolve_window(window, config_.max_date_range);
    if (!range) return std::unexpected(range.error());
    return matching_dates(expr, *range).size() * expr.values(FieldKind::Hour).count() *
           expr.values(FieldKind::Minute).count();
}

auto TimestampExpander::count_upper_bound(const CronExpression& expr, Timestamp start_at,
                                          Timestamp end_at) const -> Result<std::size_t>
{
    auto range = resolve_window(start_at, end_at, config_.max_date_range);
    if (!range) return std::unexpected(range.error());
    return matching_dates(expr, *range).size() * expr.values(FieldKind::Hour).count() *
           expr.values(FieldKind::Minute).count();
}

} // namespace cronspan::cron
