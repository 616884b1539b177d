#include "cronspan/cron/batch.hpp"
#include "cronspan/core/logger.hpp"
#include "cronspan/core/utils.hpp"

#include <algorithm>
#include <thread>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

namespace cronspan::cron {

namespace {

/// Run fn(0) .. fn(count - 1). Each call touches only its own slot, so
/// entries are sharded across a thread pool without locking.
template <typename Fn>
void run_entries(std::size_t count, std::size_t worker_threads, Fn&& fn) {
    std::size_t workers = worker_threads;
    if (workers == 0) {
        workers = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    workers = std::min(workers, count);

    if (workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    boost::asio::thread_pool pool(workers);
    for (std::size_t i = 0; i < count; ++i) {
        boost::asio::post(pool, [&fn, i] { fn(i); });
    }
    pool.join();
}

void log_failure(const EntryResult& entry) {
    if (!entry.triggers) {
        LOG_WARN("Cron entry '{}' failed: {}", entry.cron, entry.triggers.error().what());
    }
}

} // anonymous namespace

void to_json(json& j, const TriggerInstant& t) {
    j = json{
        {"cron", t.cron},
        {"at", utils::format_timestamp(t.at)},
    };
    if (t.window_key) j["window_key"] = *t.window_key;
}

void to_json(json& j, const EntryResult& e) {
    j = json{{"cron", e.cron}};
    if (e.id) j["id"] = *e.id;
    if (e.window_key) j["window_key"] = *e.window_key;

    if (e.triggers) {
        auto triggers = json::array();
        for (auto at : *e.triggers) {
            triggers.push_back(utils::format_timestamp(at));
        }
        j["triggers"] = std::move(triggers);
    } else {
        j["error"] = json{
            {"code", std::string(error_code_to_string(e.triggers.error().code()))},
            {"message", e.triggers.error().what()},
        };
    }
}

void to_json(json& j, const BatchResult& b) {
    j = json{
        {"entries", b.entries},
        {"failures", b.failures()},
    };
}

auto BatchResult::instants() const -> std::set<TriggerInstant> {
    std::set<TriggerInstant> result;
    for (const auto& entry : entries) {
        if (!entry.triggers) continue;
        for (auto at : *entry.triggers) {
            result.insert(TriggerInstant{
                .cron = entry.cron,
                .window_key = entry.window_key,
                .at = at,
            });
        }
    }
    return result;
}

auto BatchResult::failures() const -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(
        entries, [](const EntryResult& e) { return !e.triggers.has_value(); }));
}

auto expand_global_window(const TimestampExpander& expander,
                          const std::vector<std::string>& crons,
                          const GlobalWindow& window) -> Result<BatchResult>
{
    // The window is shared, so a bad window fails the whole call.
    if (auto range = resolve_window(window, expander.config().max_date_range); !range) {
        return std::unexpected(range.error());
    }

    BatchResult batch;
    std::set<std::string> seen;
    for (const auto& cron : crons) {
        if (seen.insert(cron).second) {
            batch.entries.push_back(EntryResult{.cron = cron});
        }
    }

    run_entries(batch.entries.size(), expander.config().worker_threads, [&](std::size_t i) {
        auto& entry = batch.entries[i];
        auto expr = parse_cron(entry.cron);
        if (!expr) {
            entry.triggers = std::unexpected(expr.error());
        } else {
            entry.triggers = expander.expand(*expr, window);
        }
        log_failure(entry);
    });

    LOG_DEBUG("Global window {} +{}d: {} expressions, {} failed",
              utils::format_date(window.start_date), window.days_forward,
              batch.entries.size(), batch.failures());
    return batch;
}

auto expand_per_entry_window(const TimestampExpander& expander,
                             const std::vector<EntryWindow>& entries) -> BatchResult
{
    using EntryKey = std::tuple<std::optional<std::string>, std::string, Timestamp, Timestamp>;

    std::vector<const EntryWindow*> unique;
    std::set<EntryKey> seen;
    for (const auto& entry : entries) {
        if (seen.emplace(entry.id, entry.cron, entry.start_at, entry.end_at).second) {
            unique.push_back(&entry);
        }
    }

    BatchResult batch;
    batch.entries.resize(unique.size());

    run_entries(unique.size(), expander.config().worker_threads, [&](std::size_t i) {
        const auto& window = *unique[i];
        auto& entry = batch.entries[i];
        entry.id = window.id;
        entry.cron = window.cron;
        entry.window_key = window_key(window);

        auto expr = parse_cron(window.cron);
        if (!expr) {
            entry.triggers = std::unexpected(expr.error());
        } else {
            entry.triggers = expander.expand(*expr, window.start_at, window.end_at);
        }
        log_failure(entry);
    });

    LOG_DEBUG("Per-entry windows: {} entries, {} failed", batch.entries.size(), batch.failures());
    return batch;
}

auto expand_global_window(const std::vector<std::string>& crons, CivilDate start_date,
                          int days_forward, std::string_view day_match_mode,
                          ExpanderConfig config) -> Result<BatchResult>
{
    config.day_match_mode = std::string(day_match_mode);
    auto expander = TimestampExpander::create(std::move(config));
    if (!expander) return std::unexpected(expander.error());

    return expand_global_window(*expander, crons,
                                GlobalWindow{.start_date = start_date, .days_forward = days_forward});
}

auto expand_per_entry_window(const std::vector<EntryWindow>& entries, int max_date_range,
                             std::string_view day_match_mode, ExpanderConfig config)
    -> Result<BatchResult>
{
    config.max_date_range = max_date_range;
    config.day_match_mode = std::string(day_match_mode);
    auto expander = TimestampExpander::create(std::move(config));
    if (!expander) return std::unexpected(expander.error());

    return expand_per_entry_window(*expander, entries);
}

} // namespace cronspan::cron
