#include <catch2/catch_test_macros.hpp>

#include <set>
#include <string>
#include <vector>

#include "cronspan/core/utils.hpp"
#include "cronspan/cron/batch.hpp"

using namespace cronspan;
using namespace cronspan::cron;

namespace {

auto at(std::string_view text) -> Timestamp {
    auto ts = utils::parse_timestamp(text);
    REQUIRE(ts.has_value());
    return *ts;
}

const CivilDate kNewYear{.year = 2024, .month = 1, .day = 1};

} // anonymous namespace

TEST_CASE("Global window batch isolates bad expressions", "[cron][batch]") {
    auto batch = expand_global_window({"0 9 * * *", "not a cron", "0 9 * * *", "30 8 * * MON"},
                                      kNewYear, 3);
    REQUIRE(batch.has_value());

    REQUIRE(batch->entries.size() == 3);
    CHECK(batch->failures() == 1);

    CHECK(batch->entries[0].cron == "0 9 * * *");
    REQUIRE(batch->entries[0].triggers.has_value());
    CHECK(batch->entries[0].triggers->size() == 3);
    CHECK_FALSE(batch->entries[0].window_key.has_value());

    CHECK(batch->entries[1].cron == "not a cron");
    REQUIRE_FALSE(batch->entries[1].triggers.has_value());
    CHECK(batch->entries[1].triggers.error().code() == ErrorCode::MalformedField);

    auto instants = batch->instants();
    CHECK(instants.size() == 4);  // three daily + Monday 2024-01-01 08:30
    CHECK(instants.count(TriggerInstant{.cron = "30 8 * * MON", .at = at("2024-01-01T08:30")}) == 1);
}

TEST_CASE("Global window batch fails as a whole on a bad window", "[cron][batch]") {
    auto negative = expand_global_window({"0 9 * * *"}, kNewYear, -1);
    REQUIRE_FALSE(negative.has_value());
    CHECK(negative.error().code() == ErrorCode::InvalidWindow);

    auto huge = expand_global_window({"0 9 * * *"}, kNewYear, 5000);
    REQUIRE_FALSE(huge.has_value());
    CHECK(huge.error().code() == ErrorCode::WindowTooLarge);
}

TEST_CASE("Unknown day match mode is a configuration error", "[cron][batch]") {
    auto global = expand_global_window({"0 9 * * *"}, kNewYear, 3, "both");
    REQUIRE_FALSE(global.has_value());
    CHECK(global.error().code() == ErrorCode::InvalidConfiguration);

    auto per_entry = expand_per_entry_window({}, 1095, "");
    REQUIRE_FALSE(per_entry.has_value());
    CHECK(per_entry.error().code() == ErrorCode::InvalidConfiguration);

    auto no_range = expand_per_entry_window({}, 0);
    REQUIRE_FALSE(no_range.has_value());
    CHECK(no_range.error().code() == ErrorCode::InvalidConfiguration);
}

TEST_CASE("Per-entry batch keys instants by window", "[cron][batch]") {
    std::vector<EntryWindow> entries{
        {.id = "morning", .cron = "0 9 * * *",
         .start_at = at("2024-01-01"), .end_at = at("2024-01-02T23:59")},
        {.cron = "0 9 * * *", .start_at = at("2024-01-05"), .end_at = at("2024-01-05T12:00")},
        {.id = "morning", .cron = "0 9 * * *",
         .start_at = at("2024-01-01"), .end_at = at("2024-01-02T23:59")},
        {.id = "backwards", .cron = "0 9 * * *",
         .start_at = at("2024-01-05"), .end_at = at("2024-01-01")},
        {.id = "too-long", .cron = "0 9 * * *",
         .start_at = at("2024-01-01"), .end_at = at("2024-03-01")},
        {.id = "broken", .cron = "0 9 * *",
         .start_at = at("2024-01-01"), .end_at = at("2024-01-02")},
    };

    auto batch = expand_per_entry_window(entries, 30);
    REQUIRE(batch.has_value());
    REQUIRE(batch->entries.size() == 5);
    CHECK(batch->failures() == 3);

    CHECK(batch->entries[0].window_key == "morning");
    CHECK(batch->entries[1].window_key == "0 9 * * *-2024-01-05-2024-01-05");
    CHECK(batch->entries[2].triggers.error().code() == ErrorCode::InvalidWindow);
    CHECK(batch->entries[3].triggers.error().code() == ErrorCode::WindowTooLarge);
    CHECK(batch->entries[4].triggers.error().code() == ErrorCode::MalformedField);

    auto instants = batch->instants();
    CHECK(instants == std::set<TriggerInstant>{
        {.cron = "0 9 * * *", .window_key = "0 9 * * *-2024-01-05-2024-01-05", .at = at("2024-01-05T09:00")},
        {.cron = "0 9 * * *", .window_key = "morning", .at = at("2024-01-01T09:00")},
        {.cron = "0 9 * * *", .window_key = "morning", .at = at("2024-01-02T09:00")},
    });
}

TEST_CASE("Same cron in different windows stays distinct", "[cron][batch]") {
    std::vector<EntryWindow> entries{
        {.id = "a", .cron = "0 9 * * *", .start_at = at("2024-01-01"), .end_at = at("2024-01-01T23:00")},
        {.id = "b", .cron = "0 9 * * *", .start_at = at("2024-01-01"), .end_at = at("2024-01-01T23:00")},
    };
    auto batch = expand_per_entry_window(entries);
    REQUIRE(batch.has_value());
    CHECK(batch->entries.size() == 2);
    CHECK(batch->instants().size() == 2);
}

TEST_CASE("Batch results serialize to JSON", "[cron][batch]") {
    auto batch = expand_global_window({"0 9 * * *", "61 * * * *"}, kNewYear, 1);
    REQUIRE(batch.has_value());

    json j = *batch;
    CHECK(j["failures"] == 1);
    REQUIRE(j["entries"].size() == 2);
    CHECK(j["entries"][0]["cron"] == "0 9 * * *");
    CHECK(j["entries"][0]["triggers"] == json::array({"2024-01-01T09:00:00Z"}));
    CHECK(j["entries"][1]["error"]["code"] == "MALFORMED_FIELD");
    CHECK_FALSE(j["entries"][1].contains("triggers"));

    json instant = *batch->instants().begin();
    CHECK(instant["cron"] == "0 9 * * *");
    CHECK(instant["at"] == "2024-01-01T09:00:00Z");
    CHECK_FALSE(instant.contains("window_key"));
}

TEST_CASE("Parallel expansion matches serial expansion", "[cron][batch]") {
    std::vector<std::string> crons{
        "0 9 * * *", "*/15 * * * *", "0 12 15 * MON", "0 0 1 1 *", "30 23 * * 7",
        "0 */2 1-10 * *", "5,10 4 * JUN-AUG *", "0 0 30 2 *", "bad", "0 8 * * 1-5",
    };

    auto serial = expand_global_window(crons, kNewYear, 365);
    auto parallel = expand_global_window(crons, kNewYear, 365, "vixie",
                                         ExpanderConfig{.worker_threads = 4});
    REQUIRE(serial.has_value());
    REQUIRE(parallel.has_value());

    REQUIRE(parallel->entries.size() == serial->entries.size());
    for (std::size_t i = 0; i < serial->entries.size(); ++i) {
        CHECK(parallel->entries[i].cron == serial->entries[i].cron);
    }
    CHECK(parallel->failures() == 1);
    CHECK(parallel->instants() == serial->instants());
}

TEST_CASE("Windows past 2262 expand to correct instants", "[cron][batch]") {
    auto batch = expand_global_window({"0 9 * * *"}, CivilDate{.year = 2300, .month = 1, .day = 1}, 2);
    REQUIRE(batch.has_value());
    REQUIRE(batch->entries.size() == 1);
    REQUIRE(batch->entries[0].triggers.has_value());

    json j = *batch;
    CHECK(j["entries"][0]["triggers"] ==
          json::array({"2300-01-01T09:00:00Z", "2300-01-02T09:00:00Z"}));
}

TEST_CASE("A large configured max_date_range expands without overflow", "[cron][batch]") {
    auto batch = expand_global_window({"0 0 1 1 *"}, kNewYear, 150000, "vixie",
                                      ExpanderConfig{.max_date_range = 200000});
    REQUIRE(batch.has_value());
    REQUIRE(batch->entries[0].triggers.has_value());

    // Every New Year from 2024 through 2434; 2435-01-01 is day 150115.
    const auto& triggers = *batch->entries[0].triggers;
    CHECK(triggers.size() == 411);
    CHECK(utils::format_timestamp(*triggers.begin()) == "2024-01-01T00:00:00Z");
    CHECK(utils::format_timestamp(*triggers.rbegin()) == "2434-01-01T00:00:00Z");

    SECTION("a limit longer than the calendar is a configuration error") {
        auto rejected = expand_global_window({"0 0 1 1 *"}, kNewYear, 1, "vixie",
                                             ExpanderConfig{.max_date_range = 4000000});
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().code() == ErrorCode::InvalidConfiguration);
    }
}
