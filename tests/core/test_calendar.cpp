#include <catch2/catch_test_macros.hpp>

#include "cronspan/core/calendar.hpp"

using namespace cronspan;

TEST_CASE("days_in_month follows Gregorian leap rules", "[calendar]") {
    CHECK(calendar::days_in_month(2024, 2) == 29);
    CHECK(calendar::days_in_month(2023, 2) == 28);
    CHECK(calendar::days_in_month(1900, 2) == 28);
    CHECK(calendar::days_in_month(2000, 2) == 29);
    CHECK(calendar::days_in_month(2024, 4) == 30);
    CHECK(calendar::days_in_month(2024, 12) == 31);
    CHECK(calendar::days_in_month(2024, 13) == 0);
}

TEST_CASE("is_valid rejects nonexistent dates", "[calendar]") {
    CHECK(calendar::is_valid(CivilDate{.year = 2024, .month = 2, .day = 29}));
    CHECK_FALSE(calendar::is_valid(CivilDate{.year = 2024, .month = 2, .day = 30}));
    CHECK_FALSE(calendar::is_valid(CivilDate{.year = 2024, .month = 4, .day = 31}));
    CHECK_FALSE(calendar::is_valid(CivilDate{.year = 2024, .month = 0, .day = 1}));
}

TEST_CASE("weekday numbers Sunday as zero", "[calendar]") {
    CHECK(calendar::weekday(CivilDate{.year = 2024, .month = 1, .day = 1}) == 1);   // Monday
    CHECK(calendar::weekday(CivilDate{.year = 2024, .month = 1, .day = 7}) == 0);   // Sunday
    CHECK(calendar::weekday(CivilDate{.year = 2024, .month = 2, .day = 15}) == 4);  // Thursday
    CHECK(calendar::weekday(CivilDate{.year = 1970, .month = 1, .day = 1}) == 4);   // Thursday
}

TEST_CASE("add_days and days_between cross month and year ends", "[calendar]") {
    CivilDate feb28{.year = 2024, .month = 2, .day = 28};
    CHECK(calendar::add_days(feb28, 1) == CivilDate{.year = 2024, .month = 2, .day = 29});
    CHECK(calendar::add_days(feb28, 2) == CivilDate{.year = 2024, .month = 3, .day = 1});

    CivilDate dec31{.year = 2024, .month = 12, .day = 31};
    CHECK(calendar::add_days(dec31, 1) == CivilDate{.year = 2025, .month = 1, .day = 1});

    CHECK(calendar::days_between(CivilDate{.year = 2024, .month = 1, .day = 1},
                                 CivilDate{.year = 2025, .month = 1, .day = 1}) == 366);
    CHECK(calendar::days_between(dec31, feb28) == -307);
}

TEST_CASE("to_date and to_timestamp agree", "[calendar]") {
    CivilDate date{.year = 2024, .month = 7, .day = 15};
    auto ts = calendar::to_timestamp(date, 23, 59, 59);
    CHECK(calendar::to_date(ts) == date);
    CHECK(calendar::to_date(ts + std::chrono::seconds(1)) ==
          CivilDate{.year = 2024, .month = 7, .day = 16});
}

TEST_CASE("Dates past 2262 convert without overflow", "[calendar]") {
    CivilDate date{.year = 2300, .month = 1, .day = 1};
    auto ts = calendar::to_timestamp(date, 9);
    CHECK(calendar::to_date(ts) == date);
    CHECK(calendar::to_tm(ts).tm_year == 400);
    CHECK(calendar::to_tm(ts).tm_hour == 9);
    CHECK(calendar::add_days(date, 1) == CivilDate{.year = 2300, .month = 1, .day = 2});

    auto last = calendar::last_supported_instant();
    CHECK(calendar::to_date(last) == calendar::kLastSupportedDate);
    CHECK(calendar::to_date(calendar::first_supported_instant()) == calendar::kFirstSupportedDate);
}

TEST_CASE("Supported calendar spans years 1 through 9999", "[calendar]") {
    CHECK(calendar::days_between(calendar::kFirstSupportedDate, calendar::kLastSupportedDate) + 1 ==
          calendar::kSupportedDays);

    CHECK(calendar::is_supported(CivilDate{.year = 9999, .month = 12, .day = 31}));
    CHECK(calendar::is_supported(CivilDate{.year = 1, .month = 1, .day = 1}));
    CHECK_FALSE(calendar::is_supported(CivilDate{.year = 10000, .month = 1, .day = 1}));
    CHECK_FALSE(calendar::is_supported(CivilDate{.year = 0, .month = 12, .day = 31}));
    CHECK_FALSE(calendar::is_supported(CivilDate{.year = 2024, .month = 2, .day = 30}));
}
