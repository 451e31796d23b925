#include <catch2/catch_test_macros.hpp>

#include "stockcast/core/date.hpp"

#include <chrono>
#include <stdexcept>

using stockcast::core::Date;

TEST_CASE("Date converts between civil fields and day keys", "[core][date]") {
	const Date epoch = Date::fromYmd(1970, 1, 1);
	REQUIRE(epoch.dayKey() == 0);
	REQUIRE(epoch.weekday() == 3);
	REQUIRE(epoch.weekdayName() == "Thursday");

	const Date leap = Date::fromYmd(2024, 2, 29);
	REQUIRE(leap.year() == 2024);
	REQUIRE(leap.month() == 2);
	REQUIRE(leap.day() == 29);
	REQUIRE(leap.addDays(1) == Date::fromYmd(2024, 3, 1));
	REQUIRE(leap.toString() == "2024-02-29");

	const Date before_epoch = Date::fromYmd(1969, 12, 31);
	REQUIRE(before_epoch.dayKey() == -1);
	REQUIRE(before_epoch.weekdayName() == "Wednesday");
}

TEST_CASE("Date weekday uses Monday as zero", "[core][date]") {
	const Date friday = Date::fromYmd(2024, 3, 15);
	REQUIRE(friday.weekday() == 4);
	REQUIRE(friday.addDays(1).weekday() == 5);
	REQUIRE(friday.addDays(3).weekday() == 0);
	REQUIRE(friday.addDays(3).weekdayName() == "Monday");
	REQUIRE(friday.daysUntil(friday.addDays(10)) == 10);
}

TEST_CASE("Date parses ISO strings", "[core][date]") {
	REQUIRE(Date::parse("2023-11-05") == Date::fromYmd(2023, 11, 5));
	REQUIRE(Date::parse("2023-11-05").toString() == "2023-11-05");

	REQUIRE_THROWS_AS(Date::parse("2023/11/05"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("2023-1-5"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("2023-02-30"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("2023-13-01"), std::invalid_argument);
	REQUIRE_THROWS_AS(Date::parse("20a3-01-01"), std::invalid_argument);
}

TEST_CASE("Date month lengths follow the Gregorian calendar", "[core][date]") {
	REQUIRE(Date::daysInMonth(2024, 2) == 29);
	REQUIRE(Date::daysInMonth(2023, 2) == 28);
	REQUIRE(Date::daysInMonth(1900, 2) == 28);
	REQUIRE(Date::daysInMonth(2000, 2) == 29);
	REQUIRE(Date::daysInMonth(2023, 4) == 30);
	REQUIRE_THROWS_AS(Date::daysInMonth(2023, 0), std::invalid_argument);
}

TEST_CASE("Date handles time points and timestamps", "[core][date]") {
	using std::chrono::seconds;
	using std::chrono::system_clock;

	const system_clock::time_point tp{seconds{86400 * 2 + 3661}};
	REQUIRE(Date::fromTimePoint(tp) == Date::fromYmd(1970, 1, 3));
	REQUIRE(stockcast::core::formatTimestamp(tp) == "1970-01-03T01:01:01Z");

	const system_clock::time_point before{seconds{-1}};
	REQUIRE(Date::fromTimePoint(before) == Date::fromYmd(1969, 12, 31));
	REQUIRE(stockcast::core::formatTimestamp(before) == "1969-12-31T23:59:59Z");
}
