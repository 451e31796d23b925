#include <catch2/catch_test_macros.hpp>

#include "common/usage_fixtures.hpp"
#include "stockcast/core/usage_record.hpp"

#include <algorithm>
#include <stdexcept>

using namespace stockcast::core;

TEST_CASE("Usage history sorts newest first", "[core][usage]") {
	const Date today = tests::helpers::referenceDay();
	UsageHistory history = tests::helpers::makeHistory(1, today, {1.0, 2.0, 3.0, 4.0});
	std::reverse(history.begin(), history.end());
	REQUIRE(history.front().date == today.addDays(-3));

	sortMostRecentFirst(history);
	REQUIRE(history.front().date == today);
	REQUIRE(usageValues(history) == std::vector<double>{1.0, 2.0, 3.0, 4.0});
}

TEST_CASE("Trailing window keeps the recent portion", "[core][usage]") {
	const Date today = tests::helpers::referenceDay();
	const auto history = tests::helpers::makeHistory(1, today, tests::helpers::constantUsage(5.0, 40));

	SECTION("Limits both date range and record count") {
		const auto window = trailingWindow(history, today, 14);
		REQUIRE(window.size() == 14);
		REQUIRE(window.front().date == today);
		REQUIRE(window.back().date == today.addDays(-13));
	}

	SECTION("Drops records older than the range") {
		UsageHistory gappy{history[0], history[1], history[30]};
		const auto window = trailingWindow(gappy, today, 21);
		REQUIRE(window.size() == 2);
	}

	SECTION("Empty input and zero length yield empty windows") {
		REQUIRE(trailingWindow({}, today, 30).empty());
		REQUIRE(trailingWindow(history, today, 0).empty());
	}

	SECTION("Negative length is rejected") {
		REQUIRE_THROWS_AS(trailingWindow(history, today, -1), std::invalid_argument);
	}
}
