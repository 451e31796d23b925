#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockcast/features/feature_builder.hpp"

#include <cmath>
#include <stdexcept>
#include <vector>

using namespace stockcast::features;
using stockcast::core::Date;
using Catch::Approx;

TEST_CASE("FeatureBuilder derives calendar features from the target date", "[features][calendar]") {
	const FeatureBuilder builder;

	SECTION("Saturday at month end outside the rainy season") {
		const auto features = builder.build(1, Date::fromYmd(2024, 3, 30), {10.0});
		REQUIRE(features.day_of_week == 5.0);
		REQUIRE(features.day_of_month == 30.0);
		REQUIRE(features.month == 3.0);
		REQUIRE(features.week_of_month == 5.0);
		REQUIRE(features.is_weekend == 1.0);
		REQUIRE(features.is_month_end == 1.0);
		REQUIRE(features.is_rainy_season == 0.0);
	}

	SECTION("Monday at the start of a rainy month") {
		const auto features = builder.build(1, Date::fromYmd(2024, 4, 1), {10.0});
		REQUIRE(features.day_of_week == 0.0);
		REQUIRE(features.week_of_month == 1.0);
		REQUIRE(features.is_weekend == 0.0);
		REQUIRE(features.is_month_end == 0.0);
		REQUIRE(features.is_rainy_season == 1.0);
	}

	SECTION("Day 25 is not month end") {
		const auto features = builder.build(1, Date::fromYmd(2024, 8, 25), {10.0});
		REQUIRE(features.is_month_end == 0.0);
		REQUIRE(features.week_of_month == 4.0);
		REQUIRE(features.is_rainy_season == 0.0);
	}

	REQUIRE(FeatureBuilder::isRainySeason(9));
	REQUIRE_FALSE(FeatureBuilder::isRainySeason(8));
	REQUIRE_FALSE(FeatureBuilder::isRainySeason(12));
}

TEST_CASE("FeatureBuilder substitutes defaults for empty history", "[features][usage]") {
	const FeatureBuilder builder;
	const auto features = builder.build(7, Date::fromYmd(2024, 5, 2), {});

	REQUIRE(features.usage_lag_1 == FeatureBuilder::kDefaultUsage);
	REQUIRE(features.usage_lag_3 == FeatureBuilder::kDefaultUsage);
	REQUIRE(features.usage_lag_7 == FeatureBuilder::kDefaultUsage);
	REQUIRE(features.usage_lag_14 == FeatureBuilder::kDefaultUsage);
	REQUIRE(features.usage_mean_7d == FeatureBuilder::kDefaultUsage);
	REQUIRE(features.usage_mean_14d == FeatureBuilder::kDefaultUsage);
	REQUIRE(features.usage_std_7d == 0.0);
	REQUIRE(features.usage_std_14d == 0.0);
	REQUIRE(features.stock_level_ratio == 1.0);

	for (std::size_t i = 0; i < FeatureVector::kSize; ++i) {
		REQUIRE(std::isfinite(features.at(i)));
	}
}

TEST_CASE("FeatureBuilder pads short history with its mean", "[features][usage]") {
	const auto summary = FeatureBuilder::summarize({10.0, 20.0});

	REQUIRE(summary.series.size() == 14);
	REQUIRE(summary.lag_1 == 10.0);
	REQUIRE(summary.lag_3 == 15.0);
	REQUIRE(summary.lag_7 == 15.0);
	REQUIRE(summary.lag_14 == 15.0);
	REQUIRE(summary.mean_7d == Approx(15.0));
	REQUIRE(summary.mean_14d == Approx(15.0));
	// Population standard deviation of {10, 20, 15, 15, 15, 15, 15}.
	REQUIRE(summary.std_7d == Approx(std::sqrt(50.0 / 7.0)));
	REQUIRE(summary.std_14d == Approx(std::sqrt(50.0 / 14.0)));
}

TEST_CASE("FeatureBuilder uses only the lookback window", "[features][usage]") {
	std::vector<double> usage;
	for (int i = 1; i <= 20; ++i) {
		usage.push_back(static_cast<double>(i));
	}
	const auto summary = FeatureBuilder::summarize(usage);

	REQUIRE(summary.lag_1 == 1.0);
	REQUIRE(summary.lag_3 == 3.0);
	REQUIRE(summary.lag_7 == 7.0);
	REQUIRE(summary.lag_14 == 14.0);
	REQUIRE(summary.mean_7d == Approx(4.0));
	REQUIRE(summary.mean_14d == Approx(7.5));
	REQUIRE(summary.std_7d == Approx(2.0));
}

TEST_CASE("FeatureBuilder is pure", "[features][determinism]") {
	const FeatureBuilder builder;
	const std::vector<double> usage{12.0, 9.0, 14.0, 11.0, 10.0};
	const Date target = Date::fromYmd(2024, 10, 31);

	const auto first = builder.build(2, target, usage, 0.8);
	const auto second = builder.build(2, target, usage, 0.8);
	REQUIRE(first.toArray() == second.toArray());
	REQUIRE(first.stock_level_ratio == 0.8);
}

TEST_CASE("FeatureVector exposes the canonical schema", "[features][schema]") {
	const auto &names = FeatureVector::names();
	REQUIRE(names.size() == 16);
	REQUIRE(names.front() == "day_of_week");
	REQUIRE(names.back() == "stock_level_ratio");
	REQUIRE(FeatureVector::indexOf("usage_lag_7") == std::optional<std::size_t>(9));
	REQUIRE_FALSE(FeatureVector::indexOf("temperature").has_value());

	FeatureVector features;
	features.usage_mean_14d = 42.0;
	REQUIRE(features.at(*FeatureVector::indexOf("usage_mean_14d")) == 42.0);
	REQUIRE_THROWS_AS(features.at(16), std::out_of_range);
}
