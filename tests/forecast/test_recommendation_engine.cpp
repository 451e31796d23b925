#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockcast/forecast/recommendation_engine.hpp"

using namespace stockcast::forecast;
using Catch::Approx;

TEST_CASE("RecommendationEngine flags stock below the reorder level", "[forecast][recommendation]") {
	const RecommendationEngine engine;

	const auto rec = engine.recommend(70.0, 40, 50);
	REQUIRE(rec.level == Severity::Urgent);
	REQUIRE(rec.days_of_stock == Approx(4.0));
	REQUIRE(rec.message == "URGENT: Stock below reorder level. Order immediately!");

	SECTION("Urgent dominates ample cover") {
		const auto at_level = engine.recommend(0.0, 50, 50);
		REQUIRE(at_level.level == Severity::Urgent);
		REQUIRE(at_level.days_of_stock == RecommendationEngine::kAmpleDays);
	}
}

TEST_CASE("RecommendationEngine grades days of cover", "[forecast][recommendation]") {
	const RecommendationEngine engine;

	SECTION("Critical") {
		const auto rec = engine.recommend(140.0, 60, 50);
		REQUIRE(rec.level == Severity::Critical);
		REQUIRE(rec.days_of_stock == Approx(3.0));
		REQUIRE(rec.message == "Critical: Stock will last only 3 days. Order now!");
	}

	SECTION("Warning") {
		const auto rec = engine.recommend(140.0, 100, 50);
		REQUIRE(rec.level == Severity::Warning);
		REQUIRE(rec.days_of_stock == Approx(5.0));
		REQUIRE(rec.message == "Warning: Stock will last 5 days. Consider ordering soon.");
	}

	SECTION("Ok") {
		const auto rec = engine.recommend(70.0, 200, 50);
		REQUIRE(rec.level == Severity::Ok);
		REQUIRE(rec.days_of_stock == Approx(20.0));
		REQUIRE(rec.display_days == Approx(20.0));
		REQUIRE(rec.message == "Good: Stock sufficient for 20 days.");
	}

	SECTION("Ok display is capped while the comparison uses the full value") {
		const auto rec = engine.recommend(7.0, 500, 50);
		REQUIRE(rec.level == Severity::Ok);
		REQUIRE(rec.days_of_stock == Approx(500.0));
		REQUIRE(rec.display_days == Approx(30.0));
		REQUIRE(rec.message == "Good: Stock sufficient for 30 days.");
	}

	SECTION("No forecast demand means ample stock") {
		const auto rec = engine.recommend(0.0, 80, 50);
		REQUIRE(rec.level == Severity::Ok);
		REQUIRE(rec.days_of_stock == RecommendationEngine::kAmpleDays);
		REQUIRE(rec.display_days == Approx(30.0));
	}
}

TEST_CASE("RecommendationEngine sums adjusted forecast points", "[forecast][recommendation]") {
	const RecommendationEngine engine;
	std::vector<AdaptiveForecastPoint> points(7);
	for (auto &point : points) {
		point.adjusted = 10.0;
		point.raw = 1000.0;
	}
	const auto rec = engine.recommend(points, 200, 50);
	REQUIRE(rec.days_of_stock == Approx(20.0));
	REQUIRE(toString(rec.level) == "ok");
	REQUIRE(toString(Severity::Urgent) == "urgent");
	REQUIRE(toString(Severity::Critical) == "critical");
	REQUIRE(toString(Severity::Warning) == "warning");
}
