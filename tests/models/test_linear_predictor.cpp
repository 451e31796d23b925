#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/usage_fixtures.hpp"
#include "stockcast/models/linear_predictor.hpp"

#include <limits>
#include <stdexcept>

using stockcast::features::FeatureVector;
using stockcast::models::LinearPredictor;
using Catch::Approx;

TEST_CASE("LinearPredictor evaluates intercept plus weighted features", "[models][linear]") {
	const auto predictor = tests::helpers::lagPredictor(2.0, 0.5);

	FeatureVector features;
	features.usage_lag_1 = 10.0;
	features.usage_mean_7d = 1000.0;
	REQUIRE(predictor.predict(features) == Approx(7.0));
	REQUIRE(predictor.getName() == "linear");
}

TEST_CASE("LinearPredictor serialises coefficients by feature name", "[models][linear][json]") {
	const auto predictor = tests::helpers::lagPredictor(1.5, 0.25);
	const auto document = predictor.toJson();

	REQUIRE(document["model_type"] == "linear");
	REQUIRE(document["intercept"].get<double>() == Approx(1.5));
	REQUIRE(document["coefficients"].size() == FeatureVector::kSize);
	REQUIRE(document["coefficients"]["usage_lag_1"].get<double>() == Approx(0.25));

	const auto restored = LinearPredictor::fromJson(document);
	REQUIRE(restored.intercept() == Approx(1.5));
	REQUIRE(restored.coefficients().isApprox(predictor.coefficients()));
}

TEST_CASE("LinearPredictor tolerates partial coefficient maps", "[models][linear][json]") {
	const auto document = nlohmann::json::parse(R"({
		"model_type": "linear",
		"intercept": 4.0,
		"coefficients": {"is_weekend": -2.0}
	})");
	const auto predictor = LinearPredictor::fromJson(document);

	FeatureVector weekend;
	weekend.is_weekend = 1.0;
	REQUIRE(predictor.predict(weekend) == Approx(2.0));
	REQUIRE(predictor.predict(FeatureVector{}) == Approx(4.0));
}

TEST_CASE("LinearPredictor rejects malformed parameters", "[models][linear][error]") {
	REQUIRE_THROWS_AS(LinearPredictor(0.0, Eigen::VectorXd::Zero(3)), std::invalid_argument);

	Eigen::VectorXd with_nan = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(FeatureVector::kSize));
	with_nan(0) = std::numeric_limits<double>::quiet_NaN();
	REQUIRE_THROWS_AS(LinearPredictor(0.0, with_nan), std::invalid_argument);

	REQUIRE_THROWS_AS(LinearPredictor::fromJson(nlohmann::json::parse(R"({"coefficients": {}})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(
	    LinearPredictor::fromJson(nlohmann::json::parse(R"({"intercept": 1, "coefficients": {"humidity": 1}})")),
	    std::invalid_argument);
	REQUIRE_THROWS_AS(
	    LinearPredictor::fromJson(nlohmann::json::parse(R"({"intercept": 1, "coefficients": {"month": "x"}})")),
	    std::invalid_argument);
}
