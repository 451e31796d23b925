#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "stockcast/core/usage_ledger.hpp"
#include "stockcast/features/training_set.hpp"
#include "stockcast/models/predictor_codec.hpp"
#include "stockcast/models/ridge_trainer.hpp"

#include <cmath>
#include <stdexcept>

using namespace stockcast;
using Catch::Approx;

namespace {

// target = 5 + 2 * usage_lag_1 - 3 * is_weekend
features::TrainingSet linearSet(std::size_t count) {
	features::TrainingSet set;
	const core::Date start = core::Date::fromYmd(2024, 1, 1);
	for (std::size_t i = 0; i < count; ++i) {
		const core::Date date = start.addDays(static_cast<std::int64_t>(i));
		features::FeatureVector features;
		features::FeatureBuilder::applyCalendar(date, features);
		features.usage_lag_1 = static_cast<double>(i % 17) + 0.5 * static_cast<double>(i % 5);
		set.features.push_back(features);
		set.targets.push_back(5.0 + 2.0 * features.usage_lag_1 - 3.0 * features.is_weekend);
		set.dates.push_back(date);
	}
	return set;
}

} // namespace

TEST_CASE("RidgeTrainer recovers a linear relationship", "[models][trainer]") {
	auto trainer = models::RidgeTrainerBuilder().withLambda(1e-6).build();
	const auto data = linearSet(60);

	models::TrainingReport report;
	const auto model = trainer->train(data, &report);

	REQUIRE(report.train_samples == 48);
	REQUIRE(report.test_samples == 12);
	REQUIRE(report.holdout.n == 12);
	REQUIRE(report.holdout.mae < 1e-3);

	features::FeatureVector weekday;
	weekday.usage_lag_1 = 10.0;
	weekday.day_of_week = 2.0;
	REQUIRE(model->predict(weekday) == Approx(25.0).margin(0.05));
}

TEST_CASE("RidgeTrainer penalty shrinks slopes but not the intercept", "[models][trainer]") {
	features::TrainingSet data;
	for (int i = 0; i < 40; ++i) {
		features::FeatureVector features;
		features.usage_lag_1 = static_cast<double>(i % 2);
		data.features.push_back(features);
		data.targets.push_back(50.0);
	}

	auto trainer = models::RidgeTrainerBuilder().withLambda(1000.0).build();
	const auto model = trainer->fit(data.features, data.targets);
	REQUIRE(model->intercept() == Approx(50.0).margin(1e-6));
	REQUIRE(model->coefficients().cwiseAbs().maxCoeff() < 1e-6);
}

TEST_CASE("RidgeTrainer validates configuration and data", "[models][trainer][error]") {
	REQUIRE_THROWS_AS(models::RidgeTrainerBuilder().withLambda(-1.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(models::RidgeTrainerBuilder().withHoldoutFraction(1.0).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(models::RidgeTrainerBuilder().withHoldoutFraction(-0.1).build(), std::invalid_argument);

	auto trainer = models::RidgeTrainerBuilder().build();
	REQUIRE_THROWS_AS(trainer->train(linearSet(29)), std::invalid_argument);
	REQUIRE_NOTHROW(trainer->train(linearSet(30)));

	auto permissive = models::RidgeTrainerBuilder().withMinSamples(5).withHoldoutFraction(0.0).build();
	models::TrainingReport report;
	REQUIRE_NOTHROW(permissive->train(linearSet(5), &report));
	REQUIRE(report.test_samples == 0);
	REQUIRE(report.train_samples == 5);
}

TEST_CASE("RidgeTrainer output serves from a ledger replay", "[models][trainer][integration]") {
	std::vector<double> usage;
	for (int day = 0; day < 90; ++day) {
		usage.push_back(20.0 + static_cast<double>(day % 7) * 2.0);
	}
	const auto ledger = core::foldStockLedger(11, core::Date::fromYmd(2024, 1, 1), 300, 60, usage);
	const auto data = features::TrainingSetBuilder().build(ledger);
	REQUIRE(data.size() == 76);

	auto trainer = models::RidgeTrainerBuilder().withLambda(0.1).build();
	models::TrainingReport report;
	const auto model = trainer->train(data, &report);
	REQUIRE(report.holdout.mape.has_value());
	REQUIRE(*report.holdout.mape < 25.0);

	const auto restored = models::deserializePredictor("model_11.json", models::serializePredictor(*model, 11), 11);
	REQUIRE(restored->predict(data.features.back()) == Approx(model->predict(data.features.back())));
}

TEST_CASE("HoldoutAccuracy summarises forecast error", "[models][trainer][accuracy]") {
	Eigen::VectorXd actual(4);
	actual << 10.0, 20.0, 30.0, 40.0;
	Eigen::VectorXd predicted(4);
	predicted << 12.0, 18.0, 33.0, 41.0;

	const auto accuracy = models::HoldoutAccuracy::measure(actual, predicted);
	REQUIRE(accuracy.n == 4);
	REQUIRE(accuracy.mae == Approx(2.0));
	REQUIRE(accuracy.rmse == Approx(std::sqrt((4.0 + 4.0 + 9.0 + 1.0) / 4.0)));
	REQUIRE(accuracy.bias == Approx(1.0));
	REQUIRE(accuracy.mape.has_value());
	REQUIRE(*accuracy.mape == Approx((0.2 + 0.1 + 0.1 + 0.025) / 4.0 * 100.0));

	SECTION("Zero-demand days are left out of the percentage error") {
		Eigen::VectorXd sparse(2);
		sparse << 0.0, 10.0;
		Eigen::VectorXd guess(2);
		guess << 2.0, 12.0;
		const auto partial = models::HoldoutAccuracy::measure(sparse, guess);
		REQUIRE(partial.mape.has_value());
		REQUIRE(*partial.mape == Approx(20.0));
		REQUIRE(partial.mae == Approx(2.0));
	}

	SECTION("No demand at all leaves the percentage error empty") {
		const auto idle = models::HoldoutAccuracy::measure(Eigen::VectorXd::Zero(3), Eigen::VectorXd::Ones(3));
		REQUIRE_FALSE(idle.mape.has_value());
		REQUIRE(idle.bias == Approx(1.0));
	}

	SECTION("Mismatched or empty inputs are rejected") {
		REQUIRE_THROWS_AS(models::HoldoutAccuracy::measure(actual, Eigen::VectorXd::Zero(3)), std::invalid_argument);
		REQUIRE_THROWS_AS(models::HoldoutAccuracy::measure(Eigen::VectorXd(), Eigen::VectorXd()),
		                  std::invalid_argument);
	}
}
