#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "common/usage_fixtures.hpp"
#include "stockcast/core/usage_ledger.hpp"
#include "stockcast/features/training_set.hpp"
#include "stockcast/forecast/forecast_service.hpp"
#include "stockcast/models/predictor_codec.hpp"
#include "stockcast/models/ridge_trainer.hpp"
#include "stockcast/stores/directory_artifact_store.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <random>

using namespace stockcast;
using tests::helpers::referenceDay;
using Catch::Approx;
namespace fs = std::filesystem;

namespace {

std::vector<double> weeklyDemand(double base, double weekend_lift, std::size_t days, unsigned seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, 1.0);
	const core::Date start = referenceDay().addDays(-static_cast<std::int64_t>(days) + 1);
	std::vector<double> usage;
	usage.reserve(days);
	for (std::size_t d = 0; d < days; ++d) {
		const bool weekend = start.addDays(static_cast<std::int64_t>(d)).weekday() >= 5;
		usage.push_back(std::max(0.0, std::round(base + (weekend ? weekend_lift : 0.0) + noise(rng))));
	}
	return usage;
}

struct CatalogItem {
	core::Entity entity;
	double base;
	double weekend_lift;
	std::int64_t initial_stock;
};

} // namespace

TEST_CASE("Restock workflow trains, publishes and serves models", "[integration][workflow]") {
	const fs::path model_dir =
	    fs::temp_directory_path() / ("stockcast-workflow-" + std::to_string(std::random_device{}()));
	const std::size_t days = 90;
	const core::Date start = referenceDay().addDays(-static_cast<std::int64_t>(days) + 1);

	const std::vector<CatalogItem> items{
	    {tests::helpers::makeEntity(1, "Paracetamol 500mg", 60), 30.0, 8.0, 400},
	    {tests::helpers::makeEntity(2, "Amoxicillin 250mg", 25), 12.0, -3.0, 150},
	    {tests::helpers::makeEntity(3, "ORS Sachet", 40), 18.0, 0.0, 300},
	};

	auto usage = std::make_shared<stores::InMemoryUsageStore>();
	auto catalog = std::make_shared<stores::InMemoryCatalogStore>();
	const stores::DirectoryArtifactStore publisher(model_dir);
	auto trainer = models::RidgeTrainerBuilder().withLambda(0.5).build();

	for (const auto &item : items) {
		const auto demand = weeklyDemand(item.base, item.weekend_lift, days, static_cast<unsigned>(item.entity.id));
		const auto ledger =
		    core::foldStockLedger(item.entity.id, start, item.initial_stock, item.entity.reorder_level, demand);
		REQUIRE(ledger.back().date == referenceDay());
		usage->appendAll(ledger);
		catalog->upsert(item.entity);

		const auto data = features::TrainingSetBuilder().build(ledger);
		models::TrainingReport report;
		const auto model = trainer->train(data, &report);
		REQUIRE(report.test_samples > 0);
		REQUIRE(report.holdout.mae < item.base);
		publisher.writeArtifact(models::artifactName(item.entity.id, item.entity.name),
		                        models::serializePredictor(*model, item.entity.id));
	}

	auto service = forecast::ForecastServiceBuilder()
	                   .withConfig(utils::ServiceConfigBuilder().withModelDirectory(model_dir).build())
	                   .withUsageStore(usage)
	                   .withCatalogStore(catalog)
	                   .withDateProvider([]() { return referenceDay(); })
	                   .build();
	REQUIRE(service->listModels().size() == 3);

	SECTION("Single-entity forecasts respect the adjustment contract") {
		for (const auto &item : items) {
			const auto result = service->forecast(item.entity.id);
			REQUIRE(result.name == item.entity.name);
			REQUIRE(result.current_stock == usage->latestStock(item.entity.id).value());
			for (const auto &point : result.points) {
				REQUIRE(point.adjusted >= 0.0);
				REQUIRE(point.trend_factor >= 0.5);
				REQUIRE(point.trend_factor <= 1.5);
				REQUIRE(point.seasonal_factor >= 0.8);
				REQUIRE(point.seasonal_factor <= 1.2);
				REQUIRE(std::isfinite(point.raw));
			}
			if (result.current_stock <= result.reorder_level) {
				REQUIRE(result.recommendation.level == forecast::Severity::Urgent);
			}
		}
	}

	SECTION("Batch and single paths agree on raw demand") {
		const auto batch = service->forecastAll();
		REQUIRE(batch.forecasts.size() == 3);
		for (const auto &entry : batch.forecasts) {
			const auto single = service->forecast(entry.entity_id);
			for (std::size_t i = 0; i < entry.points.size(); ++i) {
				REQUIRE(entry.points[i].raw == single.points[i].raw);
				REQUIRE(entry.points[i].trend_factor == single.points[i].trend_factor);
			}
			REQUIRE(entry.current_stock == single.current_stock);
		}
	}

	SECTION("Publishing a new artifact becomes visible after reload") {
		const auto demand = weeklyDemand(5.0, 0.0, days, 99);
		const auto ledger = core::foldStockLedger(4, start, 80, 10, demand);
		usage->appendAll(ledger);
		const auto model = trainer->train(features::TrainingSetBuilder().build(ledger));
		publisher.writeArtifact(models::artifactName(4, "Zinc Tablets"), models::serializePredictor(*model, 4));

		REQUIRE_THROWS_AS(service->forecast(4), core::NotFoundError);
		REQUIRE(service->reloadModels() == 4);
		REQUIRE(service->forecast(4).name == "Drug 4");
	}

	std::error_code ec;
	fs::remove_all(model_dir, ec);
}
