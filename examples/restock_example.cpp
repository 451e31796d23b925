#include "stockcast/core/usage_ledger.hpp"
#include "stockcast/features/training_set.hpp"
#include "stockcast/forecast/forecast_service.hpp"
#include "stockcast/models/predictor_codec.hpp"
#include "stockcast/models/ridge_trainer.hpp"
#include "stockcast/stores/in_memory_stores.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include <random>
#include <vector>

using namespace stockcast;

namespace {

std::vector<double> synthesizeDemand(const core::Date &start, std::size_t days, double base, unsigned seed) {
	std::mt19937 rng(seed);
	std::normal_distribution<double> noise(0.0, base * 0.1);

	std::vector<double> usage;
	usage.reserve(days);
	for (std::size_t d = 0; d < days; ++d) {
		const core::Date date = start.addDays(static_cast<std::int64_t>(d));
		double value = base + noise(rng);
		if (date.weekday() >= 5) {
			value *= 0.7; // clinics close early on weekends
		}
		if (d + 7 >= days) {
			value *= 1.4; // outbreak in the last week
		}
		usage.push_back(std::max(0.0, std::round(value)));
	}
	return usage;
}

void printForecast(const forecast::EntityForecast &result) {
	std::cout << "\n" << result.name << " (id " << result.entity_id << ")\n";
	std::cout << "  stock " << result.current_stock << " " << result.unit << ", reorder level "
	          << result.reorder_level << "\n";
	std::cout << std::fixed << std::setprecision(2);
	for (const auto &point : result.points) {
		std::cout << "  " << point.date.toString() << " " << std::setw(9) << std::left << point.weekday()
		          << std::right << " raw " << std::setw(7) << point.raw << "  trend " << point.trend_factor
		          << "  seasonal " << point.seasonal_factor << "  -> " << std::setw(7) << point.adjusted << "\n";
	}
	std::cout << "  7-day total " << std::setprecision(1) << result.total_predicted_7_days << "\n";
	std::cout << "  [" << forecast::toString(result.recommendation.level) << "] " << result.recommendation.message
	          << "\n";
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::warn);

	const core::Date today = core::Date::today();
	const std::size_t history_days = 120;
	const core::Date start = today.addDays(-static_cast<std::int64_t>(history_days) + 1);

	std::vector<core::Entity> entities(3);
	entities[0] = {1, "Paracetamol 500mg", "tablets", 80, 240};
	entities[1] = {2, "Amoxicillin 250mg", "capsules", 30, 90};
	entities[2] = {3, "ORS Sachet", "sachets", 40, 120};
	const std::vector<double> base_demand{35.0, 9.0, 20.0};
	const std::vector<std::int64_t> opening{500, 120, 90};

	auto usage = std::make_shared<stores::InMemoryUsageStore>();
	auto catalog = std::make_shared<stores::InMemoryCatalogStore>(entities);
	auto artifacts = std::make_shared<stores::InMemoryArtifactStore>();
	auto trainer = models::RidgeTrainerBuilder().withLambda(0.5).build();

	std::cout << "Training demand models on " << history_days << " days of history\n";
	for (std::size_t i = 0; i < entities.size(); ++i) {
		const auto &entity = entities[i];
		const auto demand = synthesizeDemand(start, history_days, base_demand[i], static_cast<unsigned>(11 + i));
		const auto ledger = core::foldStockLedger(entity.id, start, opening[i], entity.reorder_level, demand);
		usage->appendAll(ledger);

		models::TrainingReport report;
		const auto model = trainer->train(features::TrainingSetBuilder().build(ledger), &report);
		artifacts->put(models::artifactName(entity.id, entity.name), models::serializePredictor(*model, entity.id));

		std::cout << "  " << std::setw(20) << std::left << entity.name << std::right << " holdout MAE "
		          << std::fixed << std::setprecision(2) << report.holdout.mae << ", RMSE " << report.holdout.rmse
		          << " (" << report.train_samples << "/" << report.test_samples << ")\n";
	}

	auto service = forecast::ForecastServiceBuilder()
	                   .withConfig(utils::ServiceConfigBuilder().withLogLevel(spdlog::level::warn).build())
	                   .withUsageStore(usage)
	                   .withCatalogStore(catalog)
	                   .withArtifactStore(artifacts)
	                   .build();

	printForecast(service->forecast(1));

	const auto batch = service->forecastAll();
	std::cout << "\nBatch forecast generated at " << batch.generated_at << "\n";
	for (const auto &result : batch.forecasts) {
		std::cout << "  " << std::setw(20) << std::left << result.name << std::right << " ["
		          << forecast::toString(result.recommendation.level) << "] " << result.recommendation.message << "\n";
	}

	const auto health = service->health();
	std::cout << "\nService " << health.status << ": " << health.models_loaded << " models, generation "
	          << health.generation << "\n";
	return 0;
}
