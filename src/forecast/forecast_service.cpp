#include "stockcast/forecast/forecast_service.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/stores/directory_artifact_store.hpp"
#include "stockcast/stores/in_memory_stores.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

namespace stockcast::forecast {

namespace {

std::string now() {
	return core::formatTimestamp(std::chrono::system_clock::now());
}

} // namespace

ForecastService::ForecastService(utils::ServiceConfig config, std::shared_ptr<const stores::UsageStore> usage,
                                 std::shared_ptr<const stores::CatalogStore> catalog,
                                 std::shared_ptr<const stores::ModelArtifactStore> artifacts,
                                 core::DateProvider today)
    : config_(std::move(config)), usage_(std::move(usage)), catalog_(std::move(catalog)),
      artifacts_(std::move(artifacts)), today_(std::move(today)), registry_(*artifacts_, *catalog_),
      coordinator_(*usage_) {
}

int ForecastService::resolveHorizon(std::optional<int> horizon) const {
	const int days = horizon.value_or(config_.defaultHorizon());
	utils::ServiceConfig::validateHorizon(days);
	return days;
}

core::Entity ForecastService::resolveEntity(const models::ModelRegistry::Generation &generation,
                                            core::EntityId entity_id) const {
	if (const auto *entity = generation.entity(entity_id)) {
		return *entity;
	}
	core::Entity fallback;
	fallback.id = entity_id;
	fallback.name = "Drug " + std::to_string(entity_id);
	fallback.unit = "units";
	fallback.reorder_level = config_.fallbackReorderLevel();
	return fallback;
}

const models::IPredictor &ForecastService::requirePredictor(const models::ModelRegistry::Generation &generation,
                                                            core::EntityId entity_id) const {
	const auto *predictor = generation.find(entity_id);
	if (predictor == nullptr) {
		throw core::NotFoundError("No model found for entity " + std::to_string(entity_id));
	}
	return *predictor;
}

EntityForecast ForecastService::assemble(const core::Entity &entity, std::int64_t current_stock,
                                         std::vector<AdaptiveForecastPoint> points,
                                         const std::string &generated_at) const {
	EntityForecast result;
	result.entity_id = entity.id;
	result.name = entity.name;
	result.unit = entity.unit;
	result.current_stock = current_stock;
	result.reorder_level = entity.reorder_level;
	result.recommendation = recommender_.recommend(points, current_stock, entity.reorder_level);

	const std::size_t week = std::min<std::size_t>(points.size(), 7);
	for (std::size_t i = 0; i < week; ++i) {
		result.total_predicted_7_days += points[i].adjusted;
	}
	result.points = std::move(points);
	result.generated_at = generated_at;
	return result;
}

std::vector<AdaptiveForecastPoint> ForecastService::forecastDetailed(core::EntityId entity_id,
                                                                     std::optional<int> horizon) {
	const int days = resolveHorizon(horizon);
	const auto generation = registry_.snapshot();
	const auto &predictor = requirePredictor(*generation, entity_id);

	const core::Date today = today_();
	auto history = usage_->recentUsage(entity_id, today, adjusters::TrendAdjuster::kWindowDays);
	core::sortMostRecentFirst(history);
	return engine_.forecast(predictor, entity_id, history, today, days);
}

EntityForecast ForecastService::forecast(core::EntityId entity_id, std::optional<int> horizon) {
	const int days = resolveHorizon(horizon);
	const auto generation = registry_.snapshot();
	const auto &predictor = requirePredictor(*generation, entity_id);

	const core::Date today = today_();
	auto history = usage_->recentUsage(entity_id, today, adjusters::TrendAdjuster::kWindowDays);
	core::sortMostRecentFirst(history);
	auto points = engine_.forecast(predictor, entity_id, history, today, days);
	const std::int64_t stock = usage_->latestStock(entity_id).value_or(0);

	return assemble(resolveEntity(*generation, entity_id), stock, std::move(points), now());
}

BatchForecastResult ForecastService::forecastAll(std::optional<int> horizon) {
	const int days = resolveHorizon(horizon);
	const auto generation = registry_.snapshot();
	const core::Date today = today_();
	const auto ids = generation->entityIds();

	const auto batch = coordinator_.collect(ids, today, adjusters::TrendAdjuster::kWindowDays);

	BatchForecastResult result;
	result.generated_at = now();
	result.failures = batch.failureList();
	for (const auto entity_id : ids) {
		if (batch.failed(entity_id)) {
			continue;
		}
		try {
			const auto &predictor = requirePredictor(*generation, entity_id);
			auto points = engine_.forecastBatch(predictor, entity_id, batch.usageFor(entity_id), today, days);
			result.forecasts.push_back(assemble(resolveEntity(*generation, entity_id), batch.stockFor(entity_id),
			                                    std::move(points), result.generated_at));
		} catch (const std::exception &e) {
			STOCKCAST_WARN("Error forecasting entity {}: {}", entity_id, e.what());
			result.failures.push_back({entity_id, e.what()});
		}
	}
	STOCKCAST_INFO("Batch forecast: {} entities forecast, {} failed.", result.forecasts.size(),
	               result.failures.size());
	return result;
}

std::size_t ForecastService::reloadModels() {
	return registry_.reload();
}

std::vector<ModelInfo> ForecastService::listModels() const {
	const auto generation = registry_.snapshot();
	std::vector<ModelInfo> models;
	for (const auto entity_id : generation->entityIds()) {
		const auto entity = resolveEntity(*generation, entity_id);
		models.push_back({entity_id, entity.name, entity.unit, true});
	}
	return models;
}

HealthStatus ForecastService::health() const {
	const auto generation = registry_.snapshot();
	HealthStatus status;
	status.status = "healthy";
	status.models_loaded = generation->models.size();
	status.generation = generation->id;
	status.timestamp = now();
	return status;
}

// --- Builder Implementation ---

ForecastServiceBuilder &ForecastServiceBuilder::withConfig(utils::ServiceConfig config) {
	config_ = std::move(config);
	return *this;
}

ForecastServiceBuilder &ForecastServiceBuilder::withUsageStore(std::shared_ptr<const stores::UsageStore> store) {
	usage_ = std::move(store);
	return *this;
}

ForecastServiceBuilder &ForecastServiceBuilder::withCatalogStore(std::shared_ptr<const stores::CatalogStore> store) {
	catalog_ = std::move(store);
	return *this;
}

ForecastServiceBuilder &
ForecastServiceBuilder::withArtifactStore(std::shared_ptr<const stores::ModelArtifactStore> store) {
	artifacts_ = std::move(store);
	return *this;
}

ForecastServiceBuilder &ForecastServiceBuilder::withDateProvider(core::DateProvider today) {
	today_ = std::move(today);
	return *this;
}

std::unique_ptr<ForecastService> ForecastServiceBuilder::build() {
	if (!usage_) {
		throw std::invalid_argument("ForecastService requires a usage store.");
	}
	auto config = config_ ? *config_ : utils::ServiceConfigBuilder().build();
	utils::Logging::init(config.logLevel());
	std::shared_ptr<const stores::CatalogStore> catalog = catalog_;
	if (!catalog) {
		catalog = std::make_shared<stores::InMemoryCatalogStore>();
	}
	std::shared_ptr<const stores::ModelArtifactStore> artifacts = artifacts_;
	if (!artifacts) {
		artifacts = std::make_shared<stores::DirectoryArtifactStore>(config.modelDirectory());
	}
	auto today = today_ ? today_ : core::DateProvider(&core::Date::today);

	std::unique_ptr<ForecastService> service(new ForecastService(std::move(config), usage_, std::move(catalog),
	                                                             std::move(artifacts), std::move(today)));
	const std::size_t loaded = service->registry_.load();
	STOCKCAST_INFO("Forecast service ready with {} models.", loaded);
	return service;
}

} // namespace stockcast::forecast
