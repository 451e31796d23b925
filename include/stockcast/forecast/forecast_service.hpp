#pragma once

#include "stockcast/core/date.hpp"
#include "stockcast/core/entity.hpp"
#include "stockcast/forecast/batch_coordinator.hpp"
#include "stockcast/forecast/forecast_engine.hpp"
#include "stockcast/forecast/recommendation_engine.hpp"
#include "stockcast/models/model_registry.hpp"
#include "stockcast/stores/artifact_store.hpp"
#include "stockcast/stores/catalog_store.hpp"
#include "stockcast/stores/usage_store.hpp"
#include "stockcast/utils/config.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace stockcast::forecast {

/// A full forecast for one entity.
struct EntityForecast {
	core::EntityId entity_id = 0;
	std::string name;
	std::string unit;
	std::int64_t current_stock = 0;
	std::int64_t reorder_level = 0;
	std::vector<AdaptiveForecastPoint> points;
	/// Sum of the adjusted demand of the first seven points.
	double total_predicted_7_days = 0.0;
	Recommendation recommendation;
	std::string generated_at;
};

struct BatchForecastResult {
	/// Ascending by entity id.
	std::vector<EntityForecast> forecasts;
	std::vector<EntityFailure> failures;
	std::string generated_at;
};

struct ModelInfo {
	core::EntityId entity_id = 0;
	std::string name;
	std::string unit;
	bool model_loaded = true;
};

struct HealthStatus {
	std::string status;
	std::size_t models_loaded = 0;
	std::uint64_t generation = 0;
	std::string timestamp;
};

class ForecastServiceBuilder;

/**
 * @class ForecastService
 * @brief Entry point of the forecasting pipeline.
 *
 * Owns the model registry, the forecast engine (and with it the seasonal
 * cache) and the stores it was built with. Every request works against one
 * registry snapshot, so a concurrent reloadModels() never changes the
 * models underneath it. Request methods are safe to call concurrently.
 */
class ForecastService {
public:
	friend class ForecastServiceBuilder;

	ForecastService(const ForecastService &) = delete;
	ForecastService &operator=(const ForecastService &) = delete;

	/**
	 * @brief Forecast, current stock and recommendation for one entity.
	 * @throws core::NotFoundError If the entity has no loaded model.
	 * @throws core::StoreUnavailableError If the usage ledger cannot be read.
	 * @throws std::invalid_argument If @p horizon is out of range.
	 */
	EntityForecast forecast(core::EntityId entity_id, std::optional<int> horizon = std::nullopt);

	/**
	 * @brief Forecasts every modelled entity along the batch path.
	 *
	 * Entities whose data cannot be fetched are listed in the result's
	 * failures and skipped; the call itself does not fail for them.
	 */
	BatchForecastResult forecastAll(std::optional<int> horizon = std::nullopt);

	/// Adaptive points with the trend and seasonal breakdown; same errors as forecast().
	std::vector<AdaptiveForecastPoint> forecastDetailed(core::EntityId entity_id,
	                                                    std::optional<int> horizon = std::nullopt);

	/// Rebuilds the model registry. @return Number of models loaded.
	std::size_t reloadModels();

	/// Loaded models, ascending by entity id.
	std::vector<ModelInfo> listModels() const;

	HealthStatus health() const;

	const utils::ServiceConfig &config() const {
		return config_;
	}

private:
	ForecastService(utils::ServiceConfig config, std::shared_ptr<const stores::UsageStore> usage,
	                std::shared_ptr<const stores::CatalogStore> catalog,
	                std::shared_ptr<const stores::ModelArtifactStore> artifacts, core::DateProvider today);

	int resolveHorizon(std::optional<int> horizon) const;
	core::Entity resolveEntity(const models::ModelRegistry::Generation &generation, core::EntityId entity_id) const;
	const models::IPredictor &requirePredictor(const models::ModelRegistry::Generation &generation,
	                                           core::EntityId entity_id) const;
	EntityForecast assemble(const core::Entity &entity, std::int64_t current_stock,
	                        std::vector<AdaptiveForecastPoint> points, const std::string &generated_at) const;

	utils::ServiceConfig config_;
	std::shared_ptr<const stores::UsageStore> usage_;
	std::shared_ptr<const stores::CatalogStore> catalog_;
	std::shared_ptr<const stores::ModelArtifactStore> artifacts_;
	core::DateProvider today_;

	models::ModelRegistry registry_;
	ForecastEngine engine_;
	RecommendationEngine recommender_;
	BatchCoordinator coordinator_;
};

/**
 * @class ForecastServiceBuilder
 * @brief Assembles a ForecastService from its collaborators.
 *
 * The usage store is required. Without an artifact store the service reads
 * artifacts from the configured model directory; without a catalog store
 * every entity uses the fallback metadata.
 */
class ForecastServiceBuilder {
public:
	ForecastServiceBuilder &withConfig(utils::ServiceConfig config);
	ForecastServiceBuilder &withUsageStore(std::shared_ptr<const stores::UsageStore> store);
	ForecastServiceBuilder &withCatalogStore(std::shared_ptr<const stores::CatalogStore> store);
	ForecastServiceBuilder &withArtifactStore(std::shared_ptr<const stores::ModelArtifactStore> store);
	ForecastServiceBuilder &withDateProvider(core::DateProvider today);

	/**
	 * @brief Builds the service and performs the initial model load.
	 * @throws std::invalid_argument If no usage store was supplied.
	 * @throws core::StoreUnavailableError If the artifact store cannot be listed.
	 */
	std::unique_ptr<ForecastService> build();

private:
	std::optional<utils::ServiceConfig> config_;
	std::shared_ptr<const stores::UsageStore> usage_;
	std::shared_ptr<const stores::CatalogStore> catalog_;
	std::shared_ptr<const stores::ModelArtifactStore> artifacts_;
	core::DateProvider today_;
};

} // namespace stockcast::forecast
