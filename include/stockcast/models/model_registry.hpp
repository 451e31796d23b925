#pragma once

#include "stockcast/core/entity.hpp"
#include "stockcast/features/feature_vector.hpp"
#include "stockcast/models/ipredictor.hpp"
#include "stockcast/stores/artifact_store.hpp"
#include "stockcast/stores/catalog_store.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stockcast::models {

/// An artifact skipped during a load, with the reason it was rejected.
struct LoadWarning {
	std::string artifact;
	std::string reason;
};

/**
 * @class ModelRegistry
 * @brief Maps entity ids to trained predictors and catalog metadata.
 *
 * The registry publishes immutable generations. A load builds a complete new
 * generation off to the side and swaps it in with a single atomic store, so
 * readers never block on a reload and never observe a mix of old and new
 * models. Callers that need several lookups to agree take one snapshot() and
 * work from it.
 */
class ModelRegistry {
public:
	struct Generation {
		std::uint64_t id = 0;
		std::unordered_map<core::EntityId, std::shared_ptr<const IPredictor>> models;
		std::unordered_map<core::EntityId, core::Entity> catalog;
		std::vector<LoadWarning> warnings;

		/// The predictor for @p entity_id, or nullptr.
		const IPredictor *find(core::EntityId entity_id) const;
		const core::Entity *entity(core::EntityId entity_id) const;
		/// Ids with a loaded model, ascending.
		std::vector<core::EntityId> entityIds() const;
	};

	ModelRegistry(const stores::ModelArtifactStore &artifacts, const stores::CatalogStore &catalog);

	ModelRegistry(const ModelRegistry &) = delete;
	ModelRegistry &operator=(const ModelRegistry &) = delete;

	/**
	 * @brief Loads every artifact and the catalog into a new generation.
	 *
	 * Artifacts whose name carries no entity id, or whose content fails to
	 * deserialise, are skipped and recorded as warnings. If the catalog is
	 * unavailable the previous generation's catalog is carried over.
	 *
	 * @return Number of models in the published generation.
	 * @throws core::StoreUnavailableError If the artifact collection cannot be
	 *         listed; the current generation stays published.
	 */
	std::size_t load();

	/// Full reload; same contract as load().
	std::size_t reload();

	/// The currently published generation. Never null.
	std::shared_ptr<const Generation> snapshot() const;

	/**
	 * @brief Runs the entity's predictor.
	 * @throws core::NotFoundError If no model is registered for @p entity_id.
	 */
	double predict(core::EntityId entity_id, const features::FeatureVector &features) const;

	bool contains(core::EntityId entity_id) const;
	std::optional<core::Entity> entity(core::EntityId entity_id) const;
	std::size_t size() const;

private:
	std::shared_ptr<const Generation> buildGeneration(const Generation &previous) const;

	const stores::ModelArtifactStore &artifacts_;
	const stores::CatalogStore &catalog_;

	// Read and written only through std::atomic_load / std::atomic_store.
	std::shared_ptr<const Generation> current_;
	// Serialises writers; readers never take it.
	std::mutex reload_mutex_;
};

} // namespace stockcast::models
