#include "stockcast/models/model_registry.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/models/predictor_codec.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <atomic>

namespace stockcast::models {

// --- Generation ---

const IPredictor *ModelRegistry::Generation::find(core::EntityId entity_id) const {
	const auto it = models.find(entity_id);
	return it == models.end() ? nullptr : it->second.get();
}

const core::Entity *ModelRegistry::Generation::entity(core::EntityId entity_id) const {
	const auto it = catalog.find(entity_id);
	return it == catalog.end() ? nullptr : &it->second;
}

std::vector<core::EntityId> ModelRegistry::Generation::entityIds() const {
	std::vector<core::EntityId> ids;
	ids.reserve(models.size());
	for (const auto &entry : models) {
		ids.push_back(entry.first);
	}
	std::sort(ids.begin(), ids.end());
	return ids;
}

// --- Registry ---

ModelRegistry::ModelRegistry(const stores::ModelArtifactStore &artifacts, const stores::CatalogStore &catalog)
    : artifacts_(artifacts), catalog_(catalog), current_(std::make_shared<Generation>()) {
}

std::shared_ptr<const ModelRegistry::Generation> ModelRegistry::buildGeneration(const Generation &previous) const {
	auto next = std::make_shared<Generation>();
	next->id = previous.id + 1;

	const auto names = artifacts_.listArtifacts();
	for (const auto &name : names) {
		const auto entity_id = parseArtifactEntityId(name);
		if (!entity_id) {
			STOCKCAST_WARN("Skipping artifact '{}': no entity id in name.", name);
			next->warnings.push_back({name, "no entity id in artifact name"});
			continue;
		}
		if (next->models.count(*entity_id) > 0) {
			STOCKCAST_WARN("Skipping artifact '{}': entity {} already has a model.", name, *entity_id);
			next->warnings.push_back({name, "duplicate model for entity " + std::to_string(*entity_id)});
			continue;
		}
		try {
			auto predictor = deserializePredictor(name, artifacts_.readArtifact(name), *entity_id);
			STOCKCAST_DEBUG("Loaded {} model for entity {} from '{}'.", predictor->getName(), *entity_id, name);
			next->models.emplace(*entity_id, std::shared_ptr<const IPredictor>(std::move(predictor)));
		} catch (const core::ModelLoadError &e) {
			STOCKCAST_WARN("{}", e.what());
			next->warnings.push_back({name, e.what()});
		}
	}

	try {
		for (auto &entity : catalog_.listEntities()) {
			const auto id = entity.id;
			next->catalog[id] = std::move(entity);
		}
	} catch (const core::StoreUnavailableError &e) {
		STOCKCAST_ERROR("Catalog unavailable, keeping {} cached entities: {}", previous.catalog.size(), e.what());
		next->catalog = previous.catalog;
	}

	return next;
}

std::size_t ModelRegistry::load() {
	std::lock_guard<std::mutex> lock(reload_mutex_);
	const auto previous = std::atomic_load(&current_);
	std::shared_ptr<const Generation> next = buildGeneration(*previous);
	STOCKCAST_INFO("Model registry generation {} published: {} models, {} catalog entries, {} skipped.", next->id,
	               next->models.size(), next->catalog.size(), next->warnings.size());
	const std::size_t count = next->models.size();
	std::atomic_store(&current_, std::move(next));
	return count;
}

std::size_t ModelRegistry::reload() {
	return load();
}

std::shared_ptr<const ModelRegistry::Generation> ModelRegistry::snapshot() const {
	return std::atomic_load(&current_);
}

double ModelRegistry::predict(core::EntityId entity_id, const features::FeatureVector &features) const {
	const auto generation = snapshot();
	const auto *predictor = generation->find(entity_id);
	if (predictor == nullptr) {
		throw core::NotFoundError("No model found for entity " + std::to_string(entity_id));
	}
	return predictor->predict(features);
}

bool ModelRegistry::contains(core::EntityId entity_id) const {
	return snapshot()->find(entity_id) != nullptr;
}

std::optional<core::Entity> ModelRegistry::entity(core::EntityId entity_id) const {
	const auto generation = snapshot();
	const auto *found = generation->entity(entity_id);
	if (found == nullptr) {
		return std::nullopt;
	}
	return *found;
}

std::size_t ModelRegistry::size() const {
	return snapshot()->models.size();
}

} // namespace stockcast::models
