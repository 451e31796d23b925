#pragma once

#include "stockcast/core/entity.hpp"
#include "stockcast/models/ipredictor.hpp"

#include <memory>
#include <optional>
#include <string>

namespace stockcast::models {

/**
 * @brief Extracts the entity id embedded in an artifact name.
 *
 * Artifact names follow `model_<id>[_<label>][.<ext>]`, for example
 * `model_4_paracetamol_500mg.json`. Returns nullopt for any other shape.
 */
std::optional<core::EntityId> parseArtifactEntityId(const std::string &artifact_name);

/// Canonical artifact name for an entity: `model_<id>_<normalised label>.json`.
std::string artifactName(core::EntityId entity_id, const std::string &label);

/**
 * @brief Deserialises a predictor artifact.
 *
 * Dispatches on the document's `model_type` ("linear" or "tree_ensemble").
 * When the document carries an `entity_id` it must agree with @p expected_entity.
 *
 * @throws core::ModelLoadError On malformed JSON, an unknown model type, a
 *         mismatched entity id, or invalid model parameters.
 */
std::unique_ptr<IPredictor> deserializePredictor(const std::string &artifact_name, const std::string &content,
                                                 core::EntityId expected_entity);

/// Serialises a predictor into an artifact document tagged with @p entity_id.
std::string serializePredictor(const IPredictor &predictor, core::EntityId entity_id);

} // namespace stockcast::models
