#include "stockcast/models/predictor_codec.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/models/linear_predictor.hpp"
#include "stockcast/models/tree_ensemble_predictor.hpp"

#include <cctype>
#include <stdexcept>

namespace stockcast::models {

std::optional<core::EntityId> parseArtifactEntityId(const std::string &artifact_name) {
	static const std::string kPrefix = "model_";
	if (artifact_name.compare(0, kPrefix.size(), kPrefix) != 0) {
		return std::nullopt;
	}
	std::size_t pos = kPrefix.size();
	const std::size_t digits_begin = pos;
	while (pos < artifact_name.size() && std::isdigit(static_cast<unsigned char>(artifact_name[pos]))) {
		++pos;
	}
	if (pos == digits_begin || pos - digits_begin > 18) {
		return std::nullopt;
	}
	if (pos < artifact_name.size() && artifact_name[pos] != '_' && artifact_name[pos] != '.') {
		return std::nullopt;
	}
	return static_cast<core::EntityId>(std::stoll(artifact_name.substr(digits_begin, pos - digits_begin)));
}

std::string artifactName(core::EntityId entity_id, const std::string &label) {
	std::string normalised;
	normalised.reserve(label.size());
	for (char c : label) {
		if (c == ' ' || c == '/') {
			normalised.push_back('_');
		} else {
			normalised.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
		}
	}
	std::string name = "model_" + std::to_string(entity_id);
	if (!normalised.empty()) {
		name += "_" + normalised;
	}
	return name + ".json";
}

std::unique_ptr<IPredictor> deserializePredictor(const std::string &artifact_name, const std::string &content,
                                                 core::EntityId expected_entity) {
	nlohmann::json document;
	try {
		document = nlohmann::json::parse(content);
	} catch (const nlohmann::json::parse_error &e) {
		throw core::ModelLoadError(artifact_name, std::string("invalid JSON: ") + e.what());
	}
	if (!document.is_object()) {
		throw core::ModelLoadError(artifact_name, "artifact must be a JSON object");
	}

	if (document.contains("entity_id")) {
		if (!document["entity_id"].is_number_integer() ||
		    document["entity_id"].get<core::EntityId>() != expected_entity) {
			throw core::ModelLoadError(artifact_name, "entity_id does not match the artifact name");
		}
	}

	if (!document.contains("model_type") || !document["model_type"].is_string()) {
		throw core::ModelLoadError(artifact_name, "missing 'model_type'");
	}
	const auto model_type = document["model_type"].get<std::string>();

	try {
		if (model_type == "linear") {
			return std::make_unique<LinearPredictor>(LinearPredictor::fromJson(document));
		}
		if (model_type == "tree_ensemble") {
			return std::make_unique<TreeEnsemblePredictor>(TreeEnsemblePredictor::fromJson(document));
		}
	} catch (const std::invalid_argument &e) {
		throw core::ModelLoadError(artifact_name, e.what());
	} catch (const nlohmann::json::exception &e) {
		throw core::ModelLoadError(artifact_name, e.what());
	}
	throw core::ModelLoadError(artifact_name, "unsupported model_type '" + model_type + "'");
}

std::string serializePredictor(const IPredictor &predictor, core::EntityId entity_id) {
	auto document = predictor.toJson();
	document["entity_id"] = entity_id;
	return document.dump(2);
}

} // namespace stockcast::models
