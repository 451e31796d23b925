#pragma once

#include <string>
#include <vector>

namespace stockcast::stores {

/**
 * @class ModelArtifactStore
 * @brief Named collection of serialised predictors.
 */
class ModelArtifactStore {
public:
	virtual ~ModelArtifactStore() = default;

	/**
	 * @brief Enumerates artifact names.
	 * @throws core::StoreUnavailableError When the collection cannot be listed.
	 */
	virtual std::vector<std::string> listArtifacts() const = 0;

	/**
	 * @brief Reads one artifact's content.
	 * @throws core::ModelLoadError When the artifact is missing or unreadable.
	 */
	virtual std::string readArtifact(const std::string &name) const = 0;
};

} // namespace stockcast::stores
