#pragma once

#include "stockcast/stores/artifact_store.hpp"

#include <filesystem>

namespace stockcast::stores {

/**
 * @class DirectoryArtifactStore
 * @brief Model artifacts stored as `*.json` files in one directory.
 *
 * A missing directory is treated as an empty collection, so a service can
 * start before the first training run has produced any models.
 */
class DirectoryArtifactStore final : public ModelArtifactStore {
public:
	explicit DirectoryArtifactStore(std::filesystem::path directory);

	/// Artifact file names (not paths), sorted.
	std::vector<std::string> listArtifacts() const override;
	std::string readArtifact(const std::string &name) const override;

	/// Writes an artifact file, creating the directory when needed.
	void writeArtifact(const std::string &name, const std::string &content) const;

	const std::filesystem::path &directory() const {
		return directory_;
	}

private:
	std::filesystem::path directory_;
};

} // namespace stockcast::stores
