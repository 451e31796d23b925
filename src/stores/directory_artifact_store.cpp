#include "stockcast/stores/directory_artifact_store.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace stockcast::stores {

namespace fs = std::filesystem;

DirectoryArtifactStore::DirectoryArtifactStore(fs::path directory) : directory_(std::move(directory)) {
}

std::vector<std::string> DirectoryArtifactStore::listArtifacts() const {
	std::vector<std::string> names;
	std::error_code ec;
	if (!fs::exists(directory_, ec)) {
		STOCKCAST_WARN("Model directory not found: {}", directory_.string());
		return names;
	}
	if (!fs::is_directory(directory_, ec)) {
		throw core::StoreUnavailableError("Model path is not a directory: " + directory_.string());
	}

	for (fs::directory_iterator it(directory_, ec), end; !ec && it != end; it.increment(ec)) {
		std::error_code entry_ec;
		if (it->is_regular_file(entry_ec) && it->path().extension() == ".json") {
			names.push_back(it->path().filename().string());
		}
	}
	if (ec) {
		throw core::StoreUnavailableError("Cannot list model directory " + directory_.string() + ": " +
		                                  ec.message());
	}
	std::sort(names.begin(), names.end());
	return names;
}

std::string DirectoryArtifactStore::readArtifact(const std::string &name) const {
	const fs::path path = directory_ / name;
	std::ifstream input(path, std::ios::binary);
	if (!input) {
		throw core::ModelLoadError(name, "cannot open " + path.string());
	}
	std::ostringstream buffer;
	buffer << input.rdbuf();
	if (input.bad()) {
		throw core::ModelLoadError(name, "read error on " + path.string());
	}
	return buffer.str();
}

void DirectoryArtifactStore::writeArtifact(const std::string &name, const std::string &content) const {
	std::error_code ec;
	fs::create_directories(directory_, ec);
	if (ec) {
		throw core::StoreUnavailableError("Cannot create model directory " + directory_.string() + ": " +
		                                  ec.message());
	}
	const fs::path path = directory_ / name;
	std::ofstream output(path, std::ios::binary | std::ios::trunc);
	if (!output) {
		throw core::StoreUnavailableError("Cannot write artifact " + path.string());
	}
	output << content;
	if (!output) {
		throw core::StoreUnavailableError("Write failed for artifact " + path.string());
	}
}

} // namespace stockcast::stores
