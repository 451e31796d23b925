#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace stockcast::core {

/// The requested entity has no loaded model. Client-facing; not retried.
class NotFoundError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/// A backing store (usage ledger, catalog, artifact store) could not be reached.
class StoreUnavailableError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @brief A single model artifact could not be parsed or deserialised.
 *
 * Raised per artifact and caught by the registry, which skips the artifact
 * and keeps loading the rest.
 */
class ModelLoadError : public std::runtime_error {
public:
	ModelLoadError(std::string artifact, const std::string &reason)
	    : std::runtime_error("Failed to load model artifact '" + artifact + "': " + reason),
	      artifact_(std::move(artifact)) {
	}

	const std::string &artifact() const {
		return artifact_;
	}

private:
	std::string artifact_;
};

} // namespace stockcast::core
