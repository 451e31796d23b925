#pragma once

#include "stockcast/core/entity.hpp"

#include <vector>

namespace stockcast::stores {

/// Source of entity metadata (name, unit, reorder parameters).
class CatalogStore {
public:
	virtual ~CatalogStore() = default;

	/// @throws core::StoreUnavailableError When the catalog cannot be read.
	virtual std::vector<core::Entity> listEntities() const = 0;
};

} // namespace stockcast::stores
