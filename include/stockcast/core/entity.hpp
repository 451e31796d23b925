#pragma once

#include <cstdint>
#include <string>

namespace stockcast::core {

using EntityId = std::int64_t;

/**
 * @struct Entity
 * @brief A forecastable catalog item (a drug or SKU).
 *
 * Owned by the external catalog and immutable for the lifetime of a
 * registry generation.
 */
struct Entity {
	EntityId id = 0;
	std::string name;
	std::string unit = "units";
	std::int64_t reorder_level = 0;
	std::int64_t reorder_quantity = 0;
};

} // namespace stockcast::core
