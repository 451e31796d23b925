#pragma once

#include "stockcast/core/date.hpp"
#include "stockcast/core/entity.hpp"

#include <cstdint>
#include <vector>

namespace stockcast::core {

/**
 * @struct UsageRecord
 * @brief One day of consumption for one entity. Unique per (entity, date).
 */
struct UsageRecord {
	EntityId entity_id = 0;
	Date date;
	double quantity_used = 0.0;
	std::int64_t opening_stock = 0;
	std::int64_t closing_stock = 0;
	bool stockout = false;
};

using UsageHistory = std::vector<UsageRecord>;

/// Sorts records by date, newest first. Ties keep their relative order.
void sortMostRecentFirst(UsageHistory &records);

/// Extracts quantity used in the order the records are given.
std::vector<double> usageValues(const UsageHistory &records);

/**
 * @brief Restricts a most-recent-first history to records dated on or after
 * `as_of - days`, keeping at most `days` records.
 */
UsageHistory trailingWindow(const UsageHistory &records, const Date &as_of, int days);

} // namespace stockcast::core
