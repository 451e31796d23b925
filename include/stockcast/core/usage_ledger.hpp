#pragma once

#include "stockcast/core/usage_record.hpp"

#include <cstdint>
#include <vector>

namespace stockcast::core {

/**
 * @brief Replays a sequence of daily usage into stock-ledger records.
 *
 * Each day opens with the previous day's closing stock. A delivery of
 * three times the reorder level arrives on any day that opens at or below
 * the reorder level. Closing stock never goes below zero and a zero close is
 * flagged as a stockout.
 *
 * @param entity_id Entity the records belong to.
 * @param start First day of the ledger.
 * @param initial_stock Opening stock of the first day.
 * @param reorder_level Reorder threshold driving simulated deliveries.
 * @param daily_usage Quantity used per day, oldest first.
 * @return Records in ascending date order, one per usage value.
 */
UsageHistory foldStockLedger(EntityId entity_id, const Date &start, std::int64_t initial_stock,
                             std::int64_t reorder_level, const std::vector<double> &daily_usage);

} // namespace stockcast::core
