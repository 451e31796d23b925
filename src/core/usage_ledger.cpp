#include "stockcast/core/usage_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace stockcast::core {

namespace {

struct LedgerState {
	UsageHistory records;
	std::int64_t stock = 0;
};

LedgerState step(LedgerState state, EntityId entity_id, const Date &start, std::int64_t reorder_level,
                 double used) {
	if (used < 0.0 || !std::isfinite(used)) {
		throw std::invalid_argument("Daily usage must be finite and non-negative.");
	}
	UsageRecord record;
	record.entity_id = entity_id;
	record.date = start.addDays(static_cast<std::int64_t>(state.records.size()));
	record.quantity_used = used;
	record.opening_stock = state.stock;

	const std::int64_t received = state.stock <= reorder_level ? reorder_level * 3 : 0;
	const auto consumed = static_cast<std::int64_t>(std::llround(used));
	record.closing_stock = std::max<std::int64_t>(0, state.stock + received - consumed);
	record.stockout = record.closing_stock == 0;

	state.stock = record.closing_stock;
	state.records.push_back(record);
	return state;
}

} // namespace

UsageHistory foldStockLedger(EntityId entity_id, const Date &start, std::int64_t initial_stock,
                             std::int64_t reorder_level, const std::vector<double> &daily_usage) {
	if (initial_stock < 0) {
		throw std::invalid_argument("Initial stock must be non-negative.");
	}
	if (reorder_level < 0) {
		throw std::invalid_argument("Reorder level must be non-negative.");
	}

	LedgerState state;
	state.stock = initial_stock;
	state.records.reserve(daily_usage.size());
	for (double used : daily_usage) {
		state = step(std::move(state), entity_id, start, reorder_level, used);
	}
	return std::move(state.records);
}

} // namespace stockcast::core
