#include "stockcast/forecast/batch_coordinator.hpp"
#include "stockcast/core/errors.hpp"
#include "stockcast/utils/logging.hpp"

#include <unordered_set>
#include <utility>

namespace stockcast::forecast {

// --- BatchSnapshot ---

const core::UsageHistory &BatchSnapshot::usageFor(core::EntityId entity_id) const {
	static const core::UsageHistory empty;
	const auto it = usage.find(entity_id);
	return it == usage.end() ? empty : it->second;
}

std::int64_t BatchSnapshot::stockFor(core::EntityId entity_id) const {
	const auto it = stock.find(entity_id);
	return it == stock.end() ? 0 : it->second;
}

bool BatchSnapshot::failed(core::EntityId entity_id) const {
	return failures.find(entity_id) != failures.end();
}

std::vector<EntityFailure> BatchSnapshot::failureList() const {
	std::vector<EntityFailure> list;
	list.reserve(failures.size());
	for (const auto &entry : failures) {
		list.push_back({entry.first, entry.second});
	}
	return list;
}

// --- BatchCoordinator ---

BatchCoordinator::BatchCoordinator(const stores::UsageStore &usage) : usage_(usage) {
}

BatchSnapshot BatchCoordinator::collect(const std::vector<core::EntityId> &entities, const core::Date &as_of,
                                        int days) const {
	BatchSnapshot snapshot;
	snapshot.as_of = as_of;
	collectUsage(snapshot, entities, days);
	collectStock(snapshot, entities);
	if (!snapshot.failures.empty()) {
		STOCKCAST_WARN("Batch data unavailable for {} of {} entities.", snapshot.failures.size(), entities.size());
	}
	return snapshot;
}

void BatchCoordinator::collectUsage(BatchSnapshot &snapshot, const std::vector<core::EntityId> &entities,
                                    int days) const {
	const std::unordered_set<core::EntityId> wanted(entities.begin(), entities.end());
	try {
		for (auto &record : usage_.recentUsageAll(snapshot.as_of, days)) {
			if (wanted.count(record.entity_id) != 0) {
				snapshot.usage[record.entity_id].push_back(std::move(record));
			}
		}
		for (auto &entry : snapshot.usage) {
			core::sortMostRecentFirst(entry.second);
			entry.second = core::trailingWindow(entry.second, snapshot.as_of, days);
		}
		return;
	} catch (const core::StoreUnavailableError &e) {
		STOCKCAST_WARN("Bulk usage read failed ({}); falling back to per-entity reads.", e.what());
		snapshot.usage.clear();
	}

	for (const auto entity_id : entities) {
		try {
			auto history = usage_.recentUsage(entity_id, snapshot.as_of, days);
			if (!history.empty()) {
				snapshot.usage.emplace(entity_id, std::move(history));
			}
		} catch (const core::StoreUnavailableError &e) {
			STOCKCAST_WARN("Usage for entity {} unavailable: {}", entity_id, e.what());
			snapshot.failures.emplace(entity_id, e.what());
		}
	}
}

void BatchCoordinator::collectStock(BatchSnapshot &snapshot, const std::vector<core::EntityId> &entities) const {
	try {
		auto all = usage_.latestStockAll();
		for (const auto entity_id : entities) {
			const auto it = all.find(entity_id);
			if (it != all.end()) {
				snapshot.stock.emplace(entity_id, it->second);
			}
		}
		return;
	} catch (const core::StoreUnavailableError &e) {
		STOCKCAST_WARN("Bulk stock read failed ({}); falling back to per-entity reads.", e.what());
		snapshot.stock.clear();
	}

	for (const auto entity_id : entities) {
		if (snapshot.failed(entity_id)) {
			continue;
		}
		try {
			if (const auto stock = usage_.latestStock(entity_id)) {
				snapshot.stock.emplace(entity_id, *stock);
			}
		} catch (const core::StoreUnavailableError &e) {
			STOCKCAST_WARN("Stock for entity {} unavailable: {}", entity_id, e.what());
			snapshot.failures.emplace(entity_id, e.what());
		}
	}
}

} // namespace stockcast::forecast
