#pragma once

#include "stockcast/core/date.hpp"
#include "stockcast/core/entity.hpp"
#include "stockcast/core/usage_record.hpp"
#include "stockcast/stores/usage_store.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace stockcast::forecast {

/// An entity dropped from a batch, with the reason.
struct EntityFailure {
	core::EntityId entity_id = 0;
	std::string reason;
};

/**
 * @struct BatchSnapshot
 * @brief Usage and stock for many entities, partitioned per entity.
 */
struct BatchSnapshot {
	core::Date as_of;
	/// Per entity, most recent first.
	std::unordered_map<core::EntityId, core::UsageHistory> usage;
	/// Latest closing stock; entities with no ledger rows are absent.
	std::unordered_map<core::EntityId, std::int64_t> stock;
	/// Entities whose data could not be fetched, keyed by id.
	std::map<core::EntityId, std::string> failures;

	/// The entity's history, or an empty history.
	const core::UsageHistory &usageFor(core::EntityId entity_id) const;
	/// Latest stock, or 0 when the ledger has no record.
	std::int64_t stockFor(core::EntityId entity_id) const;
	bool failed(core::EntityId entity_id) const;
	std::vector<EntityFailure> failureList() const;
};

/**
 * @class BatchCoordinator
 * @brief Fetches the data of a whole batch in two bulk reads.
 *
 * One read for recent usage across all entities and one for latest stock.
 * When a bulk read fails the coordinator falls back to per-entity reads so
 * that one unreachable partition only costs the entities behind it.
 */
class BatchCoordinator {
public:
	explicit BatchCoordinator(const stores::UsageStore &usage);

	/**
	 * @param entities Entities the batch covers; data for other ids is ignored.
	 * @param as_of Reference day of the trailing window.
	 * @param days Trailing window length.
	 */
	BatchSnapshot collect(const std::vector<core::EntityId> &entities, const core::Date &as_of, int days) const;

private:
	void collectUsage(BatchSnapshot &snapshot, const std::vector<core::EntityId> &entities, int days) const;
	void collectStock(BatchSnapshot &snapshot, const std::vector<core::EntityId> &entities) const;

	const stores::UsageStore &usage_;
};

} // namespace stockcast::forecast
