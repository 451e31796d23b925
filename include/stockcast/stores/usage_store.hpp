#pragma once

#include "stockcast/core/date.hpp"
#include "stockcast/core/entity.hpp"
#include "stockcast/core/usage_record.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>

namespace stockcast::stores {

/**
 * @class UsageStore
 * @brief Read access to the per-entity, per-day consumption ledger.
 *
 * Calls are synchronous. Implementations throw core::StoreUnavailableError
 * when the backing ledger cannot be reached.
 */
class UsageStore {
public:
	virtual ~UsageStore() = default;

	/**
	 * @brief Records of one entity dated on or after `as_of - days`.
	 * @return At most @p days records, most recent first.
	 */
	virtual core::UsageHistory recentUsage(core::EntityId entity_id, const core::Date &as_of, int days) const = 0;

	/**
	 * @brief Records of every entity dated on or after `as_of - days`.
	 *
	 * One bulk read. Ordering across and within entities is unspecified.
	 */
	virtual core::UsageHistory recentUsageAll(const core::Date &as_of, int days) const = 0;

	/// Closing stock of the entity's most recent record, if any.
	virtual std::optional<std::int64_t> latestStock(core::EntityId entity_id) const = 0;

	/// Closing stock of the most recent record of every entity, in one read.
	virtual std::unordered_map<core::EntityId, std::int64_t> latestStockAll() const = 0;
};

} // namespace stockcast::stores
