#pragma once

#include "stockcast/stores/artifact_store.hpp"
#include "stockcast/stores/catalog_store.hpp"
#include "stockcast/stores/usage_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace stockcast::stores {

/**
 * @class InMemoryUsageStore
 * @brief Append-only usage ledger held in process memory.
 *
 * Enforces one record per (entity, date). Safe for concurrent readers and
 * writers.
 */
class InMemoryUsageStore final : public UsageStore {
public:
	/// @throws std::invalid_argument If a record for the same (entity, date) exists.
	void append(const core::UsageRecord &record);
	void appendAll(const core::UsageHistory &records);

	std::size_t size() const;

	core::UsageHistory recentUsage(core::EntityId entity_id, const core::Date &as_of, int days) const override;
	core::UsageHistory recentUsageAll(const core::Date &as_of, int days) const override;
	std::optional<std::int64_t> latestStock(core::EntityId entity_id) const override;
	std::unordered_map<core::EntityId, std::int64_t> latestStockAll() const override;

private:
	using DayIndex = std::map<core::Date::DayKey, core::UsageRecord>;

	mutable std::shared_mutex mutex_;
	std::map<core::EntityId, DayIndex> ledger_;
};

class InMemoryCatalogStore final : public CatalogStore {
public:
	InMemoryCatalogStore() = default;
	explicit InMemoryCatalogStore(const std::vector<core::Entity> &entities);

	/// Inserts or replaces the entity with the same id.
	void upsert(const core::Entity &entity);

	std::vector<core::Entity> listEntities() const override;

private:
	mutable std::shared_mutex mutex_;
	std::map<core::EntityId, core::Entity> entities_;
};

class InMemoryArtifactStore final : public ModelArtifactStore {
public:
	void put(const std::string &name, std::string content);
	bool remove(const std::string &name);

	std::vector<std::string> listArtifacts() const override;
	std::string readArtifact(const std::string &name) const override;

private:
	mutable std::shared_mutex mutex_;
	std::map<std::string, std::string> artifacts_;
};

} // namespace stockcast::stores
