#include "stockcast/stores/in_memory_stores.hpp"
#include "stockcast/core/errors.hpp"

#include <mutex>
#include <stdexcept>
#include <utility>

namespace stockcast::stores {

// --- Usage ledger ---

void InMemoryUsageStore::append(const core::UsageRecord &record) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	auto &days = ledger_[record.entity_id];
	const auto inserted = days.emplace(record.date.dayKey(), record);
	if (!inserted.second) {
		throw std::invalid_argument("Usage record for entity " + std::to_string(record.entity_id) + " on " +
		                            record.date.toString() + " already exists.");
	}
}

void InMemoryUsageStore::appendAll(const core::UsageHistory &records) {
	for (const auto &record : records) {
		append(record);
	}
}

std::size_t InMemoryUsageStore::size() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	std::size_t total = 0;
	for (const auto &entry : ledger_) {
		total += entry.second.size();
	}
	return total;
}

core::UsageHistory InMemoryUsageStore::recentUsage(core::EntityId entity_id, const core::Date &as_of,
                                                   int days) const {
	if (days < 0) {
		throw std::invalid_argument("Window length must be non-negative.");
	}
	std::shared_lock<std::shared_mutex> lock(mutex_);
	core::UsageHistory result;
	const auto it = ledger_.find(entity_id);
	if (it == ledger_.end()) {
		return result;
	}
	const auto earliest = as_of.addDays(-days).dayKey();
	for (auto rit = it->second.rbegin(); rit != it->second.rend(); ++rit) {
		if (rit->first < earliest || result.size() >= static_cast<std::size_t>(days)) {
			break;
		}
		result.push_back(rit->second);
	}
	return result;
}

core::UsageHistory InMemoryUsageStore::recentUsageAll(const core::Date &as_of, int days) const {
	if (days < 0) {
		throw std::invalid_argument("Window length must be non-negative.");
	}
	std::shared_lock<std::shared_mutex> lock(mutex_);
	core::UsageHistory result;
	const auto earliest = as_of.addDays(-days).dayKey();
	for (const auto &entry : ledger_) {
		for (auto it = entry.second.lower_bound(earliest); it != entry.second.end(); ++it) {
			result.push_back(it->second);
		}
	}
	return result;
}

std::optional<std::int64_t> InMemoryUsageStore::latestStock(core::EntityId entity_id) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	const auto it = ledger_.find(entity_id);
	if (it == ledger_.end() || it->second.empty()) {
		return std::nullopt;
	}
	return it->second.rbegin()->second.closing_stock;
}

std::unordered_map<core::EntityId, std::int64_t> InMemoryUsageStore::latestStockAll() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	std::unordered_map<core::EntityId, std::int64_t> result;
	for (const auto &entry : ledger_) {
		if (!entry.second.empty()) {
			result.emplace(entry.first, entry.second.rbegin()->second.closing_stock);
		}
	}
	return result;
}

// --- Catalog ---

InMemoryCatalogStore::InMemoryCatalogStore(const std::vector<core::Entity> &entities) {
	for (const auto &entity : entities) {
		entities_[entity.id] = entity;
	}
}

void InMemoryCatalogStore::upsert(const core::Entity &entity) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	entities_[entity.id] = entity;
}

std::vector<core::Entity> InMemoryCatalogStore::listEntities() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	std::vector<core::Entity> result;
	result.reserve(entities_.size());
	for (const auto &entry : entities_) {
		result.push_back(entry.second);
	}
	return result;
}

// --- Artifacts ---

void InMemoryArtifactStore::put(const std::string &name, std::string content) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	artifacts_[name] = std::move(content);
}

bool InMemoryArtifactStore::remove(const std::string &name) {
	std::unique_lock<std::shared_mutex> lock(mutex_);
	return artifacts_.erase(name) > 0;
}

std::vector<std::string> InMemoryArtifactStore::listArtifacts() const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	std::vector<std::string> names;
	names.reserve(artifacts_.size());
	for (const auto &entry : artifacts_) {
		names.push_back(entry.first);
	}
	return names;
}

std::string InMemoryArtifactStore::readArtifact(const std::string &name) const {
	std::shared_lock<std::shared_mutex> lock(mutex_);
	const auto it = artifacts_.find(name);
	if (it == artifacts_.end()) {
		throw core::ModelLoadError(name, "artifact not found");
	}
	return it->second;
}

} // namespace stockcast::stores
