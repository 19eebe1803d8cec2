#include "tagcache/core/cache/store/MemoryStore.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace tagcache {
namespace core {
namespace cache {

MemoryStore::MemoryStore(std::shared_ptr<Clock> clock)
    : clock_(clock ? std::move(clock) : defaultClock()) {
    spdlog::debug("MemoryStore: создан");
}

int64_t MemoryStore::expiryFor(std::chrono::seconds ttl) const {
    if (ttl.count() <= 0) {
        return 0;
    }
    return clock_->now() + ttl.count();
}

std::optional<Bytes> MemoryStore::get(const std::string& key) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        if (!it->second.isExpired(clock_->now())) {
            return it->second.value;
        }
    }
    // Запись истекла, удаляем её под эксклюзивной блокировкой
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && it->second.isExpired(clock_->now())) {
        entries_.erase(it);
    }
    return std::nullopt;
}

bool MemoryStore::set(const std::string& key, const Bytes& value, std::chrono::seconds ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[key] = CacheEntry{value, expiryFor(ttl)};
    return true;
}

bool MemoryStore::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.erase(key);
    return true;
}

bool MemoryStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_.clear();
    return true;
}

bool MemoryStore::has(const std::string& key) {
    return get(key).has_value();
}

bool MemoryStore::setMultiple(const std::unordered_map<std::string, Bytes>& values, std::chrono::seconds ttl) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto expiresAt = expiryFor(ttl);
    for (const auto& [key, value] : values) {
        entries_[key] = CacheEntry{value, expiresAt};
    }
    return true;
}

std::optional<int64_t> MemoryStore::increment(const std::string& key, int64_t delta) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.isExpired(clock_->now())) {
        // Новый счётчик бессрочный
        entries_[key] = CacheEntry{encodeCounter(delta), 0};
        return delta;
    }
    auto current = decodeCounter(it->second.value);
    if (!current) {
        spdlog::warn("MemoryStore: значение ключа '{}' не является целым числом", key);
        return std::nullopt;
    }
    auto updated = addCounter(*current, delta);
    if (!updated) {
        spdlog::warn("MemoryStore: переполнение счётчика '{}' ({} + {})", key, *current, delta);
        return std::nullopt;
    }
    it->second.value = encodeCounter(*updated);
    return updated;
}

size_t MemoryStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

std::unordered_map<std::string, Bytes> MemoryStore::exportAll() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::unordered_map<std::string, Bytes> result;
    auto now = clock_->now();
    for (const auto& [key, entry] : entries_) {
        if (!entry.isExpired(now)) {
            result[key] = entry.value;
        }
    }
    return result;
}

} // namespace cache
} // namespace core
} // namespace tagcache
