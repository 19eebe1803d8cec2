#include "tagcache/core/cache/store/CompositeStore.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include "tagcache/core/cache/CacheLogger.hpp"
#include <spdlog/spdlog.h>

namespace tagcache {
namespace core {
namespace cache {

CompositeStore::CompositeStore(std::vector<std::shared_ptr<Store>> stores, CompositePolicy policy)
    : stores_(std::move(stores)), policy_(policy) {
    if (stores_.empty()) {
        throw CacheConfigError("CompositeStore requires at least one underlying store");
    }
    for (const auto& store : stores_) {
        if (!store) {
            throw CacheConfigError("CompositeStore: underlying store is null");
        }
    }
    spdlog::info("CompositeStore: {} хранилищ, политика {}", stores_.size(), toString(policy_));
}

std::string CompositeStore::name() const {
    std::string result = "composite(" + toString(policy_) + ":";
    for (size_t i = 0; i < stores_.size(); ++i) {
        result += (i ? "," : "") + stores_[i]->name();
    }
    return result + ")";
}

std::optional<Bytes> CompositeStore::get(const std::string& key) {
    size_t failures = 0;
    for (const auto& store : stores_) {
        try {
            auto value = store->get(key);
            if (value) {
                return value;
            }
            if (policy_ == CompositePolicy::Replicate) {
                // Первый ответивший без сбоя определяет результат
                return std::nullopt;
            }
        } catch (const StoreError& e) {
            ++failures;
            if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
                logger->warn("CompositeStore: get '{}' из {} завершился ошибкой: {}", key, store->name(), e.what());
            }
        }
    }
    if (failures == stores_.size()) {
        throw StoreError("CompositeStore: all stores failed on get");
    }
    return std::nullopt;
}

template<typename Op>
bool CompositeStore::applyWrite(const char* opName, Op&& op) {
    // Primary: сбой пробрасывается вызывающему
    bool ok = op(*stores_.front());
    if (policy_ == CompositePolicy::Fallback) {
        return ok;
    }
    for (size_t i = 1; i < stores_.size(); ++i) {
        try {
            if (!op(*stores_[i])) {
                if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
                    logger->warn("CompositeStore: {} в {} не выполнен", opName, stores_[i]->name());
                }
            }
        } catch (const StoreError& e) {
            if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
                logger->warn("CompositeStore: {} в {} завершился ошибкой: {}", opName, stores_[i]->name(), e.what());
            }
        }
    }
    return ok;
}

bool CompositeStore::set(const std::string& key, const Bytes& value, std::chrono::seconds ttl) {
    return applyWrite("set", [&](Store& store) { return store.set(key, value, ttl); });
}

bool CompositeStore::remove(const std::string& key) {
    return applyWrite("remove", [&](Store& store) { return store.remove(key); });
}

bool CompositeStore::clear() {
    return applyWrite("clear", [](Store& store) { return store.clear(); });
}

} // namespace cache
} // namespace core
} // namespace tagcache
