#include "tagcache/core/cache/manager/CacheManager.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include "tagcache/core/cache/CacheLogger.hpp"
#include <spdlog/spdlog.h>
#include <limits>
#include <unordered_set>

namespace tagcache {
namespace core {
namespace cache {

// Реализация PIMPL
struct CacheManager::Impl {
    CacheConfig config;
    std::shared_ptr<Store> store;
    AtomicCounter* counter = nullptr; // Не владеет; указывает в store, если поддерживается
    CacheStatistics stats;
    std::shared_ptr<spdlog::logger> logger;

    Impl(const CacheConfig& cfg, std::shared_ptr<Store> s)
        : config(cfg), store(std::move(s)) {
        counter = dynamic_cast<AtomicCounter*>(store.get());
        logger = initializeLogger(config);
    }

    std::chrono::seconds resolveTtl(std::optional<std::chrono::seconds> ttl) const {
        return ttl ? *ttl : config.defaultTtl;
    }

    template<typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger) {
            logger->warn(fmt, std::forward<Args>(args)...);
        }
    }
};

CacheManager::CacheManager(const CacheConfig& config, std::shared_ptr<Store> store) {
    if (!store) {
        throw CacheConfigError("CacheManager requires a store");
    }
    if (!config.validate()) {
        throw CacheConfigError("CacheManager: invalid configuration");
    }
    pImpl = std::make_unique<Impl>(config, std::move(store));
    if (pImpl->logger) {
        pImpl->logger->info("CacheManager создан: store={}, prefix='{}', defaultTtl={}s, atomicIncrement={}",
                            pImpl->store->name(), config.keyPrefix, config.defaultTtl.count(),
                            pImpl->counter != nullptr);
    }
}

CacheManager::~CacheManager() = default;

std::string CacheManager::prefixedKey(const std::string& key) const {
    if (pImpl->config.keyPrefix.empty()) {
        return key;
    }
    return pImpl->config.keyPrefix + ":" + key;
}

std::optional<Bytes> CacheManager::tryGet(const std::string& key) {
    auto fullKey = prefixedKey(key);
    try {
        auto value = pImpl->store->get(fullKey);
        if (value) {
            pImpl->stats.recordHit();
            if (pImpl->logger) {
                pImpl->logger->debug("Попадание: key={}, size={}", fullKey, value->size());
            }
            return value;
        }
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: get '{}' не выполнен ({}), считаем промахом", fullKey, e.what());
    }
    pImpl->stats.recordMiss();
    if (pImpl->logger) {
        pImpl->logger->debug("Промах: key={}", fullKey);
    }
    return std::nullopt;
}

Bytes CacheManager::get(const std::string& key, const Bytes& defaultValue) {
    auto value = tryGet(key);
    return value ? *value : defaultValue;
}

bool CacheManager::has(const std::string& key) {
    auto fullKey = prefixedKey(key);
    try {
        return pImpl->store->has(fullKey);
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: has '{}' не выполнен: {}", fullKey, e.what());
        return false;
    }
}

bool CacheManager::set(const std::string& key, const Bytes& value, std::optional<std::chrono::seconds> ttl) {
    auto fullKey = prefixedKey(key);
    auto effectiveTtl = pImpl->resolveTtl(ttl);
    if (effectiveTtl.count() < 0) {
        pImpl->warn("CacheManager: отрицательный TTL {}s для '{}' отклонён", effectiveTtl.count(), fullKey);
        return false;
    }
    try {
        if (pImpl->store->set(fullKey, value, effectiveTtl)) {
            pImpl->stats.recordSet();
            return true;
        }
        pImpl->warn("CacheManager: set '{}' отклонён хранилищем", fullKey);
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: set '{}' не выполнен: {}", fullKey, e.what());
    }
    return false;
}

bool CacheManager::add(const std::string& key, const Bytes& value, std::optional<std::chrono::seconds> ttl) {
    // Не атомарно: между has и set ключ может появиться
    if (has(key)) {
        return false;
    }
    return set(key, value, ttl);
}

bool CacheManager::forever(const std::string& key, const Bytes& value) {
    return set(key, value, TTL_FOREVER);
}

bool CacheManager::remove(const std::string& key) {
    auto fullKey = prefixedKey(key);
    try {
        if (pImpl->store->remove(fullKey)) {
            pImpl->stats.recordDelete();
            return true;
        }
        pImpl->warn("CacheManager: remove '{}' отклонён хранилищем", fullKey);
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: remove '{}' не выполнен: {}", fullKey, e.what());
    }
    return false;
}

std::optional<Bytes> CacheManager::pull(const std::string& key) {
    auto value = tryGet(key);
    if (value) {
        remove(key);
    }
    return value;
}

Bytes CacheManager::remember(const std::string& key, std::optional<std::chrono::seconds> ttl,
                             const Producer& producer) {
    auto cached = tryGet(key);
    if (cached) {
        return *cached;
    }
    Bytes value = producer();
    if (!set(key, value, ttl)) {
        pImpl->warn("CacheManager: remember '{}' вычислил значение, но не сохранил его", prefixedKey(key));
    }
    return value;
}

Bytes CacheManager::rememberForever(const std::string& key, const Producer& producer) {
    return remember(key, TTL_FOREVER, producer);
}

std::optional<int64_t> CacheManager::increment(const std::string& key, int64_t delta) {
    auto fullKey = prefixedKey(key);
    try {
        if (pImpl->counter) {
            return pImpl->counter->increment(fullKey, delta);
        }
        // Эмуляция read-modify-write, не атомарна
        int64_t current = 0;
        auto stored = pImpl->store->get(fullKey);
        if (stored) {
            auto decoded = decodeCounter(*stored);
            if (!decoded) {
                pImpl->warn("CacheManager: значение '{}' не является целым числом", fullKey);
                return std::nullopt;
            }
            current = *decoded;
        }
        auto updated = addCounter(current, delta);
        if (!updated) {
            pImpl->warn("CacheManager: переполнение счётчика '{}' ({} + {})", fullKey, current, delta);
            return std::nullopt;
        }
        if (!pImpl->store->set(fullKey, encodeCounter(*updated), TTL_FOREVER)) {
            return std::nullopt;
        }
        return updated;
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: increment '{}' не выполнен: {}", fullKey, e.what());
        return std::nullopt;
    }
}

std::optional<int64_t> CacheManager::decrement(const std::string& key, int64_t delta) {
    if (delta == std::numeric_limits<int64_t>::min()) {
        pImpl->warn("CacheManager: decrement '{}' на {} не представим", prefixedKey(key), delta);
        return std::nullopt;
    }
    return increment(key, -delta);
}

std::unordered_map<std::string, Bytes> CacheManager::getMultiple(const std::vector<std::string>& keys) {
    // Повторяющиеся ключи запрашиваются и учитываются в статистике один раз
    std::vector<std::string> uniqueKeys;
    std::vector<std::string> fullKeys;
    std::unordered_set<std::string> seen;
    for (const auto& key : keys) {
        if (seen.insert(key).second) {
            uniqueKeys.push_back(key);
            fullKeys.push_back(prefixedKey(key));
        }
    }
    std::unordered_map<std::string, Bytes> result;
    try {
        auto found = pImpl->store->getMultiple(fullKeys);
        for (size_t i = 0; i < uniqueKeys.size(); ++i) {
            auto it = found.find(fullKeys[i]);
            if (it != found.end()) {
                pImpl->stats.recordHit();
                result[uniqueKeys[i]] = std::move(it->second);
            } else {
                pImpl->stats.recordMiss();
            }
        }
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: getMultiple не выполнен ({}), считаем промахами", e.what());
        result.clear();
        for (size_t i = 0; i < uniqueKeys.size(); ++i) {
            pImpl->stats.recordMiss();
        }
    }
    return result;
}

bool CacheManager::setMultiple(const std::unordered_map<std::string, Bytes>& values,
                               std::optional<std::chrono::seconds> ttl) {
    auto effectiveTtl = pImpl->resolveTtl(ttl);
    if (effectiveTtl.count() < 0) {
        pImpl->warn("CacheManager: отрицательный TTL {}s для setMultiple отклонён", effectiveTtl.count());
        return false;
    }
    std::unordered_map<std::string, Bytes> prefixed;
    for (const auto& [key, value] : values) {
        prefixed[prefixedKey(key)] = value;
    }
    try {
        if (pImpl->store->setMultiple(prefixed, effectiveTtl)) {
            for (size_t i = 0; i < values.size(); ++i) {
                pImpl->stats.recordSet();
            }
            return true;
        }
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: setMultiple не выполнен: {}", e.what());
    }
    return false;
}

bool CacheManager::removeMultiple(const std::vector<std::string>& keys) {
    std::vector<std::string> fullKeys;
    for (const auto& key : keys) {
        fullKeys.push_back(prefixedKey(key));
    }
    try {
        if (pImpl->store->removeMultiple(fullKeys)) {
            for (size_t i = 0; i < keys.size(); ++i) {
                pImpl->stats.recordDelete();
            }
            return true;
        }
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: removeMultiple не выполнен: {}", e.what());
    }
    return false;
}

bool CacheManager::clear() {
    try {
        if (pImpl->store->clear()) {
            if (pImpl->logger) {
                pImpl->logger->info("CacheManager: хранилище {} очищено", pImpl->store->name());
            }
            return true;
        }
    } catch (const StoreError& e) {
        pImpl->warn("CacheManager: clear не выполнен: {}", e.what());
    }
    return false;
}

std::optional<nlohmann::json> CacheManager::getJson(const std::string& key) {
    auto raw = tryGet(key);
    if (!raw) {
        return std::nullopt;
    }
    try {
        return nlohmann::json::parse(raw->begin(), raw->end());
    } catch (const nlohmann::json::parse_error& e) {
        pImpl->warn("CacheManager: повреждённое JSON-значение '{}' удалено: {}", prefixedKey(key), e.what());
        remove(key);
        return std::nullopt;
    }
}

bool CacheManager::setJson(const std::string& key, const nlohmann::json& value,
                           std::optional<std::chrono::seconds> ttl) {
    auto text = value.dump();
    return set(key, Bytes(text.begin(), text.end()), ttl);
}

bool CacheManager::supportsAtomicIncrement() const {
    return pImpl->counter != nullptr;
}

CacheStats CacheManager::getStats() const {
    return pImpl->stats.snapshot();
}

void CacheManager::resetStats() {
    pImpl->stats.reset();
}

const CacheConfig& CacheManager::getConfiguration() const {
    return pImpl->config;
}

std::shared_ptr<Store> CacheManager::store() const {
    return pImpl->store;
}

} // namespace cache
} // namespace core
} // namespace tagcache
