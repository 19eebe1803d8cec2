#include "tagcache/core/cache/manager/CacheRegistry.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace tagcache {
namespace core {
namespace cache {

CacheRegistry::CacheRegistry(StoreFactory factory)
    : factory_(std::move(factory)) {}

std::shared_ptr<CacheManager> CacheRegistry::create(const std::string& name, const CacheConfig& config) {
    // Store строится вне блокировки: FileStore трогает файловую систему
    auto store = factory_.create(config);
    auto manager = std::make_shared<CacheManager>(config, std::move(store));
    registerCache(name, manager);
    return manager;
}

void CacheRegistry::registerCache(const std::string& name, std::shared_ptr<CacheManager> cache) {
    if (!cache) {
        throw CacheConfigError("CacheRegistry: null cache for '" + name + "'");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (caches_.find(name) != caches_.end()) {
        throw CacheConfigError("Cache '" + name + "' already registered");
    }
    auto tagged = std::make_shared<TaggedCache>(cache);
    caches_[name] = Entry{std::move(cache), std::move(tagged)};
    spdlog::info("CacheRegistry: зарегистрирован кэш '{}'", name);
}

bool CacheRegistry::unregisterCache(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    if (it == caches_.end()) {
        spdlog::warn("Cache '{}' not found", name);
        return false;
    }
    caches_.erase(it);
    spdlog::info("Cache '{}' unregistered", name);
    return true;
}

std::shared_ptr<CacheManager> CacheRegistry::store(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    if (it == caches_.end()) {
        throw CacheConfigError("Cache '" + name + "' is not configured");
    }
    return it->second.manager;
}

std::shared_ptr<TaggedCache> CacheRegistry::tagged(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = caches_.find(name);
    if (it == caches_.end()) {
        throw CacheConfigError("Cache '" + name + "' is not configured");
    }
    return it->second.tagged;
}

bool CacheRegistry::has(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return caches_.find(name) != caches_.end();
}

std::vector<std::string> CacheRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [name, _] : caches_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

bool CacheRegistry::clearAll() {
    std::vector<std::shared_ptr<CacheManager>> managers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, entry] : caches_) {
            managers.push_back(entry.manager);
        }
    }
    bool ok = true;
    for (const auto& manager : managers) {
        ok = manager->clear() && ok;
    }
    return ok;
}

nlohmann::json CacheRegistry::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [name, entry] : caches_) {
        auto j = entry.manager->getStats().toJson();
        j["store"] = entry.manager->store()->name();
        result[name] = j;
    }
    return result;
}

} // namespace cache
} // namespace core
} // namespace tagcache
