#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "tagcache/core/cache/CacheConfig.hpp"
#include "tagcache/core/cache/manager/CacheManager.hpp"
#include "tagcache/core/cache/store/StoreFactory.hpp"
#include "tagcache/core/cache/tagged/TaggedCache.hpp"

namespace tagcache {
namespace core {
namespace cache {

// CacheRegistry: именованные кэши процесса. Создаётся один раз при старте
// и передаётся потребителям по ссылке.
class CacheRegistry {
public:
    explicit CacheRegistry(StoreFactory factory = StoreFactory());
    CacheRegistry(const CacheRegistry&) = delete;
    CacheRegistry& operator=(const CacheRegistry&) = delete;

    // Создать кэш по конфигурации; бросает CacheConfigError (имя занято, backend не собран)
    std::shared_ptr<CacheManager> create(const std::string& name, const CacheConfig& config);
    void registerCache(const std::string& name, std::shared_ptr<CacheManager> cache); // Бросает CacheConfigError
    bool unregisterCache(const std::string& name);

    std::shared_ptr<CacheManager> store(const std::string& name) const; // Бросает CacheConfigError
    std::shared_ptr<TaggedCache> tagged(const std::string& name) const; // Бросает CacheConfigError
    bool has(const std::string& name) const;
    std::vector<std::string> names() const; // Отсортированы

    bool clearAll(); // false, если хотя бы один clear не выполнен
    nlohmann::json stats() const;

    StoreFactory& factory() { return factory_; }
private:
    struct Entry {
        std::shared_ptr<CacheManager> manager;
        std::shared_ptr<TaggedCache> tagged;
    };
    StoreFactory factory_;
    std::unordered_map<std::string, Entry> caches_;
    mutable std::mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace tagcache
