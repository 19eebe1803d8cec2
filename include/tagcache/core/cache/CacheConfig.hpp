#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <nlohmann/json.hpp>

namespace tagcache {
namespace core {
namespace cache {

// StoreKind: вид backend-хранилища
enum class StoreKind {
    Memory,
    File,
    Network,
    Table,
    Composite
};

// CompositePolicy: политика CompositeStore
enum class CompositePolicy {
    Fallback,  // Чтение из первого доступного, запись только в primary
    Replicate  // Запись во все (best effort), чтение из первого ответившего
};

StoreKind storeKindFromString(const std::string& name); // Бросает CacheConfigError
std::string toString(StoreKind kind);
CompositePolicy compositePolicyFromString(const std::string& name); // Бросает CacheConfigError
std::string toString(CompositePolicy policy);

// CacheConfig: параметры кэша (TTL, префикс, backend, политика composite, логирование)
struct CacheConfig {
    std::chrono::seconds defaultTtl = std::chrono::seconds(3600); // TTL по умолчанию (0 = бессрочно)
    std::string keyPrefix;                                         // Пространство имён ключей
    StoreKind backend = StoreKind::Memory;                         // Backend
    CompositePolicy compositePolicy = CompositePolicy::Fallback;   // Политика composite
    std::vector<StoreKind> compositeBackends;                      // Дочерние backend'ы composite, не больше одного file
    std::string storagePath = "./cache";                           // Путь для FileStore
    std::string logPath;                                           // Пусто = консоль
    size_t maxLogSize = 1024 * 1024 * 5;
    size_t maxLogFiles = 2;
    std::string logLevel = "info";

    bool validate() const;
    nlohmann::json toJson() const;
    static CacheConfig fromJson(const nlohmann::json& j); // Бросает CacheConfigError
    static CacheConfig loadFromFile(const std::string& path); // Бросает CacheConfigError
};

} // namespace cache
} // namespace core
} // namespace tagcache
