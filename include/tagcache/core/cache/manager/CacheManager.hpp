#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "tagcache/core/cache/CacheConfig.hpp"
#include "tagcache/core/cache/base/Store.hpp"
#include "tagcache/core/cache/metrics/CacheStatistics.hpp"

namespace tagcache {
namespace core {
namespace cache {

/**
 * @brief Фасад кэша для приложения: префикс ключей, TTL по умолчанию,
 * remember, пакетные операции, increment/decrement, статистика.
 *
 * Сбои Store (StoreError) никогда не пробрасываются: чтение превращается в
 * промах, запись в false, с предупреждением в логе.
 *
 * remember не защищает от cache stampede: при одновременных промахах по
 * одному ключу producer может выполниться несколько раз.
 * Отрицательный TTL отклоняется: set/setMultiple возвращают false.
 * Переполнение счётчика в increment/decrement даёт nullopt, значение не меняется.
 * increment без AtomicCounter у Store эмулируется через get/set и не
 * безопасен при конкурентных инкрементах одного ключа.
 */
class CacheManager {
public:
    using Producer = std::function<Bytes()>;

    // Бросает CacheConfigError при store == nullptr или невалидном config
    CacheManager(const CacheConfig& config, std::shared_ptr<Store> store);
    ~CacheManager();
    CacheManager(const CacheManager&) = delete;
    CacheManager& operator=(const CacheManager&) = delete;

    std::optional<Bytes> tryGet(const std::string& key); // Получить или nullopt
    Bytes get(const std::string& key, const Bytes& defaultValue = {}); // Получить или default
    bool has(const std::string& key);
    bool set(const std::string& key, const Bytes& value, std::optional<std::chrono::seconds> ttl = std::nullopt);
    bool add(const std::string& key, const Bytes& value, std::optional<std::chrono::seconds> ttl = std::nullopt); // Только если нет
    bool forever(const std::string& key, const Bytes& value); // Бессрочно
    bool remove(const std::string& key);
    std::optional<Bytes> pull(const std::string& key); // Получить и удалить
    Bytes remember(const std::string& key, std::optional<std::chrono::seconds> ttl, const Producer& producer);
    Bytes rememberForever(const std::string& key, const Producer& producer);
    std::optional<int64_t> increment(const std::string& key, int64_t delta = 1);
    std::optional<int64_t> decrement(const std::string& key, int64_t delta = 1);

    std::unordered_map<std::string, Bytes> getMultiple(const std::vector<std::string>& keys);
    bool setMultiple(const std::unordered_map<std::string, Bytes>& values,
                     std::optional<std::chrono::seconds> ttl = std::nullopt);
    bool removeMultiple(const std::vector<std::string>& keys);
    bool clear(); // Очищает весь Store, включая чужие префиксы

    std::optional<nlohmann::json> getJson(const std::string& key); // Неразбираемое значение = промах + удаление
    bool setJson(const std::string& key, const nlohmann::json& value,
                 std::optional<std::chrono::seconds> ttl = std::nullopt);

    std::string prefixedKey(const std::string& key) const;
    bool supportsAtomicIncrement() const;
    CacheStats getStats() const;
    void resetStats();
    const CacheConfig& getConfiguration() const;
    std::shared_ptr<Store> store() const;
private:
    struct Impl;
    std::unique_ptr<Impl> pImpl; // Реализация
};

} // namespace cache
} // namespace core
} // namespace tagcache
