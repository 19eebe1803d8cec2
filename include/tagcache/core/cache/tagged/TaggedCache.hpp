#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tagcache/core/cache/base/Store.hpp"
#include "tagcache/core/cache/manager/CacheManager.hpp"

namespace tagcache {
namespace core {
namespace cache {

// Префиксы зарезервированных ключей
constexpr const char* TAG_VERSION_KEY_PREFIX = "tagversion:";
constexpr const char* TAGGED_KEY_PREFIX = "tagged:";

/**
 * @brief Кэш с тегами и инвалидацией группы записей за O(число тегов).
 *
 * Каждому тегу соответствует токен версии (128 случайных бит), хранящийся
 * бессрочно под ключом "tagversion:<tag>". Физический ключ записи:
 * "tagged:" + sha256(отсортированные теги, их токены, логический ключ).
 * flush(tag) лишь заменяет токен: все прежние физические ключи становятся
 * недостижимыми, а сами данные остаются в Store до истечения TTL.
 *
 * Токены создаются только при записи; чтение с отсутствующим токеном:
 * гарантированный промах.
 */
class TaggedCache {
public:
    explicit TaggedCache(std::shared_ptr<CacheManager> manager);

    // Привязка к набору тегов (порядок и дубликаты не важны)
    class Scope {
    public:
        std::optional<Bytes> get(const std::string& key) const;
        bool set(const std::string& key, const Bytes& value,
                 std::optional<std::chrono::seconds> ttl = std::nullopt) const;
        bool has(const std::string& key) const;
        bool forget(const std::string& key) const;
        Bytes remember(const std::string& key, std::optional<std::chrono::seconds> ttl,
                       const CacheManager::Producer& producer) const;
        bool flush() const; // Сбросить все теги набора
        const std::vector<std::string>& tags() const { return tags_; }
    private:
        friend class TaggedCache;
        Scope(const TaggedCache& owner, std::vector<std::string> tags) : owner_(owner), tags_(std::move(tags)) {}
        const TaggedCache& owner_;
        std::vector<std::string> tags_;
    };

    Scope tags(std::vector<std::string> tags) const;

    std::optional<Bytes> get(const std::vector<std::string>& tags, const std::string& key) const;
    bool set(const std::vector<std::string>& tags, const std::string& key, const Bytes& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt) const;
    bool has(const std::vector<std::string>& tags, const std::string& key) const;
    bool forget(const std::vector<std::string>& tags, const std::string& key) const; // Удалить одну запись
    Bytes remember(const std::vector<std::string>& tags, const std::string& key,
                   std::optional<std::chrono::seconds> ttl, const CacheManager::Producer& producer) const;

    bool flush(const std::string& tag) const; // Новый токен версии тега
    bool flush(const std::vector<std::string>& tags) const;

    // Текущий токен тега или nullopt, если тег ещё не использовался
    std::optional<std::string> tagVersion(const std::string& tag) const;
    // Физический ключ по текущим токенам; nullopt, если какого-то токена нет
    std::optional<std::string> physicalKey(const std::vector<std::string>& tags, const std::string& key) const;

    CacheManager& manager() const { return *manager_; }
private:
    static std::vector<std::string> normalize(const std::vector<std::string>& tags);
    static std::string versionKey(const std::string& tag);
    static std::string composeKey(const std::vector<std::string>& sortedTags,
                                  const std::vector<std::string>& tokens, const std::string& key);
    std::optional<std::string> resolveKey(const std::vector<std::string>& tags, const std::string& key,
                                          bool createMissing) const;
    std::optional<std::string> ensureTagVersion(const std::string& tag) const;
    std::shared_ptr<CacheManager> manager_;
};

} // namespace cache
} // namespace core
} // namespace tagcache
