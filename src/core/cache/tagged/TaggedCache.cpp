#include "tagcache/core/cache/tagged/TaggedCache.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include "tagcache/core/cache/CacheLogger.hpp"
#include "tagcache/core/cache/Hashing.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace tagcache {
namespace core {
namespace cache {

namespace {

// Компонент с префиксом длины: разные наборы не склеиваются в одну строку
void appendComponent(std::string& out, const std::string& value) {
    out += std::to_string(value.size());
    out += ':';
    out += value;
    out += ';';
}

} // namespace

TaggedCache::TaggedCache(std::shared_ptr<CacheManager> manager)
    : manager_(std::move(manager)) {
    if (!manager_) {
        throw CacheConfigError("TaggedCache requires a CacheManager");
    }
}

std::vector<std::string> TaggedCache::normalize(const std::vector<std::string>& tags) {
    std::vector<std::string> sorted(tags);
    std::sort(sorted.begin(), sorted.end());
    sorted.erase(std::unique(sorted.begin(), sorted.end()), sorted.end());
    return sorted;
}

std::string TaggedCache::versionKey(const std::string& tag) {
    return TAG_VERSION_KEY_PREFIX + tag;
}

std::string TaggedCache::composeKey(const std::vector<std::string>& sortedTags,
                                    const std::vector<std::string>& tokens, const std::string& key) {
    std::string material;
    for (const auto& tag : sortedTags) {
        appendComponent(material, tag);
    }
    material += '|';
    for (const auto& token : tokens) {
        appendComponent(material, token);
    }
    material += '|';
    appendComponent(material, key);
    return TAGGED_KEY_PREFIX + sha256Hex(material);
}

std::optional<std::string> TaggedCache::tagVersion(const std::string& tag) const {
    // Токены читаются мимо статистики менеджера
    auto fullKey = manager_->prefixedKey(versionKey(tag));
    try {
        auto raw = manager_->store()->get(fullKey);
        if (!raw || raw->empty()) {
            return std::nullopt;
        }
        return std::string(raw->begin(), raw->end());
    } catch (const StoreError& e) {
        if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
            logger->warn("TaggedCache: токен тега '{}' недоступен: {}", tag, e.what());
        }
        return std::nullopt;
    }
}

std::optional<std::string> TaggedCache::ensureTagVersion(const std::string& tag) const {
    auto current = tagVersion(tag);
    if (current) {
        return current;
    }
    auto fullKey = manager_->prefixedKey(versionKey(tag));
    try {
        auto token = randomToken();
        if (!manager_->store()->set(fullKey, Bytes(token.begin(), token.end()), TTL_FOREVER)) {
            return std::nullopt;
        }
        spdlog::debug("TaggedCache: создан токен для тега '{}'", tag);
        // Параллельный писатель мог успеть раньше: берём то, что лежит в Store
        auto stored = tagVersion(tag);
        return stored ? stored : std::optional<std::string>(token);
    } catch (const StoreError& e) {
        if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
            logger->warn("TaggedCache: не удалось создать токен тега '{}': {}", tag, e.what());
        }
        return std::nullopt;
    }
}

std::optional<std::string> TaggedCache::resolveKey(const std::vector<std::string>& tags, const std::string& key,
                                                   bool createMissing) const {
    auto sorted = normalize(tags);
    std::vector<std::string> tokens;
    tokens.reserve(sorted.size());
    for (const auto& tag : sorted) {
        auto token = createMissing ? ensureTagVersion(tag) : tagVersion(tag);
        if (!token) {
            return std::nullopt;
        }
        tokens.push_back(std::move(*token));
    }
    return composeKey(sorted, tokens, key);
}

std::optional<std::string> TaggedCache::physicalKey(const std::vector<std::string>& tags,
                                                    const std::string& key) const {
    return resolveKey(tags, key, false);
}

std::optional<Bytes> TaggedCache::get(const std::vector<std::string>& tags, const std::string& key) const {
    auto physical = resolveKey(tags, key, false);
    if (!physical) {
        // Тег без токена: под ним ещё ничего не записывалось
        return std::nullopt;
    }
    return manager_->tryGet(*physical);
}

bool TaggedCache::set(const std::vector<std::string>& tags, const std::string& key, const Bytes& value,
                      std::optional<std::chrono::seconds> ttl) const {
    auto physical = resolveKey(tags, key, true);
    if (!physical) {
        return false;
    }
    return manager_->set(*physical, value, ttl);
}

bool TaggedCache::has(const std::vector<std::string>& tags, const std::string& key) const {
    auto physical = resolveKey(tags, key, false);
    return physical && manager_->has(*physical);
}

bool TaggedCache::forget(const std::vector<std::string>& tags, const std::string& key) const {
    auto physical = resolveKey(tags, key, false);
    if (!physical) {
        return true;
    }
    return manager_->remove(*physical);
}

Bytes TaggedCache::remember(const std::vector<std::string>& tags, const std::string& key,
                            std::optional<std::chrono::seconds> ttl,
                            const CacheManager::Producer& producer) const {
    auto cached = get(tags, key);
    if (cached) {
        return *cached;
    }
    Bytes value = producer();
    if (!set(tags, key, value, ttl)) {
        if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
            logger->warn("TaggedCache: remember '{}' вычислил значение, но не сохранил его", key);
        }
    }
    return value;
}

bool TaggedCache::flush(const std::string& tag) const {
    auto fullKey = manager_->prefixedKey(versionKey(tag));
    try {
        auto token = randomToken();
        if (!manager_->store()->set(fullKey, Bytes(token.begin(), token.end()), TTL_FOREVER)) {
            if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
                logger->warn("TaggedCache: flush тега '{}' отклонён хранилищем", tag);
            }
            return false;
        }
    } catch (const StoreError& e) {
        if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
            logger->warn("TaggedCache: flush тега '{}' не выполнен: {}", tag, e.what());
        }
        return false;
    }
    if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
        logger->info("TaggedCache: тег '{}' сброшен", tag);
    }
    return true;
}

bool TaggedCache::flush(const std::vector<std::string>& tags) const {
    bool ok = true;
    for (const auto& tag : normalize(tags)) {
        ok = flush(tag) && ok;
    }
    return ok;
}

TaggedCache::Scope TaggedCache::tags(std::vector<std::string> tags) const {
    return Scope(*this, normalize(tags));
}

std::optional<Bytes> TaggedCache::Scope::get(const std::string& key) const {
    return owner_.get(tags_, key);
}

bool TaggedCache::Scope::set(const std::string& key, const Bytes& value,
                             std::optional<std::chrono::seconds> ttl) const {
    return owner_.set(tags_, key, value, ttl);
}

bool TaggedCache::Scope::has(const std::string& key) const {
    return owner_.has(tags_, key);
}

bool TaggedCache::Scope::forget(const std::string& key) const {
    return owner_.forget(tags_, key);
}

Bytes TaggedCache::Scope::remember(const std::string& key, std::optional<std::chrono::seconds> ttl,
                                   const CacheManager::Producer& producer) const {
    return owner_.remember(tags_, key, ttl, producer);
}

bool TaggedCache::Scope::flush() const {
    return owner_.flush(tags_);
}

} // namespace cache
} // namespace core
} // namespace tagcache
