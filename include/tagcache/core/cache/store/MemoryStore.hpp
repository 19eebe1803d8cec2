#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include "tagcache/core/cache/Clock.hpp"
#include "tagcache/core/cache/base/Store.hpp"

namespace tagcache {
namespace core {
namespace cache {

// MemoryStore: потокобезопасное хранилище в памяти процесса с TTL и ленивым удалением.
// Вытеснения нет: объём ограничивает только приложение.
class MemoryStore : public Store, public AtomicCounter {
public:
    explicit MemoryStore(std::shared_ptr<Clock> clock = defaultClock());
    ~MemoryStore() override = default;

    std::optional<Bytes> get(const std::string& key) override;
    bool set(const std::string& key, const Bytes& value, std::chrono::seconds ttl) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    bool has(const std::string& key) override;
    bool setMultiple(const std::unordered_map<std::string, Bytes>& values, std::chrono::seconds ttl) override;
    std::optional<int64_t> increment(const std::string& key, int64_t delta) override;
    std::string name() const override { return "memory"; }

    size_t size() const; // Кол-во записей, включая ещё не удалённые истёкшие
    std::unordered_map<std::string, Bytes> exportAll() const; // Экспорт живых записей
private:
    int64_t expiryFor(std::chrono::seconds ttl) const;
    std::shared_ptr<Clock> clock_;
    std::unordered_map<std::string, CacheEntry> entries_;
    mutable std::shared_mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace tagcache
