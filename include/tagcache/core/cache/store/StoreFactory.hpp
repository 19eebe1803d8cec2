#pragma once

#include <functional>
#include <map>
#include <memory>
#include "tagcache/core/cache/CacheConfig.hpp"
#include "tagcache/core/cache/Clock.hpp"
#include "tagcache/core/cache/base/Store.hpp"

namespace tagcache {
namespace core {
namespace cache {

// StoreFactory: отображение StoreKind -> конструктор Store.
// memory, file и composite встроены; network и table подключаются приложением через registerKind.
class StoreFactory {
public:
    using Constructor = std::function<std::shared_ptr<Store>(const CacheConfig&)>;

    explicit StoreFactory(std::shared_ptr<Clock> clock = defaultClock());
    void registerKind(StoreKind kind, Constructor constructor); // Только Network/Table
    bool supports(StoreKind kind) const;
    std::shared_ptr<Store> create(const CacheConfig& config) const; // Бросает CacheConfigError
    std::shared_ptr<Clock> clock() const { return clock_; }
private:
    std::shared_ptr<Store> createKind(StoreKind kind, const CacheConfig& config) const;
    std::shared_ptr<Clock> clock_;
    std::map<StoreKind, Constructor> external_;
};

} // namespace cache
} // namespace core
} // namespace tagcache
