#include "tagcache/core/cache/store/StoreFactory.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include "tagcache/core/cache/store/CompositeStore.hpp"
#include "tagcache/core/cache/store/FileStore.hpp"
#include "tagcache/core/cache/store/MemoryStore.hpp"
#include <spdlog/spdlog.h>

namespace tagcache {
namespace core {
namespace cache {

StoreFactory::StoreFactory(std::shared_ptr<Clock> clock)
    : clock_(clock ? std::move(clock) : defaultClock()) {}

void StoreFactory::registerKind(StoreKind kind, Constructor constructor) {
    if (kind != StoreKind::Network && kind != StoreKind::Table) {
        throw CacheConfigError("Backend '" + toString(kind) + "' is built in and cannot be replaced");
    }
    if (!constructor) {
        throw CacheConfigError("Empty constructor for backend '" + toString(kind) + "'");
    }
    external_[kind] = std::move(constructor);
    spdlog::info("StoreFactory: зарегистрирован backend '{}'", toString(kind));
}

bool StoreFactory::supports(StoreKind kind) const {
    switch (kind) {
        case StoreKind::Memory:
        case StoreKind::File:
        case StoreKind::Composite:
            return true;
        case StoreKind::Network:
        case StoreKind::Table:
            return external_.count(kind) > 0;
    }
    return false;
}

std::shared_ptr<Store> StoreFactory::create(const CacheConfig& config) const {
    if (!config.validate()) {
        throw CacheConfigError("StoreFactory: invalid configuration for backend '" + toString(config.backend) + "'");
    }
    auto store = createKind(config.backend, config);
    spdlog::info("StoreFactory: создан store {}", store->name());
    return store;
}

std::shared_ptr<Store> StoreFactory::createKind(StoreKind kind, const CacheConfig& config) const {
    switch (kind) {
        case StoreKind::Memory:
            return std::make_shared<MemoryStore>(clock_);
        case StoreKind::File:
            return std::make_shared<FileStore>(config.storagePath, clock_);
        case StoreKind::Composite: {
            std::vector<std::shared_ptr<Store>> children;
            for (auto child : config.compositeBackends) {
                if (child == StoreKind::Composite) {
                    throw CacheConfigError("Nested composite backends are not supported");
                }
                children.push_back(createKind(child, config));
            }
            return std::make_shared<CompositeStore>(std::move(children), config.compositePolicy);
        }
        case StoreKind::Network:
        case StoreKind::Table: {
            auto it = external_.find(kind);
            if (it == external_.end()) {
                throw CacheConfigError("Backend '" + toString(kind) + "' is not registered");
            }
            auto store = it->second(config);
            if (!store) {
                throw CacheConfigError("Constructor for backend '" + toString(kind) + "' returned null");
            }
            return store;
        }
    }
    throw CacheConfigError("Unknown backend kind");
}

} // namespace cache
} // namespace core
} // namespace tagcache
