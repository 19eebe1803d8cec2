#include "tagcache/core/cache/CacheConfig.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include <spdlog/spdlog.h>
#include <fstream>

namespace tagcache {
namespace core {
namespace cache {

StoreKind storeKindFromString(const std::string& name) {
    if (name == "memory") return StoreKind::Memory;
    if (name == "file") return StoreKind::File;
    if (name == "network") return StoreKind::Network;
    if (name == "table") return StoreKind::Table;
    if (name == "composite") return StoreKind::Composite;
    throw CacheConfigError("Unknown cache backend: '" + name + "'");
}

std::string toString(StoreKind kind) {
    switch (kind) {
        case StoreKind::Memory: return "memory";
        case StoreKind::File: return "file";
        case StoreKind::Network: return "network";
        case StoreKind::Table: return "table";
        case StoreKind::Composite: return "composite";
    }
    return "unknown";
}

CompositePolicy compositePolicyFromString(const std::string& name) {
    if (name == "fallback") return CompositePolicy::Fallback;
    if (name == "replicate") return CompositePolicy::Replicate;
    throw CacheConfigError("Invalid composite policy: '" + name + "'");
}

std::string toString(CompositePolicy policy) {
    switch (policy) {
        case CompositePolicy::Fallback: return "fallback";
        case CompositePolicy::Replicate: return "replicate";
    }
    return "unknown";
}

bool CacheConfig::validate() const {
    if (defaultTtl.count() < 0) {
        return false;
    }
    if (backend == StoreKind::File && storagePath.empty()) {
        return false;
    }
    if (backend == StoreKind::Composite) {
        if (compositeBackends.empty()) {
            return false;
        }
        size_t fileChildren = 0;
        for (auto kind : compositeBackends) {
            // Вложенные composite не поддерживаются
            if (kind == StoreKind::Composite) {
                return false;
            }
            if (kind == StoreKind::File) {
                if (storagePath.empty()) {
                    return false;
                }
                ++fileChildren;
            }
        }
        // Все file-дети писали бы в один storagePath
        if (fileChildren > 1) {
            return false;
        }
    }
    return !logPath.empty() ? (maxLogSize > 0 && maxLogFiles > 0) : true;
}

nlohmann::json CacheConfig::toJson() const {
    nlohmann::json children = nlohmann::json::array();
    for (auto kind : compositeBackends) {
        children.push_back(toString(kind));
    }
    return {
        {"defaultTtl", defaultTtl.count()},
        {"keyPrefix", keyPrefix},
        {"backend", toString(backend)},
        {"compositePolicy", toString(compositePolicy)},
        {"compositeBackends", children},
        {"storagePath", storagePath},
        {"logPath", logPath},
        {"maxLogSize", maxLogSize},
        {"maxLogFiles", maxLogFiles},
        {"logLevel", logLevel}
    };
}

CacheConfig CacheConfig::fromJson(const nlohmann::json& j) {
    CacheConfig config;
    try {
        if (!j.is_object()) {
            throw CacheConfigError("Cache configuration must be a JSON object");
        }
        if (j.contains("defaultTtl")) {
            config.defaultTtl = std::chrono::seconds(j.at("defaultTtl").get<int64_t>());
        }
        config.keyPrefix = j.value("keyPrefix", config.keyPrefix);
        if (j.contains("backend")) {
            config.backend = storeKindFromString(j.at("backend").get<std::string>());
        }
        if (j.contains("compositePolicy")) {
            config.compositePolicy = compositePolicyFromString(j.at("compositePolicy").get<std::string>());
        }
        if (j.contains("compositeBackends")) {
            for (const auto& child : j.at("compositeBackends")) {
                config.compositeBackends.push_back(storeKindFromString(child.get<std::string>()));
            }
        }
        config.storagePath = j.value("storagePath", config.storagePath);
        config.logPath = j.value("logPath", config.logPath);
        config.maxLogSize = j.value("maxLogSize", config.maxLogSize);
        config.maxLogFiles = j.value("maxLogFiles", config.maxLogFiles);
        config.logLevel = j.value("logLevel", config.logLevel);
    } catch (const nlohmann::json::exception& e) {
        throw CacheConfigError(std::string("Malformed cache configuration: ") + e.what());
    }
    if (!config.validate()) {
        throw CacheConfigError("Invalid cache configuration: " + j.dump());
    }
    return config;
}

CacheConfig CacheConfig::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw CacheConfigError("Cannot open cache configuration file: " + path);
    }
    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw CacheConfigError("Cannot parse cache configuration file " + path + ": " + e.what());
    }
    spdlog::info("CacheConfig: конфигурация загружена из {}", path);
    return fromJson(j);
}

} // namespace cache
} // namespace core
} // namespace tagcache
