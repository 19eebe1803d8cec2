#pragma once
#include <memory>
#include <spdlog/spdlog.h>
#include "tagcache/core/cache/CacheConfig.hpp"

namespace tagcache {
namespace core {
namespace cache {

// Имя общего логгера библиотеки
constexpr const char* CACHE_LOGGER_NAME = "tagcache";

// Создаёт и регистрирует логгер "tagcache", если его ещё нет.
// logPath задан: rotating file sink, иначе цветная консоль.
std::shared_ptr<spdlog::logger> initializeLogger(const CacheConfig& config);

} // namespace cache
} // namespace core
} // namespace tagcache
