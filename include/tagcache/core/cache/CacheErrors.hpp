#pragma once
#include <stdexcept>
#include <string>

namespace tagcache {
namespace core {
namespace cache {

// StoreError: сбой ввода-вывода внутри Store (восстановимая ошибка, перехватывается CacheManager)
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// CacheConfigError: ошибка конфигурации (неизвестный backend, неверная политика), фатальна при старте
class CacheConfigError : public std::runtime_error {
public:
    explicit CacheConfigError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace cache
} // namespace core
} // namespace tagcache
