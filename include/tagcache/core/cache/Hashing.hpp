#pragma once
#include <string>

namespace tagcache {
namespace core {
namespace cache {

// SHA-256 в виде hex-строки (64 символа)
std::string sha256Hex(const std::string& data);

// Случайные 128 бит из RAND_bytes в виде hex-строки. Бросает StoreError, если CSPRNG недоступен.
std::string randomToken();

} // namespace cache
} // namespace core
} // namespace tagcache
