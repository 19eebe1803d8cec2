#include "tagcache/core/cache/base/Store.hpp"
#include <charconv>
#include <limits>

namespace tagcache {
namespace core {
namespace cache {

std::unordered_map<std::string, Bytes> Store::getMultiple(const std::vector<std::string>& keys) {
    std::unordered_map<std::string, Bytes> result;
    for (const auto& key : keys) {
        auto value = get(key);
        if (value) {
            result[key] = std::move(*value);
        }
    }
    return result;
}

bool Store::setMultiple(const std::unordered_map<std::string, Bytes>& values, std::chrono::seconds ttl) {
    bool ok = true;
    for (const auto& [key, value] : values) {
        ok = set(key, value, ttl) && ok;
    }
    return ok;
}

bool Store::removeMultiple(const std::vector<std::string>& keys) {
    bool ok = true;
    for (const auto& key : keys) {
        ok = remove(key) && ok;
    }
    return ok;
}

Bytes encodeCounter(int64_t value) {
    auto text = std::to_string(value);
    return Bytes(text.begin(), text.end());
}

std::optional<int64_t> decodeCounter(const Bytes& bytes) {
    if (bytes.empty()) {
        return std::nullopt;
    }
    const char* begin = reinterpret_cast<const char*>(bytes.data());
    const char* end = begin + bytes.size();
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::optional<int64_t> addCounter(int64_t value, int64_t delta) {
    if (delta > 0 && value > std::numeric_limits<int64_t>::max() - delta) {
        return std::nullopt;
    }
    if (delta < 0 && value < std::numeric_limits<int64_t>::min() - delta) {
        return std::nullopt;
    }
    return value + delta;
}

} // namespace cache
} // namespace core
} // namespace tagcache
