#include "tagcache/core/cache/metrics/CacheStatistics.hpp"

namespace tagcache {
namespace core {
namespace cache {

CacheStats CacheStatistics::snapshot() const {
    CacheStats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.sets = sets_.load(std::memory_order_relaxed);
    stats.deletes = deletes_.load(std::memory_order_relaxed);
    auto requests = stats.hits + stats.misses;
    stats.hitRate = requests > 0 ? static_cast<double>(stats.hits) / requests : 0.0;
    stats.since = std::chrono::steady_clock::time_point(
        std::chrono::steady_clock::duration(since_.load(std::memory_order_relaxed)));
    return stats;
}

void CacheStatistics::reset() {
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    sets_.store(0, std::memory_order_relaxed);
    deletes_.store(0, std::memory_order_relaxed);
    since_.store(std::chrono::steady_clock::now().time_since_epoch().count(), std::memory_order_relaxed);
}

} // namespace cache
} // namespace core
} // namespace tagcache
