#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace tagcache {
namespace core {
namespace cache {

// CacheStats: снимок счётчиков (попадания, промахи, записи, удаления, hit rate)
struct CacheStats {
    size_t hits = 0;
    size_t misses = 0;
    size_t sets = 0;
    size_t deletes = 0;
    double hitRate = 0.0; // hits / (hits + misses), 0 без запросов
    std::chrono::steady_clock::time_point since; // Начало периода
    nlohmann::json toJson() const {
        return {
            {"hits", hits},
            {"misses", misses},
            {"sets", sets},
            {"deletes", deletes},
            {"hitRate", hitRate},
            {"uptimeMs", std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - since).count()}
        };
    }
};

// CacheStatistics: пассивные счётчики, живут в пределах процесса
class CacheStatistics {
public:
    CacheStatistics() : since_(std::chrono::steady_clock::now().time_since_epoch().count()) {}
    void recordHit() { hits_.fetch_add(1, std::memory_order_relaxed); }
    void recordMiss() { misses_.fetch_add(1, std::memory_order_relaxed); }
    void recordSet() { sets_.fetch_add(1, std::memory_order_relaxed); }
    void recordDelete() { deletes_.fetch_add(1, std::memory_order_relaxed); }
    CacheStats snapshot() const;
    void reset();
private:
    std::atomic<size_t> hits_{0};
    std::atomic<size_t> misses_{0};
    std::atomic<size_t> sets_{0};
    std::atomic<size_t> deletes_{0};
    std::atomic<std::chrono::steady_clock::rep> since_;
};

} // namespace cache
} // namespace core
} // namespace tagcache
