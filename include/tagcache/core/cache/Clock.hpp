#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace tagcache {
namespace core {
namespace cache {

// Clock: источник времени для TTL (unix-секунды), подменяется в тестах
class Clock {
public:
    virtual ~Clock() = default;
    virtual int64_t now() const = 0; // Текущее время, секунды
};

// SystemClock: реальное время (system_clock)
class SystemClock : public Clock {
public:
    int64_t now() const override {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }
};

// ManualClock: время, управляемое вручную (тесты, симуляция)
class ManualClock : public Clock {
public:
    explicit ManualClock(int64_t start = 1000000) : now_(start) {}
    int64_t now() const override { return now_.load(); }
    void advance(std::chrono::seconds delta) { now_ += delta.count(); } // Сдвинуть время
    void set(int64_t value) { now_ = value; }
private:
    std::atomic<int64_t> now_;
};

inline std::shared_ptr<Clock> defaultClock() {
    static std::shared_ptr<Clock> clock = std::make_shared<SystemClock>();
    return clock;
}

} // namespace cache
} // namespace core
} // namespace tagcache
