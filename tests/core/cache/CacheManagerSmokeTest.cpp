#include <cassert>
#include <iostream>
#include <memory>
#include <chrono>
#include <filesystem>
#include <limits>
#include "tagcache/core/cache/manager/CacheManager.hpp"
#include "tagcache/core/cache/CacheConfig.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include "tagcache/core/cache/Clock.hpp"
#include "tagcache/core/cache/store/FileStore.hpp"
#include "tagcache/core/cache/store/MemoryStore.hpp"
#include "TestStores.hpp"

#include <spdlog/spdlog.h>

using namespace tagcache::core::cache;
using tagcache::testing::FlakyStore;
using tagcache::testing::bytes;
using tagcache::testing::text;

namespace {

CacheConfig testConfig(const std::string& prefix) {
    CacheConfig config;
    config.keyPrefix = prefix;
    config.defaultTtl = std::chrono::seconds(60);
    config.logLevel = "warn";
    return config;
}

} // namespace

void smokeTestCacheManager() {
    std::cout << "Testing CacheManager basic operations...\n";
    auto clock = std::make_shared<ManualClock>();
    auto store = std::make_shared<MemoryStore>(clock);
    CacheManager manager(testConfig("app"), store);

    assert(manager.prefixedKey("user:1") == "app:user:1");
    assert(manager.set("user:1", bytes("Alice")));
    assert(text(manager.get("user:1")) == "Alice");
    // Ключ хранится с префиксом
    assert(store->has("app:user:1"));
    assert(!store->has("user:1"));

    assert(text(manager.get("missing", bytes("fallback"))) == "fallback");
    assert(manager.remove("user:1"));
    assert(!manager.has("user:1"));
    assert(manager.supportsAtomicIncrement());
    std::cout << "[OK] CacheManager smoke test\n";
}

void testCacheManagerEmptyPrefix() {
    std::cout << "Testing CacheManager without prefix...\n";
    auto store = std::make_shared<MemoryStore>(std::make_shared<ManualClock>());
    CacheManager manager(testConfig(""), store);
    assert(manager.prefixedKey("k") == "k");
    assert(manager.set("k", bytes("v")));
    assert(store->has("k"));
    std::cout << "[OK] CacheManager empty prefix test\n";
}

void testCacheManagerTtl() {
    std::cout << "Testing CacheManager TTL handling...\n";
    auto clock = std::make_shared<ManualClock>();
    CacheManager manager(testConfig("ttl"), std::make_shared<MemoryStore>(clock));

    assert(manager.set("default", bytes("d")));                       // 60s по умолчанию
    assert(manager.set("short", bytes("s"), std::chrono::seconds(1)));
    assert(manager.forever("config:theme", bytes("dark")));

    // Отрицательный TTL отклоняется, а не превращается в бессрочный
    assert(!manager.set("negative", bytes("n"), std::chrono::seconds(-5)));
    assert(!manager.has("negative"));
    assert(!manager.setMultiple({{"neg", bytes("n")}}, std::chrono::seconds(-1)));
    assert(!manager.has("neg"));

    clock->advance(std::chrono::seconds(2));
    assert(!manager.tryGet("short"));
    assert(manager.tryGet("default"));

    clock->advance(std::chrono::seconds(60));
    assert(!manager.tryGet("default"));

    clock->advance(std::chrono::seconds(10000));
    assert(text(manager.get("config:theme")) == "dark");
    std::cout << "[OK] CacheManager TTL test\n";
}

void testCacheManagerRemember() {
    std::cout << "Testing CacheManager remember...\n";
    CacheManager manager(testConfig("rem"), std::make_shared<MemoryStore>(std::make_shared<ManualClock>()));

    int calls = 0;
    auto producer = [&calls] {
        ++calls;
        return bytes("computed");
    };
    assert(text(manager.remember("report", std::chrono::seconds(30), producer)) == "computed");
    assert(calls == 1);
    // Попадание: producer не вызывается
    assert(text(manager.remember("report", std::chrono::seconds(30), producer)) == "computed");
    assert(calls == 1);
    assert(text(manager.rememberForever("static", producer)) == "computed");
    assert(calls == 2);

    // Store недоступен на запись: значение всё равно возвращается
    auto flaky = std::make_shared<FlakyStore>();
    CacheManager degraded(testConfig("rem"), flaky);
    flaky->failSet = true;
    assert(text(degraded.remember("x", std::nullopt, producer)) == "computed");
    assert(calls == 3);
    std::cout << "[OK] CacheManager remember test\n";
}

void testCacheManagerAddPull() {
    std::cout << "Testing CacheManager add/pull...\n";
    CacheManager manager(testConfig("ap"), std::make_shared<MemoryStore>(std::make_shared<ManualClock>()));

    assert(manager.add("once", bytes("first")));
    assert(!manager.add("once", bytes("second")));
    assert(text(manager.get("once")) == "first");

    auto pulled = manager.pull("once");
    assert(pulled && text(*pulled) == "first");
    assert(!manager.has("once"));
    assert(!manager.pull("once"));
    std::cout << "[OK] CacheManager add/pull test\n";
}

void testCacheManagerIncrement() {
    std::cout << "Testing CacheManager increment/decrement...\n";
    // Нативный путь
    CacheManager native(testConfig("inc"), std::make_shared<MemoryStore>(std::make_shared<ManualClock>()));
    assert(native.increment("visits") == 1);
    assert(native.increment("visits", 10) == 11);
    assert(native.decrement("visits", 3) == 8);

    // Эмуляция через get/set: FileStore не реализует AtomicCounter
    auto dir = (std::filesystem::temp_directory_path() / "tagcache_test_increment").string();
    std::filesystem::remove_all(dir);
    CacheManager emulated(testConfig("inc"), std::make_shared<FileStore>(dir, std::make_shared<ManualClock>()));
    assert(!emulated.supportsAtomicIncrement());
    assert(emulated.increment("visits") == 1);
    assert(emulated.increment("visits", 4) == 5);
    assert(emulated.decrement("visits") == 4);
    assert(text(emulated.get("visits")) == "4");

    assert(emulated.set("name", bytes("bob")));
    assert(!emulated.increment("name"));

    // Переполнение в обоих путях: nullopt, значение не меняется
    const auto maxValue = std::numeric_limits<int64_t>::max();
    const auto minValue = std::numeric_limits<int64_t>::min();
    assert(native.increment("edge", maxValue) == maxValue);
    assert(!native.increment("edge"));
    assert(text(native.get("edge")) == std::to_string(maxValue));
    assert(emulated.increment("edge", maxValue) == maxValue);
    assert(!emulated.increment("edge"));
    assert(text(emulated.get("edge")) == std::to_string(maxValue));
    assert(!native.decrement("edge", minValue));
    assert(!emulated.decrement("edge", minValue));
    assert(native.decrement("edge", maxValue) == 0);
    std::filesystem::remove_all(dir);
    std::cout << "[OK] CacheManager increment test\n";
}

void testCacheManagerBackendFailure() {
    std::cout << "Testing CacheManager backend failure handling...\n";
    auto flaky = std::make_shared<FlakyStore>();
    CacheManager manager(testConfig("fail"), flaky);
    assert(manager.set("k", bytes("v")));

    flaky->failGet = true;
    assert(text(manager.get("k", bytes("default"))) == "default");
    assert(!manager.tryGet("k"));
    assert(!manager.has("k"));
    assert(manager.getMultiple({"k"}).empty());
    assert(!manager.increment("counter"));

    flaky->failSet = true;
    assert(!manager.set("k", bytes("v2")));
    assert(!manager.setMultiple({{"a", bytes("1")}}));
    assert(!manager.clear());

    flaky->failRemove = true;
    assert(!manager.remove("k"));

    flaky->failGet = false;
    assert(text(manager.get("k")) == "v");
    std::cout << "[OK] CacheManager backend failure test\n";
}

void testCacheManagerBatch() {
    std::cout << "Testing CacheManager batch operations...\n";
    auto store = std::make_shared<MemoryStore>(std::make_shared<ManualClock>());
    CacheManager manager(testConfig("batch"), store);

    assert(manager.setMultiple({{"a", bytes("1")}, {"b", bytes("2")}}));
    assert(store->has("batch:a"));
    auto found = manager.getMultiple({"a", "b", "c"});
    assert(found.size() == 2);
    assert(text(found["a"]) == "1");
    assert(found.count("c") == 0);

    // Повторяющийся ключ: значение целое, одно попадание
    manager.resetStats();
    auto repeated = manager.getMultiple({"a", "a", "c", "c"});
    assert(repeated.size() == 1);
    assert(text(repeated["a"]) == "1");
    assert(manager.getStats().hits == 1);
    assert(manager.getStats().misses == 1);

    assert(manager.removeMultiple({"a", "b"}));
    assert(manager.getMultiple({"a", "b"}).empty());
    std::cout << "[OK] CacheManager batch test\n";
}

void testCacheManagerJson() {
    std::cout << "Testing CacheManager JSON helpers...\n";
    auto store = std::make_shared<MemoryStore>(std::make_shared<ManualClock>());
    CacheManager manager(testConfig("json"), store);

    assert(manager.setJson("user:1", {{"name", "Alice"}}, std::chrono::seconds(60)));
    auto value = manager.getJson("user:1");
    assert(value && (*value)["name"] == "Alice");

    // Повреждённое значение: промах и удаление
    assert(store->set("json:broken", bytes("{not json"), TTL_FOREVER));
    assert(!manager.getJson("broken"));
    assert(!store->has("json:broken"));
    std::cout << "[OK] CacheManager JSON test\n";
}

void testCacheManagerStatistics() {
    std::cout << "Testing CacheManager statistics...\n";
    CacheManager manager(testConfig("stats"), std::make_shared<MemoryStore>(std::make_shared<ManualClock>()));

    auto empty = manager.getStats();
    assert(empty.hits == 0 && empty.misses == 0 && empty.hitRate == 0.0);

    assert(manager.set("present", bytes("v")));
    const size_t misses = 4;
    const size_t hits = 6;
    for (size_t i = 0; i < misses; ++i) {
        assert(!manager.tryGet("absent_" + std::to_string(i)));
    }
    for (size_t i = 0; i < hits; ++i) {
        assert(manager.tryGet("present"));
    }
    assert(manager.remove("present"));

    auto stats = manager.getStats();
    assert(stats.hits == hits);
    assert(stats.misses == misses);
    assert(stats.sets == 1);
    assert(stats.deletes == 1);
    assert(stats.hitRate == 0.6);
    auto json = stats.toJson();
    assert(json["hits"] == hits);

    manager.resetStats();
    auto cleared = manager.getStats();
    assert(cleared.hits == 0 && cleared.misses == 0 && cleared.sets == 0 && cleared.deletes == 0);
    std::cout << "[OK] CacheManager statistics test\n";
}

void testCacheManagerConfiguration() {
    std::cout << "Testing CacheManager configuration errors...\n";
    bool thrown = false;
    try {
        CacheManager manager(testConfig("x"), nullptr);
    } catch (const CacheConfigError&) {
        thrown = true;
    }
    assert(thrown);

    auto config = testConfig("cfg");
    config.defaultTtl = std::chrono::seconds(120);
    CacheManager manager(config, std::make_shared<MemoryStore>());
    assert(manager.getConfiguration().defaultTtl.count() == 120);
    assert(manager.getConfiguration().keyPrefix == "cfg");
    std::cout << "[OK] CacheManager configuration test\n";
}

int main() {
    try {
        smokeTestCacheManager();
        testCacheManagerEmptyPrefix();
        testCacheManagerTtl();
        testCacheManagerRemember();
        testCacheManagerAddPull();
        testCacheManagerIncrement();
        testCacheManagerBackendFailure();
        testCacheManagerBatch();
        testCacheManagerJson();
        testCacheManagerStatistics();
        testCacheManagerConfiguration();

        spdlog::shutdown(); // Гарантируем запись всех логов
        std::cout << "All CacheManager tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
