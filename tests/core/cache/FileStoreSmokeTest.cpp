#include <cassert>
#include <iostream>
#include <memory>
#include <chrono>
#include <filesystem>
#include <fstream>
#include "tagcache/core/cache/Clock.hpp"
#include "tagcache/core/cache/Hashing.hpp"
#include "tagcache/core/cache/store/FileStore.hpp"
#include "TestStores.hpp"

#include <spdlog/spdlog.h>

using namespace tagcache::core::cache;
using tagcache::testing::bytes;
using tagcache::testing::text;

namespace {

std::string freshDirectory(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("tagcache_test_" + name);
    std::filesystem::remove_all(dir);
    return dir.string();
}

} // namespace

void testFileStoreRoundTrip() {
    std::cout << "Testing FileStore set/get...\n";
    auto dir = freshDirectory("roundtrip");
    auto clock = std::make_shared<ManualClock>();

    {
        FileStore store(dir, clock);
        Bytes binary = {0, 1, 2, 255, 0, 7};
        assert(store.set("blob", binary, std::chrono::seconds(60)));
        assert(store.set("user:1", bytes("{\"name\":\"Alice\"}"), TTL_FOREVER));
        auto value = store.get("blob");
        assert(value && *value == binary);
        assert(store.fileCount() == 2);
        assert(!store.get("missing"));
    }
    // Данные переживают пересоздание хранилища
    FileStore reopened(dir, clock);
    auto value = reopened.get("user:1");
    assert(value && text(*value) == "{\"name\":\"Alice\"}");

    assert(reopened.remove("user:1"));
    assert(!reopened.has("user:1"));
    assert(reopened.fileCount() == 1);
    std::filesystem::remove_all(dir);
    std::cout << "[OK] FileStore round trip test\n";
}

void testFileStoreExpiry() {
    std::cout << "Testing FileStore TTL...\n";
    auto dir = freshDirectory("expiry");
    auto clock = std::make_shared<ManualClock>();
    FileStore store(dir, clock);

    assert(store.set("short", bytes("v"), std::chrono::seconds(1)));
    assert(store.set("forever", bytes("f"), TTL_FOREVER));
    clock->advance(std::chrono::seconds(2));

    assert(!store.get("short"));
    // Истёкший файл удалён при чтении
    assert(store.fileCount() == 1);

    clock->advance(std::chrono::seconds(10000));
    assert(store.get("forever"));
    std::filesystem::remove_all(dir);
    std::cout << "[OK] FileStore expiry test\n";
}

void testFileStoreCorruptEntry() {
    std::cout << "Testing FileStore corrupt entry handling...\n";
    auto dir = freshDirectory("corrupt");
    FileStore store(dir, std::make_shared<ManualClock>());

    assert(store.set("victim", bytes("ok"), TTL_FOREVER));
    auto path = std::filesystem::path(dir) / (sha256Hex("victim") + ".cache");
    assert(std::filesystem::exists(path));
    {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file << "not cbor at all";
    }
    assert(!store.get("victim"));
    assert(!std::filesystem::exists(path));
    std::filesystem::remove_all(dir);
    std::cout << "[OK] FileStore corrupt entry test\n";
}

void testFileStoreClear() {
    std::cout << "Testing FileStore clear...\n";
    auto dir = freshDirectory("clear");
    FileStore store(dir, std::make_shared<ManualClock>());
    for (int i = 0; i < 5; ++i) {
        assert(store.set("key_" + std::to_string(i), bytes("v"), TTL_FOREVER));
    }
    // Посторонний файл не трогаем
    {
        std::ofstream other(std::filesystem::path(dir) / "README.txt");
        other << "keep";
    }
    assert(store.fileCount() == 5);
    assert(store.clear());
    assert(store.fileCount() == 0);
    assert(std::filesystem::exists(std::filesystem::path(dir) / "README.txt"));
    std::filesystem::remove_all(dir);
    std::cout << "[OK] FileStore clear test\n";
}

void testFileStoreUnavailableDirectory() {
    std::cout << "Testing FileStore with unusable directory...\n";
    auto dir = freshDirectory("blocked");
    // Каталог занят обычным файлом: все операции должны давать StoreError
    {
        std::ofstream blocker(dir);
        blocker << "x";
    }
    FileStore store(dir + "/nested", std::make_shared<ManualClock>());
    bool thrown = false;
    try {
        store.set("k", bytes("v"), TTL_FOREVER);
    } catch (const StoreError&) {
        thrown = true;
    }
    assert(thrown);
    std::filesystem::remove_all(dir);
    std::cout << "[OK] FileStore unavailable directory test\n";
}

int main() {
    try {
        testFileStoreRoundTrip();
        testFileStoreExpiry();
        testFileStoreCorruptEntry();
        testFileStoreClear();
        testFileStoreUnavailableDirectory();

        spdlog::shutdown();
        std::cout << "All FileStore tests passed!\n";
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
