#include "tagcache/core/cache/store/FileStore.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include "tagcache/core/cache/CacheLogger.hpp"
#include "tagcache/core/cache/Hashing.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <fstream>
#include <iterator>
#include <mutex>

namespace tagcache {
namespace core {
namespace cache {

namespace {

constexpr const char* ENTRY_EXTENSION = ".cache";

std::atomic<uint64_t> tmpCounter{0};

enum class ReadOutcome { Missing, Corrupt, Expired, Live };

// Чтение записи без блокировок; вызывающий держит mutex_
ReadOutcome readEntry(const std::filesystem::path& path, const std::string& key, int64_t now, Bytes& value) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw StoreError("FileStore: cannot stat " + path.string() + ": " + ec.message());
        }
        return ReadOutcome::Missing;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw StoreError("FileStore: cannot open " + path.string());
    }
    std::vector<uint8_t> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    try {
        auto j = nlohmann::json::from_cbor(raw);
        if (j.at("k").get<std::string>() != key) {
            // Коллизия имени файла: чужая запись
            return ReadOutcome::Missing;
        }
        auto expiresAt = j.at("e").get<int64_t>();
        const auto& binary = j.at("v").get_binary();
        value.assign(binary.begin(), binary.end());
        return (expiresAt != 0 && expiresAt <= now) ? ReadOutcome::Expired : ReadOutcome::Live;
    } catch (const nlohmann::json::exception& e) {
        if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
            logger->warn("FileStore: повреждённая запись для ключа '{}': {}", key, e.what());
        }
        return ReadOutcome::Corrupt;
    }
}

} // namespace

FileStore::FileStore(const std::string& directory, std::shared_ptr<Clock> clock)
    : directory_(directory), clock_(clock ? std::move(clock) : defaultClock()) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        // Не фатально: операции будут завершаться StoreError
        if (auto logger = spdlog::get(CACHE_LOGGER_NAME)) {
            logger->warn("FileStore: не удалось создать каталог '{}': {}", directory_.string(), ec.message());
        }
    } else {
        spdlog::debug("FileStore: каталог '{}'", directory_.string());
    }
}

std::filesystem::path FileStore::pathFor(const std::string& key) const {
    return directory_ / (sha256Hex(key) + ENTRY_EXTENSION);
}

void FileStore::removeFile(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        throw StoreError("FileStore: cannot remove " + path.string() + ": " + ec.message());
    }
}

std::optional<Bytes> FileStore::get(const std::string& key) {
    auto path = pathFor(key);
    Bytes value;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto outcome = readEntry(path, key, clock_->now(), value);
        if (outcome == ReadOutcome::Live) {
            return value;
        }
        if (outcome == ReadOutcome::Missing) {
            return std::nullopt;
        }
    }
    // Истёкшая или повреждённая запись: перепроверяем под эксклюзивной блокировкой и удаляем
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto outcome = readEntry(path, key, clock_->now(), value);
    if (outcome == ReadOutcome::Live) {
        return value;
    }
    if (outcome != ReadOutcome::Missing) {
        removeFile(path);
    }
    return std::nullopt;
}

bool FileStore::set(const std::string& key, const Bytes& value, std::chrono::seconds ttl) {
    int64_t expiresAt = ttl.count() > 0 ? clock_->now() + ttl.count() : 0;
    nlohmann::json j = {
        {"k", key},
        {"v", nlohmann::json::binary(value)},
        {"e", expiresAt}
    };
    auto encoded = nlohmann::json::to_cbor(j);
    auto path = pathFor(key);
    auto tmpPath = path;
    tmpPath += ".tmp" + std::to_string(tmpCounter.fetch_add(1));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    {
        std::ofstream file(tmpPath, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw StoreError("FileStore: cannot open " + tmpPath.string() + " for writing");
        }
        file.write(reinterpret_cast<const char*>(encoded.data()), static_cast<std::streamsize>(encoded.size()));
        if (!file) {
            throw StoreError("FileStore: write failed for " + tmpPath.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmpPath, ignored);
        throw StoreError("FileStore: cannot rename into " + path.string() + ": " + ec.message());
    }
    return true;
}

bool FileStore::remove(const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    removeFile(pathFor(key));
    return true;
}

bool FileStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        throw StoreError("FileStore: cannot list " + directory_.string() + ": " + ec.message());
    }
    std::vector<std::filesystem::path> victims;
    for (const auto& item : it) {
        if (item.path().extension() == ENTRY_EXTENSION) {
            victims.push_back(item.path());
        }
    }
    for (const auto& path : victims) {
        removeFile(path);
    }
    spdlog::debug("FileStore: удалено {} файлов из '{}'", victims.size(), directory_.string());
    return true;
}

size_t FileStore::fileCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::directory_iterator it(directory_, ec);
    if (ec) {
        return 0;
    }
    size_t count = 0;
    for (const auto& item : it) {
        if (item.path().extension() == ENTRY_EXTENSION) {
            ++count;
        }
    }
    return count;
}

} // namespace cache
} // namespace core
} // namespace tagcache
