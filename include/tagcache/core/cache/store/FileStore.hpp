#pragma once

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include "tagcache/core/cache/Clock.hpp"
#include "tagcache/core/cache/base/Store.hpp"

namespace tagcache {
namespace core {
namespace cache {

/**
 * @brief Хранилище "один файл на ключ" в каталоге.
 *
 * Имя файла: sha256(key) + ".cache", содержимое: CBOR-объект
 * {"k": ключ, "v": значение, "e": expiresAt}. Запись идёт во временный файл с
 * последующим rename. Повреждённый файл считается промахом и удаляется.
 * Атомарного инкремента нет: CacheManager эмулирует его.
 */
class FileStore : public Store {
public:
    explicit FileStore(const std::string& directory, std::shared_ptr<Clock> clock = defaultClock());
    ~FileStore() override = default;

    std::optional<Bytes> get(const std::string& key) override;
    bool set(const std::string& key, const Bytes& value, std::chrono::seconds ttl) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    std::string name() const override { return "file"; }

    const std::filesystem::path& directory() const { return directory_; }
    size_t fileCount() const; // Кол-во файлов записей в каталоге
private:
    std::filesystem::path pathFor(const std::string& key) const;
    void removeFile(const std::filesystem::path& path);
    std::filesystem::path directory_;
    std::shared_ptr<Clock> clock_;
    mutable std::shared_mutex mutex_;
};

} // namespace cache
} // namespace core
} // namespace tagcache
