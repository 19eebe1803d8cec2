#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tagcache {
namespace core {
namespace cache {

using Bytes = std::vector<uint8_t>;

// Бессрочное хранение
constexpr std::chrono::seconds TTL_FOREVER{0};

// CacheEntry: значение и абсолютный момент истечения (unix-секунды, 0 = никогда)
struct CacheEntry {
    Bytes value;
    int64_t expiresAt = 0;

    bool isExpired(int64_t now) const { return expiresAt != 0 && expiresAt <= now; }
};

/**
 * @brief Единый контракт blob-хранилища.
 *
 * Все операции потокобезопасны. TTL задаётся длительностью и переводится
 * реализацией в абсолютное время истечения; TTL_FOREVER означает бессрочно.
 * Сбой ввода-вывода сообщается исключением StoreError, промах пустым optional.
 * Истёкшая запись при чтении считается промахом и удаляется.
 */
class Store {
public:
    virtual ~Store() = default;
    /// Получить значение по ключу.
    virtual std::optional<Bytes> get(const std::string& key) = 0;
    /// Сохранить значение с TTL.
    virtual bool set(const std::string& key, const Bytes& value, std::chrono::seconds ttl) = 0;
    /// Удалить значение. true, если запись была удалена или отсутствовала.
    virtual bool remove(const std::string& key) = 0;
    /// Очистить хранилище полностью.
    virtual bool clear() = 0;
    /// Проверить наличие живой записи.
    virtual bool has(const std::string& key) { return get(key).has_value(); }

    // Пакетные операции; по умолчанию поэлементно
    virtual std::unordered_map<std::string, Bytes> getMultiple(const std::vector<std::string>& keys);
    virtual bool setMultiple(const std::unordered_map<std::string, Bytes>& values, std::chrono::seconds ttl);
    virtual bool removeMultiple(const std::vector<std::string>& keys);

    virtual std::string name() const = 0; // Имя для логов
};

/**
 * @brief Необязательная возможность атомарного инкремента.
 *
 * Store реализует этот интерфейс дополнительно, если backend умеет атомарно
 * изменять счётчик. Значение хранится десятичной строкой. Отсутствующий ключ
 * считается нулём; нечисловое значение даёт nullopt.
 */
class AtomicCounter {
public:
    virtual ~AtomicCounter() = default;
    virtual std::optional<int64_t> increment(const std::string& key, int64_t delta) = 0;
};

// Кодирование счётчика в байты и обратно
Bytes encodeCounter(int64_t value);
std::optional<int64_t> decodeCounter(const Bytes& bytes);
// value + delta или nullopt при переполнении int64_t
std::optional<int64_t> addCounter(int64_t value, int64_t delta);

} // namespace cache
} // namespace core
} // namespace tagcache
