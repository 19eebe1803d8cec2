#pragma once

#include <memory>
#include <string>
#include <vector>
#include "tagcache/core/cache/CacheConfig.hpp"
#include "tagcache/core/cache/base/Store.hpp"

namespace tagcache {
namespace core {
namespace cache {

/**
 * @brief Store поверх нескольких Store с политикой fallback или replicate.
 *
 * fallback: get по порядку до первого попадания (сбой и промах ведут к следующему),
 * set/remove/clear только в primary.
 * replicate: set/remove/clear во все; результат определяет primary, сбои
 * остальных только логируются. get читает из первого ответившего без сбоя.
 * Согласованность между хранилищами не гарантируется.
 */
class CompositeStore : public Store {
public:
    // Бросает CacheConfigError для пустого списка или nullptr
    CompositeStore(std::vector<std::shared_ptr<Store>> stores, CompositePolicy policy);
    ~CompositeStore() override = default;

    std::optional<Bytes> get(const std::string& key) override;
    bool set(const std::string& key, const Bytes& value, std::chrono::seconds ttl) override;
    bool remove(const std::string& key) override;
    bool clear() override;
    std::string name() const override;

    CompositePolicy policy() const { return policy_; }
    size_t storeCount() const { return stores_.size(); }
private:
    template<typename Op>
    bool applyWrite(const char* opName, Op&& op);
    std::vector<std::shared_ptr<Store>> stores_;
    CompositePolicy policy_;
};

} // namespace cache
} // namespace core
} // namespace tagcache
