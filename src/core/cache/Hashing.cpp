#include "tagcache/core/cache/Hashing.hpp"
#include "tagcache/core/cache/CacheErrors.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace tagcache {
namespace core {
namespace cache {

namespace {

std::string toHex(const unsigned char* data, size_t size) {
    std::stringstream ss;
    for (size_t i = 0; i < size; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

} // namespace

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

std::string randomToken() {
    unsigned char buffer[16];
    if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
        throw StoreError("RAND_bytes failed to generate tag version token");
    }
    return toHex(buffer, sizeof(buffer));
}

} // namespace cache
} // namespace core
} // namespace tagcache
