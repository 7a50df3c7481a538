#ifndef SHARDAVAIL_UTIL_HASHING_HPP
#define SHARDAVAIL_UTIL_HASHING_HPP

#include <array>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/evp.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 helpers used for chunk identifiers, Merkle commitments and
 *        ownership weights.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * DESIGN:
 *   - Digests are kept as raw 32-byte arrays (Hash) so they can be compared,
 *     stored as SQLite blobs and concatenated for Merkle parents without
 *     re-encoding. Hex is only used for logs and configuration.
 *   - Multi-part input goes through an EVP context (Sha256Builder) so callers
 *     never have to concatenate buffers just to hash them.
 *
 * USAGE:
 *   @code
 *   using namespace shardavail::util::hashing;
 *
 *   Hash h = sha256(bytes);
 *   std::string shown = toHex(h);
 *   @endcode
 */

namespace shardavail {
namespace util {
namespace hashing {

using Hash = std::array<uint8_t, SHA256_DIGEST_LENGTH>;

/**
 * @brief Incremental SHA-256 over several buffers.
 * @throw std::runtime_error if OpenSSL fails.
 */
class Sha256Builder
{
public:
    Sha256Builder()
        : ctx_(EVP_MD_CTX_new())
    {
        if (ctx_ == nullptr) {
            throw std::runtime_error("hashing::Sha256Builder: Failed to create EVP_MD_CTX.");
        }
        if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("hashing::Sha256Builder: EVP_DigestInit_ex failed.");
        }
    }

    ~Sha256Builder()
    {
        EVP_MD_CTX_free(ctx_);
    }

    Sha256Builder(const Sha256Builder&) = delete;
    Sha256Builder& operator=(const Sha256Builder&) = delete;

    Sha256Builder& update(const uint8_t *data, size_t len)
    {
        if (len > 0 && EVP_DigestUpdate(ctx_, data, len) != 1) {
            throw std::runtime_error("hashing::Sha256Builder: EVP_DigestUpdate failed.");
        }
        return *this;
    }

    Sha256Builder& update(const std::vector<uint8_t> &data)
    {
        return update(data.data(), data.size());
    }

    Sha256Builder& update(const Hash &h)
    {
        return update(h.data(), h.size());
    }

    Sha256Builder& update(const std::string &s)
    {
        return update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    }

    /// Big-endian so the digest does not depend on the host byte order.
    Sha256Builder& updateU64(uint64_t v)
    {
        uint8_t buf[8];
        for (int i = 7; i >= 0; --i) {
            buf[i] = static_cast<uint8_t>(v & 0xFF);
            v >>= 8;
        }
        return update(buf, sizeof(buf));
    }

    Hash finish()
    {
        Hash out{};
        unsigned int outLen = 0;
        if (EVP_DigestFinal_ex(ctx_, out.data(), &outLen) != 1 || outLen != out.size()) {
            throw std::runtime_error("hashing::Sha256Builder: EVP_DigestFinal_ex failed.");
        }
        return out;
    }

private:
    EVP_MD_CTX *ctx_;
};

/**
 * @brief SHA-256 of a byte buffer.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline Hash sha256(const std::vector<uint8_t> &input)
{
    Hash out{};
    if (!SHA256(input.data(), input.size(), out.data())) {
        throw std::runtime_error("hashing::sha256: SHA256 computation failed.");
    }
    return out;
}

inline Hash sha256(const std::string &input)
{
    Hash out{};
    if (!SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), out.data())) {
        throw std::runtime_error("hashing::sha256: SHA256 computation failed.");
    }
    return out;
}

/**
 * @brief SHA-256(left || right), the Merkle parent rule.
 */
inline Hash hashPair(const Hash &left, const Hash &right)
{
    return Sha256Builder().update(left).update(right).finish();
}

inline std::string toHex(const uint8_t *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

inline std::string toHex(const Hash &h)
{
    return toHex(h.data(), h.size());
}

/**
 * @brief First 8 bytes in hex; enough to tell chunks apart in log lines.
 */
inline std::string shortHex(const Hash &h)
{
    return toHex(h.data(), 8);
}

/**
 * @brief Parse a 64-character hex digest.
 * @throw std::runtime_error on wrong length or non-hex characters.
 */
inline Hash hashFromHex(const std::string &hex)
{
    if (hex.size() != 2 * SHA256_DIGEST_LENGTH) {
        throw std::runtime_error("hashing::hashFromHex: expected 64 hex characters, got " +
                                 std::to_string(hex.size()));
    }
    auto nibble = [&hex](char c) -> uint8_t {
        if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
        throw std::runtime_error("hashing::hashFromHex: invalid hex digest '" + hex + "'");
    };
    Hash out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>((nibble(hex[2 * i]) << 4) | nibble(hex[2 * i + 1]));
    }
    return out;
}

} // namespace hashing
} // namespace util
} // namespace shardavail

#endif // SHARDAVAIL_UTIL_HASHING_HPP
