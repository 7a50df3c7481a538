#ifndef SHARDAVAIL_UTIL_BYTE_IO_HPP
#define SHARDAVAIL_UTIL_BYTE_IO_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "util/hashing.hpp"

/**
 * @file byte_io.hpp
 * @brief Big-endian, length-prefixed binary encoding used by the part store
 *        and the wire messages.
 *
 * Layout rules:
 *   - integers are fixed width, most significant byte first
 *   - byte strings are a uint32 length followed by the bytes
 *   - hashes are written raw (32 bytes, no prefix)
 *
 * ByteReader throws std::runtime_error on truncated input or on a length
 * prefix larger than the caller's limit, so a malformed peer message can never
 * trigger a huge allocation.
 */

namespace shardavail {
namespace util {

class ByteWriter
{
public:
    void writeU32(uint32_t v)
    {
        out_.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
        out_.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
        out_.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
        out_.push_back(static_cast<uint8_t>(v & 0xFF));
    }

    void writeU64(uint64_t v)
    {
        writeU32(static_cast<uint32_t>(v >> 32));
        writeU32(static_cast<uint32_t>(v & 0xFFFFFFFFu));
    }

    void writeHash(const hashing::Hash &h)
    {
        out_.insert(out_.end(), h.begin(), h.end());
    }

    void writeBytes(const std::vector<uint8_t> &bytes)
    {
        writeU32(static_cast<uint32_t>(bytes.size()));
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void writeString(const std::string &s)
    {
        writeU32(static_cast<uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

    const std::vector<uint8_t>& data() const { return out_; }
    std::vector<uint8_t> take() { return std::move(out_); }

private:
    std::vector<uint8_t> out_;
};

class ByteReader
{
public:
    explicit ByteReader(const std::vector<uint8_t> &in, const char *context = "ByteReader")
        : in_(in), pos_(0), context_(context)
    {
    }

    uint32_t readU32()
    {
        require(4);
        uint32_t v = (static_cast<uint32_t>(in_[pos_ + 0]) << 24) |
                     (static_cast<uint32_t>(in_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(in_[pos_ + 2]) << 8) |
                     (static_cast<uint32_t>(in_[pos_ + 3]) << 0);
        pos_ += 4;
        return v;
    }

    uint64_t readU64()
    {
        uint64_t hi = readU32();
        uint64_t lo = readU32();
        return (hi << 32) | lo;
    }

    hashing::Hash readHash()
    {
        require(hashing::Hash().size());
        hashing::Hash h{};
        std::copy(in_.begin() + static_cast<long>(pos_),
                  in_.begin() + static_cast<long>(pos_ + h.size()), h.begin());
        pos_ += h.size();
        return h;
    }

    std::vector<uint8_t> readBytes(uint32_t maxLen)
    {
        uint32_t len = readU32();
        if (len > maxLen) {
            throw std::runtime_error(std::string(context_) + ": length prefix " +
                                     std::to_string(len) + " exceeds limit " +
                                     std::to_string(maxLen));
        }
        require(len);
        std::vector<uint8_t> out(in_.begin() + static_cast<long>(pos_),
                                 in_.begin() + static_cast<long>(pos_ + len));
        pos_ += len;
        return out;
    }

    std::string readString(uint32_t maxLen)
    {
        std::vector<uint8_t> raw = readBytes(maxLen);
        return std::string(raw.begin(), raw.end());
    }

    bool atEnd() const { return pos_ == in_.size(); }

    /// Trailing garbage after a complete record is treated as corruption.
    void expectEnd() const
    {
        if (!atEnd()) {
            throw std::runtime_error(std::string(context_) + ": " +
                                     std::to_string(in_.size() - pos_) + " trailing bytes");
        }
    }

private:
    void require(size_t n) const
    {
        if (pos_ + n > in_.size()) {
            throw std::runtime_error(std::string(context_) + ": truncated input");
        }
    }

    const std::vector<uint8_t> &in_;
    size_t pos_;
    const char *context_;
};

} // namespace util
} // namespace shardavail

#endif // SHARDAVAIL_UTIL_BYTE_IO_HPP
