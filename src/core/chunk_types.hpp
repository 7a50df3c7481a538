#ifndef SHARDAVAIL_CORE_CHUNK_TYPES_HPP
#define SHARDAVAIL_CORE_CHUNK_TYPES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "util/byte_io.hpp"
#include "util/hashing.hpp"

/**
 * @file chunk_types.hpp
 * @brief Chunk header, erasure-coded part and their canonical binary encodings.
 *
 * A chunk is one shard's data for one block height. The producer erasure-codes
 * its payload into totalParts parts and commits to them with a Merkle root that
 * is part of the header; the header hash is the chunk identifier every node uses
 * to name the chunk.
 *
 * Encodings are big-endian and length-prefixed (see util/byte_io.hpp). The same
 * bytes are written to the part store and sent on the wire, so a part served
 * after a restart is bit-identical to the one originally produced.
 */

namespace shardavail {
namespace core {

using ChunkHash = util::hashing::Hash;
using PartOrd = uint32_t;

/// GF(2^8) Reed-Solomon can address at most 255 distinct parts.
constexpr uint32_t kMaxTotalParts = 255;
/// Guards decoders against absurd length prefixes from peers.
constexpr uint32_t kMaxPartBytes = 64u * 1024 * 1024;
/// ceil(log2(255)) levels is the deepest valid proof; leave headroom.
constexpr uint32_t kMaxProofLength = 16;

/**
 * @struct ChunkHeader
 * @brief Metadata committing to a chunk's encoding.
 *
 * Fields:
 *   - height, shardId, prevBlockHash: where the chunk sits in the chain
 *   - payloadLength: original payload size before padding
 *   - dataParts: parts needed to reconstruct (dataParts <= totalParts)
 *   - totalParts: parts produced
 *   - partsRoot: Merkle root over the hashes of all parts, in index order
 */
struct ChunkHeader
{
    uint64_t  height{0};
    uint32_t  shardId{0};
    ChunkHash prevBlockHash{};
    uint64_t  payloadLength{0};
    uint32_t  dataParts{0};
    uint32_t  totalParts{0};
    ChunkHash partsRoot{};

    /**
     * @brief Canonical encoding; chunkHash() is the SHA-256 of exactly these bytes.
     */
    std::vector<uint8_t> serialize() const
    {
        util::ByteWriter w;
        w.writeU64(height);
        w.writeU32(shardId);
        w.writeHash(prevBlockHash);
        w.writeU64(payloadLength);
        w.writeU32(dataParts);
        w.writeU32(totalParts);
        w.writeHash(partsRoot);
        return w.take();
    }

    /**
     * @throw std::runtime_error on malformed input.
     */
    static ChunkHeader deserialize(const std::vector<uint8_t> &bytes)
    {
        util::ByteReader r(bytes, "ChunkHeader");
        ChunkHeader h;
        h.height        = r.readU64();
        h.shardId       = r.readU32();
        h.prevBlockHash = r.readHash();
        h.payloadLength = r.readU64();
        h.dataParts     = r.readU32();
        h.totalParts    = r.readU32();
        h.partsRoot     = r.readHash();
        r.expectEnd();
        return h;
    }

    /**
     * @brief The ChunkIdentifier.
     */
    ChunkHash chunkHash() const
    {
        return util::hashing::sha256(serialize());
    }

    /**
     * @brief Size of every part's byte string: ceil(payloadLength / dataParts),
     *        at least one byte so an empty payload still yields addressable parts.
     */
    uint64_t partSize() const
    {
        if (dataParts == 0) {
            return 0;
        }
        uint64_t size = payloadLength / dataParts + (payloadLength % dataParts != 0 ? 1 : 0);
        return size == 0 ? 1 : size;
    }

    /**
     * @throw std::invalid_argument if the erasure parameters are unusable.
     */
    void validate() const
    {
        if (dataParts == 0) {
            throw std::invalid_argument("ChunkHeader: dataParts must be positive");
        }
        if (dataParts > totalParts) {
            throw std::invalid_argument("ChunkHeader: dataParts (" + std::to_string(dataParts) +
                                        ") exceeds totalParts (" + std::to_string(totalParts) + ")");
        }
        if (totalParts > kMaxTotalParts) {
            throw std::invalid_argument("ChunkHeader: totalParts " + std::to_string(totalParts) +
                                        " exceeds " + std::to_string(kMaxTotalParts));
        }
        if (payloadLength > static_cast<uint64_t>(dataParts) * kMaxPartBytes) {
            throw std::invalid_argument("ChunkHeader: payloadLength " + std::to_string(payloadLength) +
                                        " exceeds " + std::to_string(dataParts) + " parts of " +
                                        std::to_string(kMaxPartBytes) + " bytes");
        }
        if (partSize() > kMaxPartBytes) {
            throw std::invalid_argument("ChunkHeader: part size exceeds limit");
        }
    }

    bool operator==(const ChunkHeader &o) const
    {
        return height == o.height && shardId == o.shardId && prevBlockHash == o.prevBlockHash &&
               payloadLength == o.payloadLength && dataParts == o.dataParts &&
               totalParts == o.totalParts && partsRoot == o.partsRoot;
    }
    bool operator!=(const ChunkHeader &o) const { return !(*this == o); }
};

/**
 * @struct PartialEncodedPart
 * @brief One erasure-coded fragment of a chunk plus the Merkle path proving it
 *        belongs under the header's partsRoot. Immutable once produced.
 */
struct PartialEncodedPart
{
    ChunkHash chunkHash{};
    PartOrd   partOrd{0};
    std::vector<uint8_t> bytes;
    std::vector<util::hashing::Hash> merkleProof;

    std::vector<uint8_t> serialize() const
    {
        util::ByteWriter w;
        writeTo(w);
        return w.take();
    }

    static PartialEncodedPart deserialize(const std::vector<uint8_t> &data)
    {
        util::ByteReader r(data, "PartialEncodedPart");
        PartialEncodedPart p = readFrom(r);
        r.expectEnd();
        return p;
    }

    /**
     * @brief Read one part from a larger record (e.g. a response carrying several parts).
     */
    static PartialEncodedPart readFrom(util::ByteReader &r)
    {
        PartialEncodedPart p;
        p.chunkHash = r.readHash();
        p.partOrd   = r.readU32();
        p.bytes     = r.readBytes(kMaxPartBytes);
        uint32_t proofLen = r.readU32();
        if (proofLen > kMaxProofLength) {
            throw std::runtime_error("PartialEncodedPart: proof length " +
                                     std::to_string(proofLen) + " exceeds limit");
        }
        p.merkleProof.reserve(proofLen);
        for (uint32_t i = 0; i < proofLen; ++i) {
            p.merkleProof.push_back(r.readHash());
        }
        return p;
    }

    void writeTo(util::ByteWriter &w) const
    {
        w.writeHash(chunkHash);
        w.writeU32(partOrd);
        w.writeBytes(bytes);
        w.writeU32(static_cast<uint32_t>(merkleProof.size()));
        for (const auto &h : merkleProof) {
            w.writeHash(h);
        }
    }

    /**
     * @brief Bit-identity, the only equality the store accepts for a repeated put.
     */
    bool sameContent(const PartialEncodedPart &o) const
    {
        return chunkHash == o.chunkHash && partOrd == o.partOrd && bytes == o.bytes &&
               merkleProof == o.merkleProof;
    }
};

/**
 * @struct EncodedChunk
 * @brief Codec output: the header plus every part in index order.
 */
struct EncodedChunk
{
    ChunkHeader header;
    std::vector<PartialEncodedPart> parts;
};

} // namespace core
} // namespace shardavail

#endif // SHARDAVAIL_CORE_CHUNK_TYPES_HPP
