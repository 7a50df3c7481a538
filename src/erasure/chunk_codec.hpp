#ifndef SHARDAVAIL_ERASURE_CHUNK_CODEC_HPP
#define SHARDAVAIL_ERASURE_CHUNK_CODEC_HPP

#include <cstdint>
#include <vector>
#include "core/chunk_types.hpp"

namespace shardavail {
namespace erasure {

/*
  ChunkCodec
  --------------------------------
  Turns a chunk payload into verifiable erasure-coded parts and back.

  Required Methods:
    EncodedChunk encode(payload, dataParts, totalParts, height, shardId, prevBlockHash)
    bool verifyPart(const ChunkHeader &header, const PartialEncodedPart &part)
    std::vector<uint8_t> decode(const ChunkHeader &header, const std::vector<PartialEncodedPart> &parts)

  encode:
   - pads the payload with zeros to dataParts * partSize and splits it into
     dataParts equal shards, then appends totalParts - dataParts parity shards
   - builds the Merkle tree over SHA-256 of every shard and fills the header
     (partsRoot, payloadLength, erasure parameters)
   - every part carries its own Merkle path; encode is deterministic, so any
     node re-running it on the same payload gets bit-identical parts

  decode:
   - every supplied part is verified against the header first; one bad part
     fails the whole call with CorruptPart before any arithmetic happens
   - repeated indices count once
   - fewer than dataParts distinct indices -> InsufficientParts
   - otherwise the payload is rebuilt and cut back to payloadLength; the
     result does not depend on which subset was supplied
*/

class ChunkCodec
{
public:
    static core::EncodedChunk encode(const std::vector<uint8_t> &payload,
                                     uint32_t dataParts,
                                     uint32_t totalParts,
                                     uint64_t height = 0,
                                     uint32_t shardId = 0,
                                     const core::ChunkHash &prevBlockHash = core::ChunkHash{});

    /**
     * @brief True iff the part names this chunk, its index is in range, its
     *        length matches the header and its Merkle path reaches partsRoot.
     */
    static bool verifyPart(const core::ChunkHeader &header, const core::PartialEncodedPart &part);

    /**
     * @brief Same as above with the chunk hash precomputed by the caller.
     */
    static bool verifyPart(const core::ChunkHeader &header, const core::ChunkHash &chunkHash,
                           const core::PartialEncodedPart &part);

    /**
     * @throw core::ChunkError(CorruptPart) if any supplied part fails verification.
     * @throw core::ChunkError(InsufficientParts) with fewer than dataParts distinct parts.
     */
    static std::vector<uint8_t> decode(const core::ChunkHeader &header,
                                       const std::vector<core::PartialEncodedPart> &parts);
};

} // namespace erasure
} // namespace shardavail

#endif // SHARDAVAIL_ERASURE_CHUNK_CODEC_HPP
