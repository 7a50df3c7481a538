#include "erasure/chunk_codec.hpp"
#include "core/chunk_error.hpp"
#include "erasure/reed_solomon.hpp"
#include "merkle/merkle_tree.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <cstring>
#include <map>
#include <string>

namespace shardavail {
namespace erasure {

using core::ChunkError;
using core::ChunkErrorKind;
using core::ChunkHash;
using core::ChunkHeader;
using core::EncodedChunk;
using core::PartialEncodedPart;

core::EncodedChunk ChunkCodec::encode(const std::vector<uint8_t> &payload,
                                      uint32_t dataParts,
                                      uint32_t totalParts,
                                      uint64_t height,
                                      uint32_t shardId,
                                      const core::ChunkHash &prevBlockHash)
{
    ChunkHeader header;
    header.height = height;
    header.shardId = shardId;
    header.prevBlockHash = prevBlockHash;
    header.payloadLength = payload.size();
    header.dataParts = dataParts;
    header.totalParts = totalParts;
    header.validate();

    const size_t partSize = static_cast<size_t>(header.partSize());

    std::vector<Shard> dataShards(dataParts, Shard(partSize, 0));
    size_t offset = 0;
    for (uint32_t i = 0; i < dataParts && offset < payload.size(); ++i) {
        size_t n = std::min(partSize, payload.size() - offset);
        std::memcpy(dataShards[i].data(), payload.data() + offset, n);
        offset += n;
    }

    ReedSolomon rs(dataParts, totalParts);
    std::vector<Shard> shards = rs.encode(dataShards);

    std::vector<merkle::Hash> leaves;
    leaves.reserve(shards.size());
    for (const auto &s : shards) {
        leaves.push_back(merkle::leafHash(s));
    }
    merkle::MerkleTree tree = merkle::buildMerkleTree(leaves);
    header.partsRoot = tree.root;

    EncodedChunk out;
    out.header = header;
    const ChunkHash chunkHash = header.chunkHash();
    out.parts.reserve(shards.size());
    for (uint32_t ord = 0; ord < totalParts; ++ord) {
        PartialEncodedPart part;
        part.chunkHash = chunkHash;
        part.partOrd = ord;
        part.bytes = std::move(shards[ord]);
        part.merkleProof = tree.proofFor(ord);
        out.parts.push_back(std::move(part));
    }

    util::logger::debug("[ChunkCodec] Encoded chunk " + util::hashing::shortHex(chunkHash) +
                        " (" + std::to_string(payload.size()) + " bytes) into " +
                        std::to_string(totalParts) + " parts, " + std::to_string(dataParts) +
                        " needed");
    return out;
}

bool ChunkCodec::verifyPart(const ChunkHeader &header, const PartialEncodedPart &part)
{
    return verifyPart(header, header.chunkHash(), part);
}

bool ChunkCodec::verifyPart(const ChunkHeader &header, const ChunkHash &chunkHash,
                            const PartialEncodedPart &part)
{
    if (part.chunkHash != chunkHash) {
        return false;
    }
    if (part.partOrd >= header.totalParts) {
        return false;
    }
    if (part.bytes.size() != header.partSize()) {
        return false;
    }
    return merkle::verifyMerklePath(header.partsRoot, merkle::leafHash(part.bytes), part.partOrd,
                                    header.totalParts, part.merkleProof);
}

std::vector<uint8_t> ChunkCodec::decode(const ChunkHeader &header,
                                        const std::vector<PartialEncodedPart> &parts)
{
    const ChunkHash chunkHash = header.chunkHash();

    for (const auto &part : parts) {
        if (!verifyPart(header, chunkHash, part)) {
            throw ChunkError(ChunkErrorKind::CorruptPart,
                             "part " + std::to_string(part.partOrd) + " of chunk " +
                             util::hashing::shortHex(chunkHash) + " failed verification");
        }
    }

    std::map<uint32_t, Shard> distinct;
    for (const auto &part : parts) {
        distinct.emplace(part.partOrd, part.bytes);
    }
    if (distinct.size() < header.dataParts) {
        throw ChunkError(ChunkErrorKind::InsufficientParts,
                         "chunk " + util::hashing::shortHex(chunkHash) + " has " +
                         std::to_string(distinct.size()) + " distinct parts, needs " +
                         std::to_string(header.dataParts));
    }

    ReedSolomon rs(header.dataParts, header.totalParts);
    std::vector<Shard> data = rs.reconstructData(distinct);

    std::vector<uint8_t> payload;
    payload.reserve(static_cast<size_t>(header.payloadLength));
    for (const auto &shard : data) {
        size_t remaining = static_cast<size_t>(header.payloadLength) - payload.size();
        if (remaining == 0) {
            break;
        }
        size_t n = std::min(remaining, shard.size());
        payload.insert(payload.end(), shard.begin(), shard.begin() + static_cast<long>(n));
    }
    return payload;
}

} // namespace erasure
} // namespace shardavail
