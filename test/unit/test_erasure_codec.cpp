#include <cstdint>
#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <vector>

#include "core/chunk_error.hpp"
#include "erasure/chunk_codec.hpp"
#include "erasure/galois_field.hpp"
#include "erasure/reed_solomon.hpp"
#include "test_helpers.hpp"

namespace {

using shardavail::core::ChunkError;
using shardavail::core::ChunkErrorKind;
using shardavail::core::PartialEncodedPart;
using shardavail::erasure::ChunkCodec;
using shardavail::erasure::GF256;
using shardavail::erasure::ReedSolomon;
using shardavail::test::makePayload;

ChunkErrorKind decodeErrorKind(const shardavail::core::ChunkHeader &header,
                               const std::vector<PartialEncodedPart> &parts)
{
    try {
        ChunkCodec::decode(header, parts);
    } catch (const ChunkError &e) {
        return e.kind();
    }
    ADD_FAILURE() << "decode did not throw";
    return ChunkErrorKind::RequestAbandoned;
}

TEST(GaloisFieldTest, MultiplicativeInverse) {
    for (unsigned a = 1; a < 256; ++a) {
        uint8_t x = static_cast<uint8_t>(a);
        EXPECT_EQ(GF256::mul(x, GF256::inv(x)), 1) << "a=" << a;
        EXPECT_EQ(GF256::div(GF256::mul(x, 0x53), 0x53), x);
    }
    EXPECT_EQ(GF256::mul(0, 0x9c), 0);
    EXPECT_EQ(GF256::pow(0, 0), 1);
    EXPECT_EQ(GF256::pow(2, 8), 0x1d);
    EXPECT_THROW(GF256::div(5, 0), std::domain_error);
}

TEST(ReedSolomonTest, SystematicAndAnyKRowsInvertible) {
    ReedSolomon rs(3, 7);
    const auto &g = rs.generator();
    for (uint32_t r = 0; r < 3; ++r) {
        for (uint32_t c = 0; c < 3; ++c) {
            EXPECT_EQ(g[r][c], r == c ? 1 : 0);
        }
    }
    EXPECT_EQ(rs.parityShards(), 4u);
}

TEST(ReedSolomonTest, RejectsBadParameters) {
    EXPECT_THROW(ReedSolomon(0, 4), std::invalid_argument);
    EXPECT_THROW(ReedSolomon(5, 4), std::invalid_argument);
    EXPECT_THROW(ReedSolomon(2, 256), std::invalid_argument);
}

TEST(ChunkCodecTest, EncodeIsDeterministic) {
    auto payload = makePayload(1000);
    auto a = ChunkCodec::encode(payload, 4, 10, 12, 3);
    auto b = ChunkCodec::encode(payload, 4, 10, 12, 3);
    EXPECT_EQ(a.header, b.header);
    ASSERT_EQ(a.parts.size(), 10u);
    for (size_t i = 0; i < a.parts.size(); ++i) {
        EXPECT_TRUE(a.parts[i].sameContent(b.parts[i]));
    }
    EXPECT_EQ(a.header.payloadLength, 1000u);
    EXPECT_EQ(a.header.partSize(), 250u);
}

TEST(ChunkCodecTest, FirstDataPartsRoundTrip) {
    for (size_t size : {0u, 1u, 5u, 999u, 4096u}) {
        auto payload = makePayload(size, static_cast<uint32_t>(size));
        auto enc = ChunkCodec::encode(payload, 3, 8);
        std::vector<PartialEncodedPart> first(enc.parts.begin(), enc.parts.begin() + 3);
        EXPECT_EQ(ChunkCodec::decode(enc.header, first), payload) << "size=" << size;
    }
}

TEST(ChunkCodecTest, EverySubsetOfDataPartsReconstructs) {
    auto payload = makePayload(777);
    auto enc = ChunkCodec::encode(payload, 2, 6);
    for (uint32_t i = 0; i < 6; ++i) {
        for (uint32_t j = i + 1; j < 6; ++j) {
            std::vector<PartialEncodedPart> subset{enc.parts[j], enc.parts[i]};
            EXPECT_EQ(ChunkCodec::decode(enc.header, subset), payload) << i << "," << j;
        }
    }

    auto enc3 = ChunkCodec::encode(payload, 3, 5);
    for (uint32_t mask = 0; mask < 32; ++mask) {
        std::vector<PartialEncodedPart> subset;
        for (uint32_t k = 0; k < 5; ++k) {
            if (mask & (1u << k)) {
                subset.push_back(enc3.parts[k]);
            }
        }
        if (subset.size() >= 3) {
            EXPECT_EQ(ChunkCodec::decode(enc3.header, subset), payload) << "mask=" << mask;
        } else {
            EXPECT_EQ(decodeErrorKind(enc3.header, subset), ChunkErrorKind::InsufficientParts);
        }
    }
}

TEST(ChunkCodecTest, DecodeIsIdempotent) {
    auto payload = makePayload(300);
    auto enc = ChunkCodec::encode(payload, 3, 9);
    std::vector<PartialEncodedPart> parts{enc.parts[8], enc.parts[4], enc.parts[6]};
    auto first = ChunkCodec::decode(enc.header, parts);
    auto second = ChunkCodec::decode(enc.header, parts);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first, payload);
}

TEST(ChunkCodecTest, DuplicateIndicesCountOnce) {
    auto enc = ChunkCodec::encode(makePayload(64), 2, 4);
    std::vector<PartialEncodedPart> dup{enc.parts[1], enc.parts[1], enc.parts[1]};
    EXPECT_EQ(decodeErrorKind(enc.header, dup), ChunkErrorKind::InsufficientParts);
}

TEST(ChunkCodecTest, CorruptPartFailsBeforeDecode) {
    auto payload = makePayload(512);
    auto enc = ChunkCodec::encode(payload, 2, 5);

    auto flipped = enc.parts[3];
    flipped.bytes[0] ^= 0xFF;
    EXPECT_FALSE(ChunkCodec::verifyPart(enc.header, flipped));
    // Enough good parts are present, yet one bad part fails the call.
    std::vector<PartialEncodedPart> withBad{enc.parts[0], enc.parts[1], flipped};
    EXPECT_EQ(decodeErrorKind(enc.header, withBad), ChunkErrorKind::CorruptPart);

    auto wrongOrd = enc.parts[2];
    wrongOrd.partOrd = 4;
    EXPECT_FALSE(ChunkCodec::verifyPart(enc.header, wrongOrd));

    auto truncated = enc.parts[2];
    truncated.bytes.pop_back();
    EXPECT_FALSE(ChunkCodec::verifyPart(enc.header, truncated));

    auto foreign = ChunkCodec::encode(makePayload(512, 99), 2, 5);
    EXPECT_FALSE(ChunkCodec::verifyPart(enc.header, foreign.parts[0]));
}

TEST(ChunkCodecTest, HeaderSerializationAndValidation) {
    auto enc = ChunkCodec::encode(makePayload(100), 2, 6, 42, 1);
    auto bytes = enc.header.serialize();
    auto back = shardavail::core::ChunkHeader::deserialize(bytes);
    EXPECT_EQ(back, enc.header);
    EXPECT_EQ(back.chunkHash(), enc.header.chunkHash());

    bytes.push_back(0);
    EXPECT_THROW(shardavail::core::ChunkHeader::deserialize(bytes), std::runtime_error);
    EXPECT_THROW(ChunkCodec::encode(makePayload(10), 0, 3), std::invalid_argument);
    EXPECT_THROW(ChunkCodec::encode(makePayload(10), 4, 3), std::invalid_argument);
}

TEST(ReedSolomonTest, ParityShardsRebuildLostData) {
    ReedSolomon rs(2, 5);
    std::vector<std::vector<uint8_t>> data = {{1, 2, 3, 4}, {9, 8, 7, 6}};
    auto shards = rs.encode(data);
    ASSERT_EQ(shards.size(), 5u);
    EXPECT_EQ(shards[0], data[0]);
    EXPECT_EQ(shards[1], data[1]);

    std::map<uint32_t, std::vector<uint8_t>> parityOnly = {{3, shards[3]}, {4, shards[4]}};
    EXPECT_EQ(rs.reconstructData(parityOnly), data);

    std::map<uint32_t, std::vector<uint8_t>> tooFew = {{2, shards[2]}};
    EXPECT_THROW(rs.reconstructData(tooFew), ChunkError);
}

TEST(ChunkCodecTest, OversizedPayloadLengthIsRejected) {
    auto header = ChunkCodec::encode(makePayload(100), 2, 6).header;
    header.payloadLength = UINT64_MAX;
    // Ceiling division must not wrap to a tiny part size.
    EXPECT_GT(header.partSize(), shardavail::core::kMaxPartBytes);
    EXPECT_THROW(header.validate(), std::invalid_argument);

    header.payloadLength = 2ull * shardavail::core::kMaxPartBytes + 1;
    EXPECT_THROW(header.validate(), std::invalid_argument);

    header.payloadLength = 2ull * shardavail::core::kMaxPartBytes;
    EXPECT_NO_THROW(header.validate());
    EXPECT_EQ(header.partSize(), shardavail::core::kMaxPartBytes);
}

} // anonymous namespace
