#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

#include "erasure/chunk_codec.hpp"
#include "network/network_adapter.hpp"
#include "network/peer_reputation.hpp"
#include "network/protocol_messages.hpp"
#include "test_helpers.hpp"

namespace {

using namespace shardavail::network;
using shardavail::erasure::ChunkCodec;
using shardavail::test::makePayload;

TEST(ProtocolMessagesTest, RequestEncodeDecode) {
    PartialEncodedChunkRequest req;
    req.chunkHash = shardavail::util::hashing::sha256(std::string("c"));
    req.partOrds = {0, 4, 9};
    req.trackingShards = {2};
    req.routeBack = "rb-0011223344556677";

    ProtocolMessage msg = encodeRequest(req);
    EXPECT_EQ(msg.type, kPartialChunkRequestType);
    auto back = decodeRequest(decodeFrame(encodeFrame(msg)));
    EXPECT_EQ(back.chunkHash, req.chunkHash);
    EXPECT_EQ(back.partOrds, req.partOrds);
    EXPECT_EQ(back.trackingShards, req.trackingShards);
    EXPECT_EQ(back.routeBack, req.routeBack);
}

TEST(ProtocolMessagesTest, ResponseCarriesPartsAndMarkers) {
    auto enc = ChunkCodec::encode(makePayload(300), 2, 5);
    PartialEncodedChunkResponse resp;
    resp.chunkHash = enc.header.chunkHash();
    resp.parts = {enc.parts[1], enc.parts[3]};
    resp.unavailableOrds = {4};

    auto back = decodeResponse(encodeResponse(resp));
    EXPECT_EQ(back.chunkHash, resp.chunkHash);
    ASSERT_EQ(back.parts.size(), 2u);
    EXPECT_TRUE(back.parts[0].sameContent(enc.parts[1]));
    EXPECT_TRUE(back.parts[1].sameContent(enc.parts[3]));
    EXPECT_EQ(back.unavailableOrds, std::vector<uint32_t>{4});
    EXPECT_TRUE(ChunkCodec::verifyPart(enc.header, back.parts[1]));
}

TEST(ProtocolMessagesTest, MalformedInputThrows) {
    PartialEncodedChunkRequest req;
    req.partOrds = {1};
    req.routeBack = "x";
    ProtocolMessage msg = encodeRequest(req);

    EXPECT_THROW(decodeResponse(msg), std::runtime_error);

    ProtocolMessage truncated = msg;
    truncated.payload.resize(truncated.payload.size() - 1);
    EXPECT_THROW(decodeRequest(truncated), std::runtime_error);

    ProtocolMessage trailing = msg;
    trailing.payload.push_back(0);
    EXPECT_THROW(decodeRequest(trailing), std::runtime_error);

    // Part count far beyond any chunk.
    ProtocolMessage hostile;
    hostile.type = kPartialChunkResponseType;
    hostile.payload.assign(32, 0);
    hostile.payload.insert(hostile.payload.end(), {0x7F, 0xFF, 0xFF, 0xFF});
    EXPECT_THROW(decodeResponse(hostile), std::runtime_error);
}

TEST(QueueNetworkAdapterTest, FifoOrder) {
    QueueNetworkAdapter net;
    PartialEncodedChunkRequest req;
    req.routeBack = "me";
    PartialEncodedChunkResponse resp;

    net.sendRequest("peer-a", req);
    net.sendResponse("rb-1", resp);
    EXPECT_EQ(net.size(), 2u);

    auto first = net.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->isRequest());
    EXPECT_EQ(first->destination, "peer-a");

    auto second = net.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_TRUE(second->isResponse());
    EXPECT_EQ(second->destination, "rb-1");
    EXPECT_FALSE(net.pop().has_value());
}

TEST(RouteBackRegistryTest, IssueResolveRevoke) {
    RouteBackRegistry routes;
    std::string t1 = routes.issue("node-a");
    std::string t2 = routes.issue("node-a");
    EXPECT_NE(t1, t2);
    EXPECT_EQ(routes.resolve(t1), std::string("node-a"));
    EXPECT_FALSE(routes.resolve("rb-unknown").has_value());
    routes.revoke(t1);
    EXPECT_FALSE(routes.resolve(t1).has_value());
    EXPECT_EQ(routes.resolve(t2), std::string("node-a"));
}

TEST(PeerReputationTest, PenaltiesDecayAndBan) {
    PeerReputation rep(100.0, 10.0);
    auto t0 = PeerReputation::Clock::now();

    EXPECT_DOUBLE_EQ(rep.score("p", t0), 0.0);
    rep.penalizeCorrupt("p", t0);
    EXPECT_FALSE(rep.isBanned("p", t0));
    rep.penalizeCorrupt("p", t0);
    EXPECT_TRUE(rep.isBanned("p", t0));

    // 10 points per second: two seconds later the peer is back under the threshold.
    auto t2 = t0 + std::chrono::seconds(2);
    EXPECT_DOUBLE_EQ(rep.score("p", t2), 80.0);
    EXPECT_FALSE(rep.isBanned("p", t2));

    rep.penalizeMiss("q", t0);
    EXPECT_DOUBLE_EQ(rep.score("q", t0), PeerReputation::kMissPenalty);
    EXPECT_DOUBLE_EQ(rep.score("q", t0 + std::chrono::seconds(60)), 0.0);

    rep.forget("p");
    EXPECT_DOUBLE_EQ(rep.score("p", t2), 0.0);
}

} // anonymous namespace
