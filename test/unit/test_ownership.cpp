#include <algorithm>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "network/peer_reputation.hpp"
#include "sharding/owner_selection.hpp"
#include "sharding/ownership.hpp"
#include "util/hashing.hpp"

namespace {

using shardavail::core::ChunkHash;
using namespace shardavail::sharding;

ChunkHash chunkId(const std::string &tag)
{
    return shardavail::util::hashing::sha256(tag);
}

TEST(OwnershipTest, DeterministicAndOrderIndependent) {
    std::vector<std::string> a{"alice", "bob", "carol", "dave"};
    std::vector<std::string> b{"dave", "carol", "alice", "bob"};
    auto hash = chunkId("chunk-1");
    for (uint32_t ord = 0; ord < 50; ++ord) {
        std::string owner = ownerOf(hash, ord, a);
        EXPECT_EQ(owner, ownerOf(hash, ord, a));
        EXPECT_EQ(owner, ownerOf(hash, ord, b));
        EXPECT_EQ(rankedOwners(hash, ord, a).front(), owner);
        EXPECT_EQ(rankedOwners(hash, ord, a), rankedOwners(hash, ord, b));
    }
}

TEST(OwnershipTest, EmptyParticipantSetThrows) {
    EXPECT_THROW(ownerOf(chunkId("x"), 0, {}), std::invalid_argument);
    EXPECT_THROW(rankedOwners(chunkId("x"), 0, {}), std::invalid_argument);
}

TEST(OwnershipTest, SpreadsPartsAcrossParticipants) {
    std::vector<std::string> nodes{"n0", "n1", "n2", "n3"};
    auto hash = chunkId("spread");
    std::map<std::string, int> counts;
    for (uint32_t ord = 0; ord < 100; ++ord) {
        ++counts[ownerOf(hash, ord, nodes)];
    }
    EXPECT_EQ(counts.size(), nodes.size());

    size_t total = 0;
    for (const auto &n : nodes) {
        total += ownedParts(hash, 100, n, nodes).size();
    }
    EXPECT_EQ(total, 100u);
}

TEST(OwnershipTest, LeavingParticipantOnlyMovesItsOwnParts) {
    std::vector<std::string> before{"n0", "n1", "n2", "n3", "n4"};
    std::vector<std::string> after{"n0", "n1", "n3", "n4"};
    auto hash = chunkId("membership");
    for (uint32_t ord = 0; ord < 64; ++ord) {
        std::string oldOwner = ownerOf(hash, ord, before);
        if (oldOwner != "n2") {
            EXPECT_EQ(ownerOf(hash, ord, after), oldOwner) << "ord=" << ord;
        } else {
            // The new owner is the runner-up of the old ranking.
            EXPECT_EQ(ownerOf(hash, ord, after), rankedOwners(hash, ord, before)[1]);
        }
    }
}

TEST(OwnerSelectionTest, RoundRobinWalksRanking) {
    RoundRobinSelection rr;
    std::vector<std::string> ranked{"a", "b", "c"};
    auto hash = chunkId("rr");
    EXPECT_EQ(rr.selectOwner(hash, 0, ranked, {}, 0), std::string("a"));
    EXPECT_EQ(rr.selectOwner(hash, 0, ranked, {"a"}, 1), std::string("b"));
    EXPECT_EQ(rr.selectOwner(hash, 0, ranked, {"a", "b"}, 2), std::string("c"));
    EXPECT_EQ(rr.selectOwner(hash, 0, ranked, {"b"}, 1), std::string("c"));
    EXPECT_EQ(rr.selectOwner(hash, 0, ranked, {"a", "b", "c"}, 0), std::nullopt);
}

TEST(OwnerSelectionTest, RandomNeverPicksExcluded) {
    RandomSelection rnd(1234);
    std::vector<std::string> ranked{"a", "b", "c", "d"};
    auto hash = chunkId("rnd");
    EXPECT_EQ(rnd.selectOwner(hash, 0, ranked, {}, 0), std::string("a"));
    std::set<std::string> seen;
    for (uint32_t attempt = 1; attempt < 200; ++attempt) {
        auto pick = rnd.selectOwner(hash, 0, ranked, {"a", "c"}, attempt);
        ASSERT_TRUE(pick.has_value());
        EXPECT_TRUE(*pick == "b" || *pick == "d");
        seen.insert(*pick);
    }
    EXPECT_EQ(seen.size(), 2u);
}

TEST(OwnerSelectionTest, ReputationPrefersCleanPeers) {
    auto rep = std::make_shared<shardavail::network::PeerReputation>();
    ReputationWeightedSelection sel(rep);
    std::vector<std::string> ranked{"a", "b", "c"};
    auto hash = chunkId("rep");

    EXPECT_EQ(sel.selectOwner(hash, 0, ranked, {}, 0), std::string("a"));
    rep->penalizeCorrupt("a");
    EXPECT_EQ(sel.selectOwner(hash, 0, ranked, {}, 1), std::string("b"));
    rep->penalizeMiss("b");
    EXPECT_EQ(sel.selectOwner(hash, 0, ranked, {}, 2), std::string("c"));
    EXPECT_EQ(sel.selectOwner(hash, 0, ranked, {"c"}, 3), std::string("b"));
}

TEST(OwnerSelectionTest, FactoryByName) {
    auto rep = std::make_shared<shardavail::network::PeerReputation>();
    EXPECT_STREQ(makeOwnerSelection("round_robin", rep)->name(), "round_robin");
    EXPECT_STREQ(makeOwnerSelection("random", rep)->name(), "random");
    EXPECT_STREQ(makeOwnerSelection("reputation", rep)->name(), "reputation");
    EXPECT_THROW(makeOwnerSelection("fastest", rep), std::invalid_argument);
    EXPECT_THROW(makeOwnerSelection("reputation", nullptr), std::invalid_argument);
}

} // anonymous namespace
