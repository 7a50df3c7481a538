#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <set>
#include <thread>
#include <vector>

#include "chunks/request_tracker.hpp"
#include "erasure/chunk_codec.hpp"
#include "test_helpers.hpp"

namespace {

using namespace shardavail::chunks;
using shardavail::core::ChunkHeader;
using shardavail::erasure::ChunkCodec;
using shardavail::network::PartialEncodedChunkRequest;
using shardavail::network::PeerReputation;
using shardavail::network::QueueNetworkAdapter;
using shardavail::sharding::RoundRobinSelection;

class RequestTrackerTest : public ::testing::Test {
  protected:
    void SetUp() override {
        header = ChunkCodec::encode(shardavail::test::makePayload(600), 2, 6).header;
        hash = header.chunkHash();
        reputation = std::make_shared<PeerReputation>();
        TrackerOptions opts;
        opts.requestTimeout = std::chrono::milliseconds(1000);
        opts.retryCeiling = 3;
        tracker = std::make_unique<RequestTracker>("self", "rb-self", net,
                                                   std::make_shared<RoundRobinSelection>(),
                                                   reputation, opts);
        tracker->setParticipants({"self", "peer-a", "peer-b", "peer-c"});
        tracker->setAbandonCallback([this](const shardavail::core::ChunkHash &h) {
            abandoned.push_back(h);
        });
    }

    // Drain the outbox; returns every request sent, with its destination.
    std::vector<std::pair<std::string, PartialEncodedChunkRequest>> drain() {
        std::vector<std::pair<std::string, PartialEncodedChunkRequest>> out;
        while (auto msg = net.pop()) {
            EXPECT_TRUE(msg->isRequest());
            out.emplace_back(msg->destination, shardavail::network::decodeRequest(msg->message));
        }
        return out;
    }

    QueueNetworkAdapter net;
    ChunkHeader header;
    shardavail::core::ChunkHash hash{};
    std::shared_ptr<PeerReputation> reputation;
    std::unique_ptr<RequestTracker> tracker;
    std::vector<shardavail::core::ChunkHash> abandoned;
    RequestTracker::Clock::time_point t0 = RequestTracker::Clock::now();
};

TEST_F(RequestTrackerTest, RequestsAreGroupedByOwnerAndNeverSentToSelf) {
    EXPECT_EQ(tracker->requestParts(header, {0, 1, 2, 3, 4, 5}, t0), 6u);
    auto sent = drain();
    ASSERT_FALSE(sent.empty());

    std::set<uint32_t> covered;
    std::set<std::string> owners;
    for (const auto &entry : sent) {
        EXPECT_NE(entry.first, "self");
        EXPECT_TRUE(owners.insert(entry.first).second) << "two requests to " << entry.first;
        EXPECT_EQ(entry.second.routeBack, "rb-self");
        EXPECT_EQ(entry.second.chunkHash, hash);
        covered.insert(entry.second.partOrds.begin(), entry.second.partOrds.end());
    }
    EXPECT_EQ(covered.size(), 6u);
    for (uint32_t ord = 0; ord < 6; ++ord) {
        EXPECT_EQ(tracker->state(hash, ord), RequestState::Requested);
    }

    // Already outstanding: nothing new goes out.
    EXPECT_EQ(tracker->requestParts(header, {0, 1}, t0), 0u);
    EXPECT_TRUE(drain().empty());
}

TEST_F(RequestTrackerTest, SatisfiedIsTerminalAndDuplicatesAreNoOps) {
    tracker->requestParts(header, {0, 1}, t0);
    drain();

    EXPECT_TRUE(tracker->onPartSatisfied(hash, 0));
    EXPECT_EQ(tracker->state(hash, 0), RequestState::Satisfied);
    EXPECT_FALSE(tracker->onPartSatisfied(hash, 0));
    EXPECT_TRUE(tracker->isTracking(hash));

    EXPECT_TRUE(tracker->onPartSatisfied(hash, 1));
    EXPECT_FALSE(tracker->isTracking(hash));
    EXPECT_EQ(tracker->pendingChunks(), 0u);

    // Late timer tick after completion does nothing.
    tracker->tick(t0 + std::chrono::seconds(10));
    EXPECT_TRUE(drain().empty());
    EXPECT_TRUE(abandoned.empty());
}

TEST_F(RequestTrackerTest, ThreeTimeoutsAbandonExactlyOnce) {
    tracker->requestParts(header, {3}, t0);
    EXPECT_EQ(drain().size(), 1u);

    tracker->tick(t0 + std::chrono::milliseconds(999));
    EXPECT_TRUE(drain().empty());
    EXPECT_EQ(tracker->retryCount(hash), 0u);

    tracker->tick(t0 + std::chrono::milliseconds(1000));
    EXPECT_EQ(tracker->retryCount(hash), 1u);
    EXPECT_EQ(drain().size(), 1u);

    tracker->tick(t0 + std::chrono::milliseconds(2000));
    EXPECT_EQ(tracker->retryCount(hash), 2u);
    EXPECT_EQ(drain().size(), 1u);
    EXPECT_TRUE(abandoned.empty());

    tracker->tick(t0 + std::chrono::milliseconds(3000));
    ASSERT_EQ(abandoned.size(), 1u);
    EXPECT_EQ(abandoned[0], hash);
    EXPECT_EQ(tracker->state(hash, 3), RequestState::Abandoned);
    EXPECT_TRUE(drain().empty());

    // No further automatic retries or notifications.
    tracker->tick(t0 + std::chrono::milliseconds(10000));
    EXPECT_EQ(abandoned.size(), 1u);
    EXPECT_TRUE(drain().empty());

    // A fresh trigger re-enters from Idle.
    EXPECT_EQ(tracker->requestParts(header, {3}, t0 + std::chrono::seconds(11)), 1u);
    EXPECT_EQ(tracker->state(hash, 3), RequestState::Requested);
}

TEST_F(RequestTrackerTest, TimeoutsRotateOwnersAndPenalize) {
    tracker->requestParts(header, {2}, t0);
    auto first = drain();
    ASSERT_EQ(first.size(), 1u);

    tracker->tick(t0 + std::chrono::milliseconds(1000));
    auto second = drain();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_NE(second[0].first, first[0].first);
    EXPECT_GT(reputation->score(first[0].first), 0.0);
}

TEST_F(RequestTrackerTest, RejectedPartGoesToAlternateOwnerAtOnce) {
    tracker->requestParts(header, {4}, t0);
    auto first = drain();
    ASSERT_EQ(first.size(), 1u);
    const std::string badPeer = first[0].first;

    EXPECT_TRUE(tracker->onPartRejected(hash, 4, badPeer, t0));
    auto retry = drain();
    ASSERT_EQ(retry.size(), 1u);
    EXPECT_NE(retry[0].first, badPeer);
    EXPECT_NE(retry[0].first, "self");
    EXPECT_EQ(retry[0].second.partOrds, std::vector<uint32_t>{4});
    EXPECT_EQ(tracker->state(hash, 4), RequestState::Requested);
    // Rejections move the rotation, not the timeout count.
    EXPECT_EQ(tracker->retryCount(hash), 0u);

    EXPECT_TRUE(tracker->onPartUnavailable(hash, 4, retry[0].first, t0));
    auto third = drain();
    ASSERT_EQ(third.size(), 1u);
    EXPECT_NE(third[0].first, badPeer);
    EXPECT_NE(third[0].first, retry[0].first);

    EXPECT_FALSE(tracker->onPartRejected(hash, 5, badPeer, t0));
}

TEST_F(RequestTrackerTest, RepeatedOrUnsolicitedReportsAreIgnored) {
    tracker->requestParts(header, {0}, t0);
    auto first = drain();
    ASSERT_EQ(first.size(), 1u);
    const std::string askedFirst = first[0].first;

    EXPECT_TRUE(tracker->onPartUnavailable(hash, 0, askedFirst, t0));
    auto second = drain();
    ASSERT_EQ(second.size(), 1u);
    const std::string askedSecond = second[0].first;
    ASSERT_NE(askedSecond, askedFirst);

    // The same marker delivered twice must not drop the peer now being asked.
    EXPECT_FALSE(tracker->onPartUnavailable(hash, 0, askedFirst, t0));
    EXPECT_FALSE(tracker->onPartRejected(hash, 0, askedFirst, t0));
    EXPECT_EQ(net.size(), 0u);

    // Nor can a peer that was never asked.
    std::string stranger;
    for (const std::string peer : {"peer-a", "peer-b", "peer-c"}) {
        if (peer != askedFirst && peer != askedSecond) {
            stranger = peer;
        }
    }
    ASSERT_FALSE(stranger.empty());
    EXPECT_FALSE(tracker->onPartUnavailable(hash, 0, stranger, t0));
    EXPECT_FALSE(tracker->onPartRejected(hash, 0, "self", t0));
    EXPECT_EQ(net.size(), 0u);
    EXPECT_EQ(tracker->state(hash, 0), RequestState::Requested);

    // The owner actually asked still moves the request on.
    EXPECT_TRUE(tracker->onPartUnavailable(hash, 0, askedSecond, t0));
    auto third = drain();
    ASSERT_EQ(third.size(), 1u);
    EXPECT_EQ(third[0].first, stranger);
}

TEST_F(RequestTrackerTest, NoPeersLeavesPartRetrying) {
    tracker->setParticipants({"self"});
    EXPECT_EQ(tracker->requestParts(header, {0}, t0), 1u);
    EXPECT_TRUE(drain().empty());
    EXPECT_EQ(tracker->state(hash, 0), RequestState::Retrying);

    tracker->setParticipants({"self", "peer-a"});
    tracker->tick(t0 + std::chrono::milliseconds(1000));
    auto sent = drain();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].first, "peer-a");
}

TEST_F(RequestTrackerTest, CancelAndClearForgetState) {
    tracker->requestParts(header, {0, 1, 2}, t0);
    drain();
    tracker->cancelChunk(hash);
    EXPECT_FALSE(tracker->isTracking(hash));
    EXPECT_EQ(tracker->state(hash, 1), RequestState::Idle);
    tracker->tick(t0 + std::chrono::seconds(5));
    EXPECT_TRUE(abandoned.empty());

    tracker->requestParts(header, {0}, t0);
    tracker->onPartSatisfied(hash, 0);
    tracker->clear();
    EXPECT_EQ(tracker->state(hash, 0), RequestState::Idle);
    EXPECT_EQ(tracker->pendingChunks(), 0u);
}

TEST_F(RequestTrackerTest, OutOfRangeOrdsIgnored) {
    EXPECT_EQ(tracker->requestParts(header, {6, 100}, t0), 0u);
    EXPECT_FALSE(tracker->isTracking(hash));
    EXPECT_TRUE(drain().empty());
}

TEST(RequestTrackerTimerTest, BackgroundTimerAbandons) {
    QueueNetworkAdapter net;
    TrackerOptions opts;
    opts.requestTimeout = std::chrono::milliseconds(20);
    opts.retryCeiling = 1;
    RequestTracker tracker("self", "rb", net, std::make_shared<RoundRobinSelection>(),
                           std::make_shared<PeerReputation>(), opts);
    tracker.setParticipants({"self", "other"});
    std::atomic<int> calls{0};
    tracker.setAbandonCallback([&calls](const shardavail::core::ChunkHash &) { ++calls; });

    auto header = ChunkCodec::encode(shardavail::test::makePayload(10), 1, 2).header;
    tracker.requestParts(header, {0, 1});
    ASSERT_TRUE(tracker.startTimer(std::chrono::milliseconds(5)));

    for (int i = 0; i < 400 && calls.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(tracker.stopTimer());
    EXPECT_EQ(calls.load(), 1);
    EXPECT_FALSE(tracker.isTracking(header.chunkHash()));
}

} // anonymous namespace
