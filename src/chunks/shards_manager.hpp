#ifndef SHARDAVAIL_CHUNKS_SHARDS_MANAGER_HPP
#define SHARDAVAIL_CHUNKS_SHARDS_MANAGER_HPP

#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "chunks/chain_listener.hpp"
#include "chunks/request_tracker.hpp"
#include "config/chainparams.hpp"
#include "config/node_config.hpp"
#include "core/chunk_types.hpp"
#include "network/network_adapter.hpp"
#include "network/peer_reputation.hpp"
#include "network/protocol_messages.hpp"
#include "sharding/owner_selection.hpp"
#include "storage/part_store.hpp"
#include "util/thread_pool.hpp"

namespace shardavail {
namespace chunks {

/*
  ShardsManager
  --------------------------------
  Runs the chunk-availability protocol for one node: the producer path, the
  serving side of part requests, and the requesting side that collects
  responses until a chunk can be rebuilt.

  Required Methods:
    ChunkHeader distributeChunk(payload, height, shardId, prevBlockHash)
    void processChunkHeader(const ChunkHeader &header)
    std::optional<PartialEncodedChunkResponse> processPartialEncodedChunkRequest(const PartialEncodedChunkRequest &request)
    void processPartialEncodedChunkResponse(const PartialEncodedChunkResponse &response, const std::string &sender)
    void updateParticipants(const std::vector<std::string> &participants)
    void tick(time_point now)

  Serving (works straight after a restart; reads only the part store and the
  ownership function):
   - present parts are returned as stored
   - absent parts this node owns come back as "unavailable" markers
   - absent parts owned by others are left out
   - nothing to say -> no response at all

  Requesting:
   - every part is checked against the header's partsRoot before it touches
     the store; a bad part is dropped, its sender penalized and the part
     re-requested elsewhere
   - duplicates and late arrivals are no-ops
   - once dataParts distinct parts are stored, outstanding requests are
     cancelled and reconstruction is queued on the worker pool
   - after reconstruction the node stores the parts it owns, re-derived by the
     deterministic encoder and checked against partsRoot, so it can serve them

  Errors never escape a message handler: they are logged and the chunk stays
  "not yet available". ConflictingPart is reported to the chain layer through
  onIntegrityViolation.
*/

class ShardsManager
{
public:
    using Clock = RequestTracker::Clock;

    /**
     * @param config     node identity, participant set, retry policy, workers
     * @param store      durable part store (shared so a test can reopen it)
     * @param network    outbound gateway
     * @param listener   chain-layer callbacks
     * @param routeBack  token put in outgoing requests; defaults to the participant id
     * @throw std::runtime_error on an unknown networkId.
     * @throw std::invalid_argument on an unknown ownerSelection.
     */
    ShardsManager(const config::NodeConfig &config,
                  std::shared_ptr<storage::PartStore> store,
                  network::NetworkAdapter &network,
                  ChainListener listener,
                  const std::string &routeBack = std::string());
    ~ShardsManager();

    ShardsManager(const ShardsManager&) = delete;
    ShardsManager& operator=(const ShardsManager&) = delete;

    /**
     * @brief Producer path: encode once, persist the header and every part.
     * @throw std::invalid_argument if the payload exceeds maxChunkBytes.
     */
    core::ChunkHeader distributeChunk(const std::vector<uint8_t> &payload,
                                      uint64_t height,
                                      uint32_t shardId,
                                      const core::ChunkHash &prevBlockHash = core::ChunkHash{});

    /**
     * @brief The chain layer needs this chunk. Completes at once if enough
     *        parts are local, otherwise requests the missing ones.
     * @throw std::invalid_argument if the header is malformed.
     */
    void processChunkHeader(const core::ChunkHeader &header, Clock::time_point now = Clock::now());

    /**
     * @brief Serve a peer's request. The response is also sent to request.routeBack.
     */
    std::optional<network::PartialEncodedChunkResponse>
    processPartialEncodedChunkRequest(const network::PartialEncodedChunkRequest &request);

    void processPartialEncodedChunkResponse(const network::PartialEncodedChunkResponse &response,
                                            const std::string &sender,
                                            Clock::time_point now = Clock::now());

    /**
     * @brief Decode a framed envelope and dispatch it; malformed input is dropped.
     * @return false if the message could not be decoded.
     */
    bool handleMessage(const network::ProtocolMessage &msg, const std::string &sender);

    void updateParticipants(const std::vector<std::string> &participants);
    std::vector<std::string> participants() const;

    void tick(Clock::time_point now = Clock::now());
    bool startTimer();
    bool stopTimer();

    /**
     * @brief Block until every queued reconstruction has finished.
     */
    void waitForIdle();

    bool isComplete(const core::ChunkHash &chunkHash) const;
    size_t completedCount() const;
    bool isOwner(const core::ChunkHash &chunkHash, core::PartOrd ord) const;

    const std::string& participantId() const { return m_selfId; }
    const config::ChainParams& chainParams() const { return m_params; }
    RequestTracker& tracker() { return *m_tracker; }
    network::PeerReputation& reputation() { return *m_reputation; }
    storage::PartStore& store() { return *m_store; }

private:
    void maybeReconstruct(const core::ChunkHeader &header);
    void reconstruct(const core::ChunkHeader &header);
    void storeOwnedParts(const core::ChunkHeader &header, const std::vector<uint8_t> &payload);
    void onRequestAbandoned(const core::ChunkHash &chunkHash);
    bool markCompletedLocked(const core::ChunkHash &chunkHash);
    bool storeVerifiedPart(const core::ChunkHash &chunkHash, const core::PartialEncodedPart &part);

    const config::NodeConfig m_config;
    const config::ChainParams m_params;
    const std::string m_selfId;
    std::shared_ptr<storage::PartStore> m_store;
    network::NetworkAdapter &m_network;
    ChainListener m_listener;

    std::shared_ptr<network::PeerReputation> m_reputation;
    std::shared_ptr<sharding::OwnerSelectionStrategy> m_strategy;
    std::unique_ptr<RequestTracker> m_tracker;

    mutable std::mutex m_stateMutex;
    std::vector<std::string> m_participants;
    std::set<core::ChunkHash> m_needed;
    std::set<core::ChunkHash> m_reconstructing;
    std::set<core::ChunkHash> m_completed;
    std::deque<core::ChunkHash> m_completedOrder;
    const size_t m_maxCompleted;

    // Declared last so it is destroyed (and drained) first.
    std::unique_ptr<util::ThreadPool> m_pool;
};

} // namespace chunks
} // namespace shardavail

#endif // SHARDAVAIL_CHUNKS_SHARDS_MANAGER_HPP
