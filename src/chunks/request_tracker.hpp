#ifndef SHARDAVAIL_CHUNKS_REQUEST_TRACKER_HPP
#define SHARDAVAIL_CHUNKS_REQUEST_TRACKER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "core/chunk_types.hpp"
#include "network/network_adapter.hpp"
#include "network/peer_reputation.hpp"
#include "sharding/owner_selection.hpp"

namespace shardavail {
namespace chunks {

/*
  RequestTracker
  --------------------------------
  Bookkeeping for the part requests this node has issued. Purely in memory:
  a restart loses everything, and whatever is still needed is asked for
  again from Idle.

  Required Methods:
    size_t requestParts(const ChunkHeader &header, const std::vector<PartOrd> &ords, time_point now)
    bool onPartSatisfied(const ChunkHash &chunkHash, PartOrd ord)
    bool onPartRejected(const ChunkHash &chunkHash, PartOrd ord, const std::string &peer, time_point now)
    bool onPartUnavailable(const ChunkHash &chunkHash, PartOrd ord, const std::string &peer, time_point now)
    void tick(time_point now)
    void cancelChunk(const ChunkHash &chunkHash)

  State per (chunk, part):
    Idle -> Requested            requestParts(); one request per selected owner
    Requested -> Satisfied       onPartSatisfied(); duplicates are a no-op
    Requested -> Retrying        deadline passed, or the owner sent a corrupt
                                 part or an "unavailable" marker
    Retrying -> Requested        re-sent to an alternate owner
    Retrying -> Abandoned        the chunk's timeout count reached the ceiling

  A corrupt part or marker only counts when it comes from the owner the part
  is currently requested from.

  Retry accounting:
   - Deadlines and the retry count belong to the chunk request. Each expired
     deadline is one timeout; when the count reaches retryCeiling the whole
     chunk is abandoned and the abandon callback fires once.
   - A rejected or unavailable part is re-sent at once to another owner. That
     moves the owner rotation forward but does not count towards the ceiling.
   - A part with nobody left to ask stays Retrying until the next timeout.

  THREAD-SAFETY:
   - All public methods lock an internal mutex. The abandon callback runs
     without the lock held; sendRequest runs under it and must not block
     (see NetworkAdapter).
*/

enum class RequestState
{
    Idle,
    Requested,
    Retrying,
    Satisfied,
    Abandoned
};

const char* toString(RequestState state);

struct TrackerOptions
{
    std::chrono::milliseconds requestTimeout{1000};
    uint32_t retryCeiling{3};
};

class RequestTracker
{
public:
    using Clock = std::chrono::steady_clock;
    using AbandonCallback = std::function<void(const core::ChunkHash&)>;

    RequestTracker(std::string selfId,
                   std::string routeBack,
                   network::NetworkAdapter &network,
                   std::shared_ptr<sharding::OwnerSelectionStrategy> strategy,
                   std::shared_ptr<network::PeerReputation> reputation,
                   TrackerOptions options);
    ~RequestTracker();

    RequestTracker(const RequestTracker&) = delete;
    RequestTracker& operator=(const RequestTracker&) = delete;

    void setAbandonCallback(AbandonCallback cb);
    void setParticipants(const std::vector<sharding::ParticipantId> &participants);

    /**
     * @brief Request the given parts; ords already outstanding are skipped.
     * @return Number of ords newly put in flight (Requested or Retrying).
     */
    size_t requestParts(const core::ChunkHeader &header,
                        const std::vector<core::PartOrd> &ords,
                        Clock::time_point now = Clock::now());

    /**
     * @return true iff the ord was outstanding.
     */
    bool onPartSatisfied(const core::ChunkHash &chunkHash, core::PartOrd ord);

    /**
     * @brief `peer` sent a part that failed verification.
     * @return true iff `peer` is the owner currently asked for the ord and the
     *         request has been re-sent elsewhere. Reports from any other peer,
     *         and repeats, change nothing.
     */
    bool onPartRejected(const core::ChunkHash &chunkHash, core::PartOrd ord,
                        const std::string &peer, Clock::time_point now = Clock::now());

    /**
     * @brief `peer` owns the part but does not hold it.
     */
    bool onPartUnavailable(const core::ChunkHash &chunkHash, core::PartOrd ord,
                           const std::string &peer, Clock::time_point now = Clock::now());

    /**
     * @brief Process expired deadlines; may abandon chunks.
     */
    void tick(Clock::time_point now = Clock::now());

    /**
     * @brief Drop all outstanding work for a chunk without notifying anyone.
     */
    void cancelChunk(const core::ChunkHash &chunkHash);

    /**
     * @brief Forget everything, as a restart would.
     */
    void clear();

    RequestState state(const core::ChunkHash &chunkHash, core::PartOrd ord) const;
    bool isTracking(const core::ChunkHash &chunkHash) const;
    std::vector<core::PartOrd> outstanding(const core::ChunkHash &chunkHash) const;
    uint32_t retryCount(const core::ChunkHash &chunkHash) const;
    size_t pendingChunks() const;

    // Background timer calling tick() every `interval`.
    bool startTimer(std::chrono::milliseconds interval);
    bool stopTimer();

private:
    struct PartRequest
    {
        RequestState state{RequestState::Idle};
        std::string owner;
        std::set<sharding::ParticipantId> tried;
        uint32_t attempt{0};
    };

    struct PendingRequest
    {
        core::ChunkHeader header;
        std::string routeBack;
        Clock::time_point issuedAt;
        Clock::time_point deadline;
        uint32_t retryCount{0};
        std::map<core::PartOrd, PartRequest> parts;
    };

    using PartKey = std::pair<core::ChunkHash, core::PartOrd>;

    static constexpr size_t kMaxOutcomeRecords = 65536;

    void dispatchLocked(const core::ChunkHash &chunkHash, PendingRequest &req,
                        const std::vector<core::PartOrd> &ords);
    bool selectOwnerLocked(const core::ChunkHash &chunkHash, core::PartOrd ord, PartRequest &part);
    bool retryPartLocked(const core::ChunkHash &chunkHash, core::PartOrd ord,
                         const std::string &peer, const char *reason);
    void recordOutcomeLocked(const core::ChunkHash &chunkHash, core::PartOrd ord, RequestState state);
    void timerLoop();

    const std::string m_selfId;
    const std::string m_routeBack;
    network::NetworkAdapter &m_network;
    std::shared_ptr<sharding::OwnerSelectionStrategy> m_strategy;
    std::shared_ptr<network::PeerReputation> m_reputation;
    const TrackerOptions m_options;

    mutable std::mutex m_mutex;
    std::vector<sharding::ParticipantId> m_participants;
    std::map<core::ChunkHash, PendingRequest> m_pending;
    std::map<PartKey, RequestState> m_outcomes;
    std::deque<PartKey> m_outcomeOrder;
    AbandonCallback m_onAbandoned;

    std::mutex m_timerMutex;
    std::condition_variable m_timerCv;
    bool m_timerRunning{false};
    std::chrono::milliseconds m_timerInterval{100};
    std::thread m_timerThread;
};

} // namespace chunks
} // namespace shardavail

#endif // SHARDAVAIL_CHUNKS_REQUEST_TRACKER_HPP
