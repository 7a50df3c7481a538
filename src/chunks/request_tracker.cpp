#include "chunks/request_tracker.hpp"
#include "sharding/ownership.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace shardavail {
namespace chunks {

using core::ChunkHash;
using core::ChunkHeader;
using core::PartOrd;
using util::hashing::shortHex;

const char* toString(RequestState state)
{
    switch (state) {
    case RequestState::Idle:      return "Idle";
    case RequestState::Requested: return "Requested";
    case RequestState::Retrying:  return "Retrying";
    case RequestState::Satisfied: return "Satisfied";
    case RequestState::Abandoned: return "Abandoned";
    }
    return "Unknown";
}

RequestTracker::RequestTracker(std::string selfId,
                               std::string routeBack,
                               network::NetworkAdapter &network,
                               std::shared_ptr<sharding::OwnerSelectionStrategy> strategy,
                               std::shared_ptr<network::PeerReputation> reputation,
                               TrackerOptions options)
    : m_selfId(std::move(selfId))
    , m_routeBack(std::move(routeBack))
    , m_network(network)
    , m_strategy(std::move(strategy))
    , m_reputation(std::move(reputation))
    , m_options(options)
{
    if (!m_strategy) {
        throw std::invalid_argument("RequestTracker: owner selection strategy is null");
    }
    if (!m_reputation) {
        throw std::invalid_argument("RequestTracker: reputation tracker is null");
    }
    if (m_options.retryCeiling == 0) {
        throw std::invalid_argument("RequestTracker: retryCeiling must be at least 1");
    }
}

RequestTracker::~RequestTracker()
{
    stopTimer();
}

void RequestTracker::setAbandonCallback(AbandonCallback cb)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_onAbandoned = std::move(cb);
}

void RequestTracker::setParticipants(const std::vector<sharding::ParticipantId> &participants)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_participants = participants;
}

size_t RequestTracker::requestParts(const ChunkHeader &header,
                                    const std::vector<PartOrd> &ords,
                                    Clock::time_point now)
{
    const ChunkHash chunkHash = header.chunkHash();

    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(chunkHash);
    if (it == m_pending.end()) {
        PendingRequest req;
        req.header = header;
        req.routeBack = m_routeBack;
        req.issuedAt = now;
        req.deadline = now + m_options.requestTimeout;
        it = m_pending.emplace(chunkHash, std::move(req)).first;
    }
    PendingRequest &req = it->second;

    std::vector<PartOrd> fresh;
    for (PartOrd ord : ords) {
        if (ord >= header.totalParts) {
            util::logger::warn("[RequestTracker] ignoring out-of-range part " + std::to_string(ord) +
                               " for chunk " + shortHex(chunkHash));
            continue;
        }
        if (req.parts.count(ord) != 0) {
            continue;
        }
        req.parts.emplace(ord, PartRequest{});
        m_outcomes.erase(PartKey(chunkHash, ord));
        fresh.push_back(ord);
    }

    if (req.parts.empty()) {
        m_pending.erase(it);
        return 0;
    }
    dispatchLocked(chunkHash, req, fresh);
    return fresh.size();
}

bool RequestTracker::selectOwnerLocked(const ChunkHash &chunkHash, PartOrd ord, PartRequest &part)
{
    if (m_participants.empty()) {
        return false;
    }
    std::vector<sharding::ParticipantId> ranked =
        sharding::rankedOwners(chunkHash, ord, m_participants);

    std::set<sharding::ParticipantId> excluded = part.tried;
    excluded.insert(m_selfId);

    // Banned peers are skipped while anyone else is left.
    std::set<sharding::ParticipantId> withBans = excluded;
    for (const auto &p : ranked) {
        if (m_reputation->isBanned(p)) {
            withBans.insert(p);
        }
    }

    std::optional<sharding::ParticipantId> owner =
        m_strategy->selectOwner(chunkHash, ord, ranked, withBans, part.attempt);
    if (!owner) {
        owner = m_strategy->selectOwner(chunkHash, ord, ranked, excluded, part.attempt);
    }
    if (!owner && !part.tried.empty()) {
        // Everyone has been tried once; start another round.
        part.tried.clear();
        excluded = {m_selfId};
        owner = m_strategy->selectOwner(chunkHash, ord, ranked, excluded, part.attempt);
    }
    if (!owner) {
        return false;
    }
    part.owner = *owner;
    part.tried.insert(*owner);
    return true;
}

void RequestTracker::dispatchLocked(const ChunkHash &chunkHash, PendingRequest &req,
                                    const std::vector<PartOrd> &ords)
{
    std::map<std::string, std::vector<PartOrd>> byOwner;
    for (PartOrd ord : ords) {
        auto pit = req.parts.find(ord);
        if (pit == req.parts.end()) {
            continue;
        }
        PartRequest &part = pit->second;
        if (selectOwnerLocked(chunkHash, ord, part)) {
            part.state = RequestState::Requested;
            byOwner[part.owner].push_back(ord);
        } else {
            part.state = RequestState::Retrying;
            part.owner.clear();
            util::logger::warn("[RequestTracker] no peer to ask for part " + std::to_string(ord) +
                               " of chunk " + shortHex(chunkHash));
        }
    }

    for (auto &entry : byOwner) {
        network::PartialEncodedChunkRequest request;
        request.chunkHash = chunkHash;
        request.partOrds = std::move(entry.second);
        request.trackingShards = {req.header.shardId};
        request.routeBack = req.routeBack;
        util::logger::debug("[RequestTracker] requesting " + std::to_string(request.partOrds.size()) +
                            " part(s) of chunk " + shortHex(chunkHash) + " from " + entry.first);
        m_network.sendRequest(entry.first, request);
    }
}

bool RequestTracker::onPartSatisfied(const ChunkHash &chunkHash, PartOrd ord)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(chunkHash);
    if (it == m_pending.end()) {
        return false;
    }
    auto pit = it->second.parts.find(ord);
    if (pit == it->second.parts.end()) {
        return false;
    }
    it->second.parts.erase(pit);
    recordOutcomeLocked(chunkHash, ord, RequestState::Satisfied);

    if (it->second.parts.empty()) {
        util::logger::debug("[RequestTracker] all requested parts of chunk " + shortHex(chunkHash) +
                            " satisfied");
        m_pending.erase(it);
    }
    return true;
}

bool RequestTracker::retryPartLocked(const ChunkHash &chunkHash, PartOrd ord,
                                     const std::string &peer, const char *reason)
{
    auto it = m_pending.find(chunkHash);
    if (it == m_pending.end()) {
        return false;
    }
    auto pit = it->second.parts.find(ord);
    if (pit == it->second.parts.end()) {
        return false;
    }
    PartRequest &part = pit->second;
    // Only the owner currently asked can move the request on; repeated or
    // unsolicited reports are no-ops.
    if (part.state != RequestState::Requested || part.owner != peer) {
        util::logger::debug("[RequestTracker] ignoring " + std::string(reason) + " report for part " +
                            std::to_string(ord) + " of chunk " + shortHex(chunkHash) + " from " + peer);
        return false;
    }
    part.tried.insert(peer);
    part.state = RequestState::Retrying;
    ++part.attempt;

    util::logger::info("[RequestTracker] part " + std::to_string(ord) + " of chunk " +
                       shortHex(chunkHash) + " " + reason + " by " + peer +
                       ", asking an alternate owner");
    dispatchLocked(chunkHash, it->second, {ord});
    return part.state == RequestState::Requested;
}

bool RequestTracker::onPartRejected(const ChunkHash &chunkHash, PartOrd ord,
                                    const std::string &peer, Clock::time_point)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return retryPartLocked(chunkHash, ord, peer, "rejected");
}

bool RequestTracker::onPartUnavailable(const ChunkHash &chunkHash, PartOrd ord,
                                       const std::string &peer, Clock::time_point)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return retryPartLocked(chunkHash, ord, peer, "reported unavailable");
}

void RequestTracker::tick(Clock::time_point now)
{
    std::vector<ChunkHash> abandoned;
    AbandonCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto it = m_pending.begin(); it != m_pending.end();) {
            PendingRequest &req = it->second;
            if (now < req.deadline) {
                ++it;
                continue;
            }

            const ChunkHash &chunkHash = it->first;
            ++req.retryCount;
            for (auto &entry : req.parts) {
                if (!entry.second.owner.empty()) {
                    m_reputation->penalizeMiss(entry.second.owner);
                }
            }

            if (req.retryCount >= m_options.retryCeiling) {
                util::logger::warn("[RequestTracker] chunk " + shortHex(chunkHash) + " abandoned after " +
                                   std::to_string(req.retryCount) + " timeouts, " +
                                   std::to_string(req.parts.size()) + " part(s) missing");
                for (const auto &entry : req.parts) {
                    recordOutcomeLocked(chunkHash, entry.first, RequestState::Abandoned);
                }
                abandoned.push_back(chunkHash);
                it = m_pending.erase(it);
                continue;
            }

            util::logger::info("[RequestTracker] chunk " + shortHex(chunkHash) + " timed out (" +
                               std::to_string(req.retryCount) + "/" +
                               std::to_string(m_options.retryCeiling) + "), retrying " +
                               std::to_string(req.parts.size()) + " part(s)");
            std::vector<PartOrd> ords;
            for (auto &entry : req.parts) {
                entry.second.state = RequestState::Retrying;
                ++entry.second.attempt;
                ords.push_back(entry.first);
            }
            req.deadline = now + m_options.requestTimeout;
            dispatchLocked(chunkHash, req, ords);
            ++it;
        }
        callback = m_onAbandoned;
    }

    if (callback) {
        for (const auto &chunkHash : abandoned) {
            callback(chunkHash);
        }
    }
}

void RequestTracker::cancelChunk(const ChunkHash &chunkHash)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pending.erase(chunkHash) > 0) {
        util::logger::debug("[RequestTracker] cancelled outstanding requests for chunk " +
                            shortHex(chunkHash));
    }
}

void RequestTracker::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_pending.clear();
    m_outcomes.clear();
    m_outcomeOrder.clear();
}

void RequestTracker::recordOutcomeLocked(const ChunkHash &chunkHash, PartOrd ord, RequestState state)
{
    PartKey key(chunkHash, ord);
    if (m_outcomes.count(key) == 0) {
        m_outcomeOrder.push_back(key);
    }
    m_outcomes[key] = state;
    while (m_outcomeOrder.size() > kMaxOutcomeRecords) {
        m_outcomes.erase(m_outcomeOrder.front());
        m_outcomeOrder.pop_front();
    }
}

RequestState RequestTracker::state(const ChunkHash &chunkHash, PartOrd ord) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(chunkHash);
    if (it != m_pending.end()) {
        auto pit = it->second.parts.find(ord);
        if (pit != it->second.parts.end()) {
            return pit->second.state;
        }
    }
    auto oit = m_outcomes.find(PartKey(chunkHash, ord));
    if (oit != m_outcomes.end()) {
        return oit->second;
    }
    return RequestState::Idle;
}

bool RequestTracker::isTracking(const ChunkHash &chunkHash) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.count(chunkHash) != 0;
}

std::vector<PartOrd> RequestTracker::outstanding(const ChunkHash &chunkHash) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<PartOrd> ords;
    auto it = m_pending.find(chunkHash);
    if (it != m_pending.end()) {
        for (const auto &entry : it->second.parts) {
            ords.push_back(entry.first);
        }
    }
    return ords;
}

uint32_t RequestTracker::retryCount(const ChunkHash &chunkHash) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_pending.find(chunkHash);
    return it == m_pending.end() ? 0 : it->second.retryCount;
}

size_t RequestTracker::pendingChunks() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_pending.size();
}

bool RequestTracker::startTimer(std::chrono::milliseconds interval)
{
    std::lock_guard<std::mutex> lock(m_timerMutex);
    if (m_timerRunning) {
        util::logger::warn("[RequestTracker] startTimer called but timer is already running.");
        return true;
    }
    m_timerInterval = interval;
    m_timerRunning = true;
    m_timerThread = std::thread(&RequestTracker::timerLoop, this);
    util::logger::debug("[RequestTracker] timer started.");
    return true;
}

bool RequestTracker::stopTimer()
{
    {
        std::lock_guard<std::mutex> lock(m_timerMutex);
        if (!m_timerRunning) {
            return true;
        }
        m_timerRunning = false;
        m_timerCv.notify_all();
    }
    if (m_timerThread.joinable()) {
        m_timerThread.join();
    }
    util::logger::debug("[RequestTracker] timer stopped.");
    return true;
}

void RequestTracker::timerLoop()
{
    while (true) {
        {
            std::unique_lock<std::mutex> lock(m_timerMutex);
            auto nextWake = Clock::now() + m_timerInterval;
            m_timerCv.wait_until(lock, nextWake, [this] { return !m_timerRunning; });
            if (!m_timerRunning) {
                break;
            }
        }
        try {
            tick(Clock::now());
        } catch (const std::exception &e) {
            util::logger::error(std::string("[RequestTracker] tick failed: ") + e.what());
        }
    }
}

} // namespace chunks
} // namespace shardavail
