#include "chunks/shards_manager.hpp"
#include "core/chunk_error.hpp"
#include "erasure/chunk_codec.hpp"
#include "sharding/ownership.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace shardavail {
namespace chunks {

using core::ChunkError;
using core::ChunkErrorKind;
using core::ChunkHash;
using core::ChunkHeader;
using core::PartOrd;
using core::PartialEncodedPart;
using erasure::ChunkCodec;
using util::hashing::shortHex;

namespace {

TrackerOptions trackerOptionsFrom(const config::NodeConfig &config)
{
    TrackerOptions opts;
    opts.requestTimeout = std::chrono::milliseconds(config.requestTimeoutMs);
    opts.retryCeiling = config.retryCeiling;
    return opts;
}

} // namespace

ShardsManager::ShardsManager(const config::NodeConfig &config,
                             std::shared_ptr<storage::PartStore> store,
                             network::NetworkAdapter &network,
                             ChainListener listener,
                             const std::string &routeBack)
    : m_config(config)
    , m_params(config::getChainParams(config.networkId))
    , m_selfId(config.participantId)
    , m_store(std::move(store))
    , m_network(network)
    , m_listener(std::move(listener))
    , m_reputation(std::make_shared<network::PeerReputation>())
    , m_participants(config.participants)
    , m_maxCompleted(std::max<uint32_t>(1, config.completedCacheSize))
{
    if (!m_store) {
        throw std::invalid_argument("ShardsManager: part store is null");
    }
    m_strategy = sharding::makeOwnerSelection(config.ownerSelection, m_reputation);
    m_tracker = std::make_unique<RequestTracker>(m_selfId,
                                                 routeBack.empty() ? m_selfId : routeBack,
                                                 m_network, m_strategy, m_reputation,
                                                 trackerOptionsFrom(config));
    m_tracker->setParticipants(m_participants);
    m_tracker->setAbandonCallback([this](const ChunkHash &chunkHash) { onRequestAbandoned(chunkHash); });
    m_pool = std::make_unique<util::ThreadPool>(std::max<uint32_t>(1, config.workerThreads));

    util::logger::info("[ShardsManager] " + m_selfId + " ready on " + m_params.networkID + " (" +
                       std::to_string(m_params.dataParts) + "/" + std::to_string(m_params.totalParts) +
                       " parts, " + std::to_string(m_participants.size()) + " participants, " +
                       m_strategy->name() + " owner selection)");
}

ShardsManager::~ShardsManager()
{
    m_tracker->stopTimer();
    m_pool.reset();
}

ChunkHeader ShardsManager::distributeChunk(const std::vector<uint8_t> &payload,
                                           uint64_t height,
                                           uint32_t shardId,
                                           const ChunkHash &prevBlockHash)
{
    if (payload.size() > m_params.maxChunkBytes) {
        throw std::invalid_argument("distributeChunk: payload of " + std::to_string(payload.size()) +
                                    " bytes exceeds " + std::to_string(m_params.maxChunkBytes));
    }

    core::EncodedChunk encoded = ChunkCodec::encode(payload, m_params.dataParts, m_params.totalParts,
                                                    height, shardId, prevBlockHash);
    const ChunkHash chunkHash = encoded.header.chunkHash();

    m_store->putHeader(encoded.header);
    for (const auto &part : encoded.parts) {
        m_store->put(chunkHash, part.partOrd, part);
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        markCompletedLocked(chunkHash);
    }

    util::logger::info("[ShardsManager] distributed chunk " + shortHex(chunkHash) + " at height " +
                       std::to_string(height) + ", shard " + std::to_string(shardId) + ": " +
                       std::to_string(encoded.parts.size()) + " parts stored");
    return encoded.header;
}

void ShardsManager::processChunkHeader(const ChunkHeader &header, Clock::time_point now)
{
    header.validate();
    const ChunkHash chunkHash = header.chunkHash();
    m_store->putHeader(header);

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_completed.count(chunkHash) != 0 || m_reconstructing.count(chunkHash) != 0) {
            return;
        }
        m_needed.insert(chunkHash);
    }

    std::vector<PartOrd> held = m_store->partOrds(chunkHash);
    if (held.size() >= header.dataParts) {
        maybeReconstruct(header);
        return;
    }

    std::vector<PartOrd> missing;
    for (PartOrd ord = 0; ord < header.totalParts; ++ord) {
        if (!std::binary_search(held.begin(), held.end(), ord)) {
            missing.push_back(ord);
        }
    }
    size_t sent = m_tracker->requestParts(header, missing, now);
    util::logger::info("[ShardsManager] chunk " + shortHex(chunkHash) + ": holding " +
                       std::to_string(held.size()) + "/" + std::to_string(header.dataParts) +
                       " needed parts, requested " + std::to_string(sent));
}

std::optional<network::PartialEncodedChunkResponse>
ShardsManager::processPartialEncodedChunkRequest(const network::PartialEncodedChunkRequest &request)
{
    const ChunkHash &chunkHash = request.chunkHash;
    if (request.routeBack.empty()) {
        util::logger::warn("[ShardsManager] request for chunk " + shortHex(chunkHash) +
                           " has no route-back, dropped");
        return std::nullopt;
    }

    std::vector<std::string> participants = this->participants();
    network::PartialEncodedChunkResponse response;
    response.chunkHash = chunkHash;

    try {
        std::optional<ChunkHeader> header = m_store->getHeader(chunkHash);
        std::set<PartOrd> ords(request.partOrds.begin(), request.partOrds.end());
        for (PartOrd ord : ords) {
            if (header && ord >= header->totalParts) {
                continue;
            }
            std::optional<PartialEncodedPart> part = m_store->get(chunkHash, ord);
            if (part) {
                response.parts.push_back(std::move(*part));
            } else if (!participants.empty() && sharding::ownerOf(chunkHash, ord, participants) == m_selfId) {
                response.unavailableOrds.push_back(ord);
            }
        }
    } catch (const std::exception &e) {
        util::logger::error("[ShardsManager] failed to serve chunk " + shortHex(chunkHash) + ": " + e.what());
        return std::nullopt;
    }

    if (response.empty()) {
        util::logger::debug("[ShardsManager] nothing to serve for chunk " + shortHex(chunkHash));
        return std::nullopt;
    }
    if (!response.unavailableOrds.empty()) {
        util::logger::warn("[ShardsManager] " + std::to_string(response.unavailableOrds.size()) +
                           " owned part(s) of chunk " + shortHex(chunkHash) + " not held locally");
    }

    util::logger::debug("[ShardsManager] serving " + std::to_string(response.parts.size()) +
                        " part(s) of chunk " + shortHex(chunkHash) + " to " + request.routeBack);
    m_network.sendResponse(request.routeBack, response);
    return response;
}

bool ShardsManager::storeVerifiedPart(const ChunkHash &chunkHash, const PartialEncodedPart &part)
{
    try {
        storage::PartStore::PutResult result = m_store->put(chunkHash, part.partOrd, part);
        if (result == storage::PartStore::PutResult::AlreadyPresent) {
            util::logger::debug("[ShardsManager] duplicate part " + std::to_string(part.partOrd) +
                                " of chunk " + shortHex(chunkHash));
        }
        return true;
    } catch (const ChunkError &e) {
        if (e.kind() != ChunkErrorKind::ConflictingPart) {
            throw;
        }
        util::logger::critical("[ShardsManager] integrity violation on chunk " + shortHex(chunkHash) +
                               ", part " + std::to_string(part.partOrd) + ": " + e.what());
        if (m_listener.onIntegrityViolation) {
            m_listener.onIntegrityViolation(chunkHash, part.partOrd, e.what());
        }
        return false;
    }
}

void ShardsManager::processPartialEncodedChunkResponse(const network::PartialEncodedChunkResponse &response,
                                                       const std::string &sender,
                                                       Clock::time_point now)
{
    const ChunkHash &chunkHash = response.chunkHash;
    std::optional<ChunkHeader> header;
    try {
        header = m_store->getHeader(chunkHash);
    } catch (const std::exception &e) {
        util::logger::error("[ShardsManager] header lookup for " + shortHex(chunkHash) + " failed: " + e.what());
        return;
    }
    if (!header) {
        util::logger::warn("[ShardsManager] response from " + sender + " for unknown chunk " +
                           shortHex(chunkHash) + ", dropped");
        return;
    }

    for (const auto &part : response.parts) {
        if (!ChunkCodec::verifyPart(*header, chunkHash, part)) {
            util::logger::warn("[ShardsManager] " + std::string(core::toString(ChunkErrorKind::CorruptPart)) +
                               ": part " + std::to_string(part.partOrd) + " of chunk " +
                               shortHex(chunkHash) + " from " + sender + " failed verification");
            m_reputation->penalizeCorrupt(sender);
            m_tracker->onPartRejected(chunkHash, part.partOrd, sender, now);
            continue;
        }

        bool stored = false;
        try {
            stored = storeVerifiedPart(chunkHash, part);
        } catch (const std::exception &e) {
            util::logger::error("[ShardsManager] storing part " + std::to_string(part.partOrd) +
                                " of chunk " + shortHex(chunkHash) + " failed: " + e.what());
            continue;
        }
        if (stored) {
            m_tracker->onPartSatisfied(chunkHash, part.partOrd);
        }
    }

    for (PartOrd ord : response.unavailableOrds) {
        m_reputation->penalizeMiss(sender);
        m_tracker->onPartUnavailable(chunkHash, ord, sender, now);
    }

    maybeReconstruct(*header);
}

void ShardsManager::maybeReconstruct(const ChunkHeader &header)
{
    const ChunkHash chunkHash = header.chunkHash();
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_needed.count(chunkHash) == 0 || m_completed.count(chunkHash) != 0 ||
            m_reconstructing.count(chunkHash) != 0) {
            return;
        }
        size_t held = 0;
        try {
            held = m_store->partCount(chunkHash);
        } catch (const std::exception &e) {
            util::logger::error("[ShardsManager] part count for " + shortHex(chunkHash) + " failed: " + e.what());
            return;
        }
        if (held < header.dataParts) {
            return;
        }
        m_reconstructing.insert(chunkHash);
    }

    m_tracker->cancelChunk(chunkHash);
    util::logger::debug("[ShardsManager] enough parts for chunk " + shortHex(chunkHash) +
                        ", queueing reconstruction");
    try {
        m_pool->post([this, header]() { reconstruct(header); });
    } catch (const std::exception &e) {
        util::logger::error("[ShardsManager] cannot queue reconstruction: " + std::string(e.what()));
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_reconstructing.erase(chunkHash);
    }
}

void ShardsManager::reconstruct(const ChunkHeader &header)
{
    const ChunkHash chunkHash = header.chunkHash();
    std::vector<uint8_t> payload;
    bool ok = false;
    try {
        payload = ChunkCodec::decode(header, m_store->getParts(chunkHash));
        ok = true;
    } catch (const std::exception &e) {
        util::logger::error("[ShardsManager] reconstruction of chunk " + shortHex(chunkHash) +
                            " failed: " + e.what());
    }

    if (ok) {
        try {
            storeOwnedParts(header, payload);
        } catch (const std::exception &e) {
            util::logger::warn("[ShardsManager] could not persist owned parts of chunk " +
                               shortHex(chunkHash) + ": " + e.what());
        }
    }

    bool notify = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_reconstructing.erase(chunkHash);
        if (ok) {
            notify = markCompletedLocked(chunkHash);
        } else {
            notify = m_needed.count(chunkHash) != 0;
        }
        m_needed.erase(chunkHash);
    }
    if (!notify) {
        return;
    }

    try {
        if (ok) {
            util::logger::info("[ShardsManager] chunk " + shortHex(chunkHash) + " complete (" +
                               std::to_string(payload.size()) + " bytes)");
            if (m_listener.onChunkComplete) {
                m_listener.onChunkComplete(chunkHash, payload);
            }
        } else if (m_listener.onChunkUnavailable) {
            m_listener.onChunkUnavailable(chunkHash);
        }
    } catch (const std::exception &e) {
        util::logger::error("[ShardsManager] chain listener threw for chunk " + shortHex(chunkHash) +
                            ": " + e.what());
    }
}

void ShardsManager::storeOwnedParts(const ChunkHeader &header, const std::vector<uint8_t> &payload)
{
    std::vector<std::string> participants = this->participants();
    if (participants.empty()) {
        return;
    }
    const ChunkHash chunkHash = header.chunkHash();
    std::vector<PartOrd> owned = sharding::ownedParts(chunkHash, header.totalParts, m_selfId, participants);
    if (owned.empty()) {
        return;
    }

    core::EncodedChunk encoded = ChunkCodec::encode(payload, header.dataParts, header.totalParts,
                                                    header.height, header.shardId, header.prevBlockHash);
    if (encoded.header != header) {
        util::logger::error("[ShardsManager] re-encoding chunk " + shortHex(chunkHash) +
                            " does not reproduce its header, owned parts not stored");
        return;
    }
    size_t added = 0;
    for (PartOrd ord : owned) {
        if (storeVerifiedPart(chunkHash, encoded.parts[ord])) {
            ++added;
        }
    }
    util::logger::debug("[ShardsManager] chunk " + shortHex(chunkHash) + ": " + std::to_string(added) +
                        " owned part(s) persisted");
}

void ShardsManager::onRequestAbandoned(const ChunkHash &chunkHash)
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        // A reconstruction already under way is left to finish.
        if (m_reconstructing.count(chunkHash) != 0 || m_completed.count(chunkHash) != 0) {
            return;
        }
        if (m_needed.erase(chunkHash) == 0) {
            return;
        }
    }
    util::logger::warn("[ShardsManager] " + std::string(core::toString(ChunkErrorKind::RequestAbandoned)) +
                       ": chunk " + shortHex(chunkHash) + " is not currently available");
    if (m_listener.onChunkUnavailable) {
        try {
            m_listener.onChunkUnavailable(chunkHash);
        } catch (const std::exception &e) {
            util::logger::error("[ShardsManager] chain listener threw for chunk " + shortHex(chunkHash) +
                                ": " + e.what());
        }
    }
}

bool ShardsManager::handleMessage(const network::ProtocolMessage &msg, const std::string &sender)
{
    try {
        if (msg.type == network::kPartialChunkRequestType) {
            processPartialEncodedChunkRequest(network::decodeRequest(msg));
            return true;
        }
        if (msg.type == network::kPartialChunkResponseType) {
            processPartialEncodedChunkResponse(network::decodeResponse(msg), sender);
            return true;
        }
        util::logger::warn("[ShardsManager] unknown message type from " + sender + ": " + msg.type);
    } catch (const std::runtime_error &e) {
        util::logger::warn("[ShardsManager] malformed " + msg.type + " from " + sender + ": " + e.what());
    }
    return false;
}

void ShardsManager::updateParticipants(const std::vector<std::string> &participants)
{
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_participants = participants;
    }
    m_tracker->setParticipants(participants);
    util::logger::info("[ShardsManager] participant set updated (" + std::to_string(participants.size()) +
                       " members)");
}

std::vector<std::string> ShardsManager::participants() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_participants;
}

void ShardsManager::tick(Clock::time_point now)
{
    m_tracker->tick(now);
}

bool ShardsManager::startTimer()
{
    return m_tracker->startTimer(std::chrono::milliseconds(m_config.trackerTickMs));
}

bool ShardsManager::stopTimer()
{
    return m_tracker->stopTimer();
}

void ShardsManager::waitForIdle()
{
    m_pool->waitIdle();
}

bool ShardsManager::isComplete(const ChunkHash &chunkHash) const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_completed.count(chunkHash) != 0;
}

size_t ShardsManager::completedCount() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_completed.size();
}

bool ShardsManager::markCompletedLocked(const ChunkHash &chunkHash)
{
    if (!m_completed.insert(chunkHash).second) {
        return false;
    }
    m_completedOrder.push_back(chunkHash);
    while (m_completedOrder.size() > m_maxCompleted) {
        m_completed.erase(m_completedOrder.front());
        m_completedOrder.pop_front();
    }
    return true;
}

bool ShardsManager::isOwner(const ChunkHash &chunkHash, PartOrd ord) const
{
    std::vector<std::string> participants = this->participants();
    return !participants.empty() && sharding::ownerOf(chunkHash, ord, participants) == m_selfId;
}

} // namespace chunks
} // namespace shardavail
