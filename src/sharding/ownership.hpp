#ifndef SHARDAVAIL_SHARDING_OWNERSHIP_HPP
#define SHARDAVAIL_SHARDING_OWNERSHIP_HPP

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/chunk_types.hpp"
#include "util/hashing.hpp"

/**
 * @file ownership.hpp
 * @brief Deterministic assignment of chunk parts to participants.
 *
 * DESIGN:
 *   - Rendezvous (highest random weight) hashing: every participant scores
 *     sha256(chunkHash || partOrd || participantId); the highest score owns
 *     the part. Ties on the digest are broken by the smaller participant id.
 *   - Pure function of (chunkHash, partOrd, participant set): every node that
 *     agrees on the set agrees on the owner, and the order of the input list
 *     does not matter.
 *   - When a participant leaves, only the parts it owned move.
 *   - rankedOwners() gives the full preference order; entry 0 is ownerOf().
 *     Alternate-owner strategies walk this list.
 *
 * USAGE:
 *   @code
 *   using namespace shardavail::sharding;
 *   std::string owner = ownerOf(header.chunkHash(), 3, participants);
 *   @endcode
 */

namespace shardavail {
namespace sharding {

using ParticipantId = std::string;

/**
 * @brief Rendezvous weight of one participant for one part.
 */
inline util::hashing::Hash ownershipWeight(const core::ChunkHash &chunkHash,
                                           core::PartOrd partOrd,
                                           const ParticipantId &participant)
{
    util::hashing::Sha256Builder builder;
    builder.update(chunkHash);
    builder.updateU64(partOrd);
    builder.update(participant);
    return builder.finish();
}

/**
 * @brief All participants ordered by preference for (chunkHash, partOrd).
 * @throw std::invalid_argument if participants is empty.
 */
inline std::vector<ParticipantId> rankedOwners(const core::ChunkHash &chunkHash,
                                               core::PartOrd partOrd,
                                               const std::vector<ParticipantId> &participants)
{
    if (participants.empty()) {
        throw std::invalid_argument("rankedOwners: participant set is empty");
    }

    std::vector<std::pair<util::hashing::Hash, ParticipantId>> scored;
    scored.reserve(participants.size());
    for (const auto &p : participants) {
        scored.emplace_back(ownershipWeight(chunkHash, partOrd, p), p);
    }
    std::sort(scored.begin(), scored.end(),
              [](const auto &a, const auto &b) {
                  if (a.first != b.first) {
                      return a.first > b.first;
                  }
                  return a.second < b.second;
              });

    std::vector<ParticipantId> out;
    out.reserve(scored.size());
    for (auto &entry : scored) {
        // A participant listed twice keeps its first (best) slot only.
        if (std::find(out.begin(), out.end(), entry.second) == out.end()) {
            out.push_back(std::move(entry.second));
        }
    }
    return out;
}

/**
 * @brief The participant responsible for holding part partOrd of chunkHash.
 * @throw std::invalid_argument if participants is empty.
 */
inline ParticipantId ownerOf(const core::ChunkHash &chunkHash,
                             core::PartOrd partOrd,
                             const std::vector<ParticipantId> &participants)
{
    if (participants.empty()) {
        throw std::invalid_argument("ownerOf: participant set is empty");
    }

    const ParticipantId *best = nullptr;
    util::hashing::Hash bestWeight{};
    for (const auto &p : participants) {
        util::hashing::Hash w = ownershipWeight(chunkHash, partOrd, p);
        if (!best || w > bestWeight || (w == bestWeight && p < *best)) {
            best = &p;
            bestWeight = w;
        }
    }
    return *best;
}

/**
 * @brief Part ordinals of a chunk that `participant` owns.
 */
inline std::vector<core::PartOrd> ownedParts(const core::ChunkHash &chunkHash,
                                             uint32_t totalParts,
                                             const ParticipantId &participant,
                                             const std::vector<ParticipantId> &participants)
{
    std::vector<core::PartOrd> owned;
    for (core::PartOrd ord = 0; ord < totalParts; ++ord) {
        if (ownerOf(chunkHash, ord, participants) == participant) {
            owned.push_back(ord);
        }
    }
    return owned;
}

} // namespace sharding
} // namespace shardavail

#endif // SHARDAVAIL_SHARDING_OWNERSHIP_HPP
