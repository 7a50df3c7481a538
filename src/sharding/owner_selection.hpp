#ifndef SHARDAVAIL_SHARDING_OWNER_SELECTION_HPP
#define SHARDAVAIL_SHARDING_OWNER_SELECTION_HPP

#include <algorithm>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/chunk_types.hpp"
#include "network/peer_reputation.hpp"
#include "sharding/ownership.hpp"

/*
  OwnerSelectionStrategy
  --------------------------------
  Decides whom to ask for a part. Attempt 0 is always the first ranked owner
  that is not excluded; later attempts (after a timeout, a corrupt part or an
  "unavailable" marker) pick an alternate according to the strategy.

  Required Methods:
    std::optional<ParticipantId> selectOwner(chunkHash, partOrd, ranked, excluded, attempt)

  Contract:
   - `ranked` is rankedOwners() for the part, never empty.
   - `excluded` holds peers that must not be chosen (self, already-tried
     owners, banned peers). When every candidate is excluded the strategy
     returns std::nullopt and the caller decides whether to reset the
     exclusion set.
*/

namespace shardavail {
namespace sharding {

class OwnerSelectionStrategy
{
public:
    virtual ~OwnerSelectionStrategy() = default;

    virtual std::optional<ParticipantId> selectOwner(const core::ChunkHash &chunkHash,
                                                     core::PartOrd partOrd,
                                                     const std::vector<ParticipantId> &ranked,
                                                     const std::set<ParticipantId> &excluded,
                                                     uint32_t attempt) = 0;

    virtual const char* name() const = 0;
};

/**
 * @brief Walks the ranked list from the primary owner; attempt n starts n
 *        positions further along and takes the first non-excluded peer.
 */
class RoundRobinSelection : public OwnerSelectionStrategy
{
public:
    std::optional<ParticipantId> selectOwner(const core::ChunkHash &,
                                             core::PartOrd,
                                             const std::vector<ParticipantId> &ranked,
                                             const std::set<ParticipantId> &excluded,
                                             uint32_t attempt) override
    {
        if (ranked.empty()) {
            return std::nullopt;
        }
        const size_t n = ranked.size();
        for (size_t i = 0; i < n; ++i) {
            const ParticipantId &candidate = ranked[(attempt + i) % n];
            if (excluded.count(candidate) == 0) {
                return candidate;
            }
        }
        return std::nullopt;
    }

    const char* name() const override { return "round_robin"; }
};

/**
 * @brief Uniform pick among non-excluded peers; attempt 0 still goes to the
 *        primary owner when it is available.
 */
class RandomSelection : public OwnerSelectionStrategy
{
public:
    explicit RandomSelection(uint64_t seed = std::random_device{}())
        : rng_(seed)
    {
    }

    std::optional<ParticipantId> selectOwner(const core::ChunkHash &,
                                             core::PartOrd,
                                             const std::vector<ParticipantId> &ranked,
                                             const std::set<ParticipantId> &excluded,
                                             uint32_t attempt) override
    {
        std::vector<const ParticipantId*> candidates;
        for (const auto &p : ranked) {
            if (excluded.count(p) == 0) {
                candidates.push_back(&p);
            }
        }
        if (candidates.empty()) {
            return std::nullopt;
        }
        if (attempt == 0) {
            return *candidates.front();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
        return *candidates[dist(rng_)];
    }

    const char* name() const override { return "random"; }

private:
    std::mt19937_64 rng_;
    std::mutex mutex_;
};

/**
 * @brief Lowest penalty score wins; ranking order breaks ties, so with a
 *        clean reputation this behaves like picking the primary owner.
 */
class ReputationWeightedSelection : public OwnerSelectionStrategy
{
public:
    explicit ReputationWeightedSelection(std::shared_ptr<network::PeerReputation> reputation)
        : reputation_(std::move(reputation))
    {
        if (!reputation_) {
            throw std::invalid_argument("ReputationWeightedSelection: reputation tracker is null");
        }
    }

    std::optional<ParticipantId> selectOwner(const core::ChunkHash &,
                                             core::PartOrd,
                                             const std::vector<ParticipantId> &ranked,
                                             const std::set<ParticipantId> &excluded,
                                             uint32_t) override
    {
        std::optional<ParticipantId> best;
        double bestScore = 0.0;
        for (const auto &p : ranked) {
            if (excluded.count(p) != 0) {
                continue;
            }
            double s = reputation_->score(p);
            if (!best || s < bestScore) {
                best = p;
                bestScore = s;
            }
        }
        return best;
    }

    const char* name() const override { return "reputation"; }

private:
    std::shared_ptr<network::PeerReputation> reputation_;
};

/**
 * @brief Build the strategy named in NodeConfig::ownerSelection.
 * @throw std::invalid_argument on an unknown name.
 */
inline std::unique_ptr<OwnerSelectionStrategy>
makeOwnerSelection(const std::string &name, std::shared_ptr<network::PeerReputation> reputation)
{
    if (name == "round_robin") {
        return std::make_unique<RoundRobinSelection>();
    }
    if (name == "random") {
        return std::make_unique<RandomSelection>();
    }
    if (name == "reputation") {
        return std::make_unique<ReputationWeightedSelection>(std::move(reputation));
    }
    throw std::invalid_argument("makeOwnerSelection: unknown strategy '" + name + "'");
}

} // namespace sharding
} // namespace shardavail

#endif // SHARDAVAIL_SHARDING_OWNER_SELECTION_HPP
