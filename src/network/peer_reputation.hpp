#ifndef SHARDAVAIL_NETWORK_PEER_REPUTATION_HPP
#define SHARDAVAIL_NETWORK_PEER_REPUTATION_HPP

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include "util/logger.hpp"

/**
 * @file peer_reputation.hpp
 * @brief Penalty bookkeeping for peers that serve bad or no parts.
 *
 * DESIGN:
 *   1. Each peer has a penalty score, starting at 0.
 *   2. A part that fails its Merkle proof costs kCorruptPenalty; a timeout or
 *      an explicit "unavailable" marker costs the much smaller kMissPenalty.
 *   3. Scores decay linearly at decayPerSecond, so an honest peer that had a
 *      bad moment recovers.
 *   4. A peer whose score is at or above banThreshold is banned; owner
 *      selection skips banned peers while there is anyone else to ask.
 *
 * USAGE:
 *   @code
 *   PeerReputation rep;
 *   rep.penalizeCorrupt("node3");
 *   if (!rep.isBanned("node3")) { ... }
 *   @endcode
 */

namespace shardavail {
namespace network {

class PeerReputation
{
public:
    using Clock = std::chrono::steady_clock;

    static constexpr double kCorruptPenalty = 50.0;
    static constexpr double kMissPenalty = 5.0;

    PeerReputation(double banThreshold = 100.0, double decayPerSecond = 1.0)
        : banThreshold_(banThreshold)
        , decayPerSecond_(decayPerSecond)
    {
    }

    /**
     * @brief The peer served a part that failed verification.
     */
    void penalizeCorrupt(const std::string &peer, Clock::time_point now = Clock::now())
    {
        penalize(peer, kCorruptPenalty, "corrupt part", now);
    }

    /**
     * @brief The peer timed out or reported an owned part as unavailable.
     */
    void penalizeMiss(const std::string &peer, Clock::time_point now = Clock::now())
    {
        penalize(peer, kMissPenalty, "missed request", now);
    }

    /**
     * @brief Current decayed score; unknown peers score 0.
     */
    double score(const std::string &peer, Clock::time_point now = Clock::now())
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(peer);
        if (it == records_.end()) {
            return 0.0;
        }
        decay(it->second, now);
        return it->second.score;
    }

    bool isBanned(const std::string &peer, Clock::time_point now = Clock::now())
    {
        return score(peer, now) >= banThreshold_;
    }

    void forget(const std::string &peer)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.erase(peer);
    }

    double banThreshold() const { return banThreshold_; }

private:
    struct Record
    {
        double score{0.0};
        Clock::time_point lastUpdate;
    };

    void penalize(const std::string &peer, double amount, const char *reason, Clock::time_point now)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(peer);
        if (it == records_.end()) {
            Record rec;
            rec.lastUpdate = now;
            it = records_.emplace(peer, rec).first;
        }
        Record &rec = it->second;
        decay(rec, now);
        bool wasBanned = rec.score >= banThreshold_;
        rec.score += amount;

        util::logger::debug("[PeerReputation] " + peer + " penalized for " + reason +
                            ", score=" + std::to_string(rec.score));
        if (!wasBanned && rec.score >= banThreshold_) {
            util::logger::warn("[PeerReputation] " + peer + " banned (score " +
                               std::to_string(rec.score) + ")");
        }
    }

    void decay(Record &rec, Clock::time_point now)
    {
        if (now <= rec.lastUpdate) {
            return;
        }
        double elapsed = std::chrono::duration<double>(now - rec.lastUpdate).count();
        rec.score -= elapsed * decayPerSecond_;
        if (rec.score < 0.0) {
            rec.score = 0.0;
        }
        rec.lastUpdate = now;
    }

    double banThreshold_;
    double decayPerSecond_;
    std::unordered_map<std::string, Record> records_;
    std::mutex mutex_;
};

} // namespace network
} // namespace shardavail

#endif // SHARDAVAIL_NETWORK_PEER_REPUTATION_HPP
