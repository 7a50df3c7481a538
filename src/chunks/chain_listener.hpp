#ifndef SHARDAVAIL_CHUNKS_CHAIN_LISTENER_HPP
#define SHARDAVAIL_CHUNKS_CHAIN_LISTENER_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/chunk_types.hpp"

namespace shardavail {
namespace chunks {

/**
 * @struct ChainListener
 * @brief Callbacks into the chain layer. Any slot may be left empty.
 *
 *  - onChunkComplete: the payload was reconstructed; fires at most once per
 *    chunk while the node remembers it as complete (the most recent
 *    completedCacheSize chunks). Runs on a worker thread.
 *  - onChunkUnavailable: the chunk could not be completed (retry ceiling hit
 *    or reconstruction failed). The chain layer may ask again later.
 *  - onIntegrityViolation: a verified part conflicted with different stored
 *    bytes under the same key. Never expected from honest peers.
 */
struct ChainListener
{
    std::function<void(const core::ChunkHash&, const std::vector<uint8_t>&)> onChunkComplete;
    std::function<void(const core::ChunkHash&)> onChunkUnavailable;
    std::function<void(const core::ChunkHash&, core::PartOrd, const std::string&)> onIntegrityViolation;
};

} // namespace chunks
} // namespace shardavail

#endif // SHARDAVAIL_CHUNKS_CHAIN_LISTENER_HPP
