#ifndef SHARDAVAIL_CONFIG_CHAINPARAMS_HPP
#define SHARDAVAIL_CONFIG_CHAINPARAMS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @file chainparams.hpp
 * @brief Network-level parameters that every node of a network must agree on:
 *        how chunks are erasure-coded and how large they may be.
 *
 * Example usage:
 *  @code
 *    auto params = shardavail::config::getChainParams("testnet");
 *    codec.encode(payload, params.dataParts, params.totalParts, ...);
 *  @endcode
 */

namespace shardavail {
namespace config {

/**
 * @struct ChainParams
 * @brief Erasure parameters per network. Invariant: 0 < dataParts <= totalParts <= 255.
 */
struct ChainParams
{
    // Identifies the network type: "mainnet", "testnet", "devnet".
    std::string networkID;

    // Parts produced per chunk.
    uint32_t totalParts;

    // Parts needed to reconstruct a chunk; roughly a third of totalParts so that
    // a chunk survives two thirds of its owners being unreachable.
    uint32_t dataParts;

    // Upper bound on an encoded chunk payload, in bytes.
    uint64_t maxChunkBytes;
};

inline ChainParams getMainnetParams()
{
    ChainParams cp;
    cp.networkID     = "mainnet";
    cp.totalParts    = 100;
    cp.dataParts     = 33;
    cp.maxChunkBytes = 16ull * 1024 * 1024;
    return cp;
}

inline ChainParams getTestnetParams()
{
    ChainParams cp;
    cp.networkID     = "testnet";
    cp.totalParts    = 30;
    cp.dataParts     = 10;
    cp.maxChunkBytes = 4ull * 1024 * 1024;
    return cp;
}

/**
 * @brief Small local network; few enough parts to follow in logs.
 */
inline ChainParams getDevnetParams()
{
    ChainParams cp;
    cp.networkID     = "devnet";
    cp.totalParts    = 6;
    cp.dataParts     = 2;
    cp.maxChunkBytes = 1024 * 1024;
    return cp;
}

/**
 * @throw std::runtime_error for an unknown network id.
 */
inline ChainParams getChainParams(const std::string &networkId)
{
    if (networkId == "mainnet") return getMainnetParams();
    if (networkId == "testnet") return getTestnetParams();
    if (networkId == "devnet")  return getDevnetParams();
    throw std::runtime_error("getChainParams: unknown network id '" + networkId + "'");
}

} // namespace config
} // namespace shardavail

#endif // SHARDAVAIL_CONFIG_CHAINPARAMS_HPP
