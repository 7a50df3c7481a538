#ifndef SHARDAVAIL_CONFIG_NODE_CONFIG_HPP
#define SHARDAVAIL_CONFIG_NODE_CONFIG_HPP

#include <cstdint>
#include <string>
#include <vector>

/**
 * @file node_config.hpp
 * @brief Local settings of a single shardavail node.
 *
 * USAGE:
 *   - Populated manually or through util/config_parser.hpp
 *   - Chain-wide erasure parameters live in chainparams.hpp, selected by networkId
 */

namespace shardavail {
namespace config {

/**
 * @struct NodeConfig
 * @brief Holds the local configuration for one node:
 *   - identity (nodeName, participantId) and the participant set it starts with
 *   - where the durable part store lives
 *   - request timeout / retry policy for missing parts
 *   - worker and logging settings
 */
struct NodeConfig
{
    NodeConfig()
        : nodeName("shardavail_node"),
          participantId("node0"),
          networkId("devnet"),
          dataDirectory("./shardavail_data"),
          partStoreFile("parts.sqlite"),
          requestTimeoutMs(1000),
          retryCeiling(3),
          trackerTickMs(100),
          workerThreads(2),
          completedCacheSize(65536),
          ownerSelection("round_robin"),
          logLevel("info"),
          logFile()
    {
    }

    /// A friendly name used in logs.
    std::string nodeName;

    /// This node's id inside the participant set; ownership is computed over these ids.
    std::string participantId;

    /// Selects ChainParams ("mainnet", "testnet", "devnet").
    std::string networkId;

    /// Root directory for node data.
    std::string dataDirectory;

    /// SQLite file holding chunk headers and parts; relative paths resolve under dataDirectory.
    std::string partStoreFile;

    /// How long a part request may stay unanswered before it is retried.
    uint32_t requestTimeoutMs;

    /// Number of timeouts after which a chunk request is abandoned.
    uint32_t retryCeiling;

    /// Period of the request tracker timer.
    uint32_t trackerTickMs;

    /// Worker threads used for chunk reconstruction.
    uint32_t workerThreads;

    /// How many completed chunk ids are remembered; the oldest are forgotten first.
    uint32_t completedCacheSize;

    /// Alternate-owner policy: "round_robin", "random" or "reputation".
    std::string ownerSelection;

    /// Minimum log level ("debug", "info", "warn", "error", "critical").
    std::string logLevel;

    /// Optional log file mirrored alongside console output.
    std::string logFile;

    /// Known participants (ids), including this node.
    std::vector<std::string> participants;

    /**
     * @brief Full path of the part store database.
     */
    std::string partStorePath() const
    {
        if (!partStoreFile.empty() && partStoreFile.front() == '/') {
            return partStoreFile;
        }
        if (dataDirectory.empty()) {
            return partStoreFile;
        }
        return dataDirectory + "/" + partStoreFile;
    }
};

} // namespace config
} // namespace shardavail

#endif // SHARDAVAIL_CONFIG_NODE_CONFIG_HPP
