#include <algorithm>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "chunks/shards_manager.hpp"
#include "network/network_adapter.hpp"
#include "storage/part_store.hpp"
#include "util/config_parser.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace {

using shardavail::chunks::ChainListener;
using shardavail::chunks::ShardsManager;
using shardavail::config::NodeConfig;
using shardavail::network::QueueNetworkAdapter;
using shardavail::network::RouteBackRegistry;
using shardavail::storage::PartStore;
namespace logger = shardavail::util::logger;

// One in-process node: its store, its outbound queue and the manager on top.
struct DemoNode
{
    NodeConfig config;
    std::string routeBack;
    std::shared_ptr<PartStore> store;
    QueueNetworkAdapter outbox;
    std::unique_ptr<ShardsManager> manager;
    std::vector<uint8_t> completedPayload;
};

void startNode(DemoNode &node, const ChainListener &listener)
{
    node.store = std::make_shared<PartStore>(node.config.partStorePath());
    node.manager = std::make_unique<ShardsManager>(node.config, node.store, node.outbox, listener,
                                                   node.routeBack);
}

void stopNode(DemoNode &node)
{
    node.manager.reset();
    node.store.reset();
    node.outbox.clear();
}

// Deliver queued traffic until every outbox is empty.
size_t pumpMessages(std::map<std::string, DemoNode*> &nodes, const RouteBackRegistry &routes)
{
    size_t delivered = 0;
    bool progress = true;
    while (progress) {
        progress = false;
        for (auto &entry : nodes) {
            DemoNode &from = *entry.second;
            while (auto msg = from.outbox.pop()) {
                progress = true;
                std::string target = msg->destination;
                if (msg->isResponse()) {
                    auto resolved = routes.resolve(msg->destination);
                    if (!resolved) {
                        logger::warn("[main] unknown route-back " + msg->destination);
                        continue;
                    }
                    target = *resolved;
                }
                auto it = nodes.find(target);
                if (it == nodes.end() || !it->second->manager) {
                    logger::debug("[main] " + target + " is offline, message dropped");
                    continue;
                }
                // Through the gateway framing and back, as a socket would carry it.
                auto frame = shardavail::network::encodeFrame(msg->message);
                it->second->manager->handleMessage(shardavail::network::decodeFrame(frame), entry.first);
                ++delivered;
            }
        }
    }
    return delivered;
}

} // namespace

int main(int argc, char** argv)
{
    logger::setLogLevel(logger::LogLevel::INFO);
    logger::info("[main] shardavail node starting...");

    try {
        // 1. Parse configuration
        NodeConfig baseConfig;
        shardavail::util::ConfigParser configParser(baseConfig);
        std::string configPath = "shardavail_node.conf";
        if (argc > 1) {
            configPath = argv[1];
        }
        configParser.loadFromFile(configPath);

        logger::setLogLevel(logger::parseLogLevel(baseConfig.logLevel));
        if (!baseConfig.logFile.empty() && !logger::enableFileOutput(baseConfig.logFile)) {
            logger::warn("[main] could not open log file " + baseConfig.logFile);
        }
        std::filesystem::create_directories(baseConfig.dataDirectory);

        // 2. Two nodes sharing one participant set
        const std::string producerId = baseConfig.participantId;
        const std::string fetcherId = baseConfig.participantId + "-fetcher";
        std::vector<std::string> participants = baseConfig.participants;
        for (const auto &id : {producerId, fetcherId}) {
            if (std::find(participants.begin(), participants.end(), id) == participants.end()) {
                participants.push_back(id);
            }
        }

        RouteBackRegistry routes;
        DemoNode producer;
        DemoNode fetcher;
        for (DemoNode *node : {&producer, &fetcher}) {
            node->config = baseConfig;
            node->config.participants = participants;
        }
        producer.config.participantId = producerId;
        producer.config.partStoreFile = producerId + "-" + baseConfig.partStoreFile;
        fetcher.config.participantId = fetcherId;
        fetcher.config.partStoreFile = fetcherId + "-" + baseConfig.partStoreFile;
        std::filesystem::remove(fetcher.config.partStorePath());
        producer.routeBack = routes.issue(producerId);
        fetcher.routeBack = routes.issue(fetcherId);

        std::map<std::string, DemoNode*> nodes{{producerId, &producer}, {fetcherId, &fetcher}};

        ChainListener producerListener;
        ChainListener fetcherListener;
        fetcherListener.onChunkComplete = [&fetcher](const shardavail::core::ChunkHash &hash,
                                                     const std::vector<uint8_t> &payload) {
            logger::info("[main] fetcher reconstructed chunk " + shardavail::util::hashing::shortHex(hash));
            fetcher.completedPayload = payload;
        };
        fetcherListener.onChunkUnavailable = [](const shardavail::core::ChunkHash &hash) {
            logger::warn("[main] chunk " + shardavail::util::hashing::shortHex(hash) + " unavailable");
        };

        startNode(producer, producerListener);
        startNode(fetcher, fetcherListener);

        // 3. Produce a chunk and let the fetcher collect it
        std::string text = "shardavail sample chunk payload: ";
        while (text.size() < 4096) {
            text += "the quick brown fox jumps over the lazy dog. ";
        }
        std::vector<uint8_t> payload(text.begin(), text.end());
        shardavail::core::ChunkHeader header = producer.manager->distributeChunk(payload, 1, 0);

        fetcher.manager->processChunkHeader(header);
        size_t delivered = pumpMessages(nodes, routes);
        fetcher.manager->waitForIdle();
        logger::info("[main] " + std::to_string(delivered) + " message(s) delivered");

        if (fetcher.completedPayload != payload) {
            logger::error("[main] fetcher did not reconstruct the chunk");
            return 1;
        }

        // 4. Restart the producer; a fresh fetcher must still be served
        logger::info("[main] restarting producer...");
        stopNode(producer);
        stopNode(fetcher);
        std::filesystem::remove(fetcher.config.partStorePath());
        fetcher.completedPayload.clear();
        startNode(producer, producerListener);
        startNode(fetcher, fetcherListener);

        fetcher.manager->processChunkHeader(header);
        pumpMessages(nodes, routes);
        fetcher.manager->waitForIdle();

        if (fetcher.completedPayload != payload) {
            logger::error("[main] chunk could not be fetched after producer restart");
            return 1;
        }
        logger::info("[main] chunk served identically after restart.");

        stopNode(fetcher);
        stopNode(producer);
    } catch (const std::exception &e) {
        logger::critical(std::string("[main] fatal: ") + e.what());
        return 1;
    }

    logger::info("[main] shardavail node exiting.");
    logger::disableFileOutput();
    return 0;
}
