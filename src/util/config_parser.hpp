#ifndef SHARDAVAIL_UTIL_CONFIG_PARSER_HPP
#define SHARDAVAIL_UTIL_CONFIG_PARSER_HPP

#include <cstdint>
#include <fstream>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "config/node_config.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" node configuration into NodeConfig.
 *
 * DESIGN GOALS:
 *   - One setting per line, '#' starts a comment line, whitespace around keys
 *     and values is ignored.
 *   - Unknown keys are logged and skipped so older nodes accept newer files.
 *   - Malformed lines and bad numbers are errors: a node must not start with a
 *     retry policy it did not ask for.
 *
 * USAGE:
 *   @code
 *   shardavail::config::NodeConfig nodeConfig;
 *   shardavail::util::ConfigParser parser(nodeConfig);
 *   parser.loadFromFile("shardavail_node.conf");
 *   @endcode
 *
 * Example file:
 *   participantId = node1
 *   participants  = node0, node1, node2
 *   requestTimeoutMs = 500
 *   retryCeiling = 3
 */

namespace shardavail {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(shardavail::config::NodeConfig &nodeConfig)
        : nodeConfig_(nodeConfig)
    {
    }

    /**
     * @brief Parse the file line by line into the referenced NodeConfig.
     * @return false if the file does not exist (defaults stay in place).
     * @throw std::runtime_error on malformed lines or values.
     */
    bool loadFromFile(const std::string &filepath)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found, using defaults: " + filepath);
            return false;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);
        std::stringstream buffer;
        buffer << inFile.rdbuf();
        parseLines(buffer.str());
        logger::info("[ConfigParser] Config loaded.");
        return true;
    }

    /**
     * @brief Same as loadFromFile but from an in-memory string.
     */
    void loadFromString(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        parseLines(text);
    }

    /**
     * @brief Split a comma-separated list, trimming each entry and dropping empties.
     */
    static std::vector<std::string> splitList(const std::string &val)
    {
        std::vector<std::string> out;
        std::stringstream ss(val);
        std::string item;
        while (std::getline(ss, item, ',')) {
            trim(item);
            if (!item.empty()) {
                out.push_back(item);
            }
        }
        return out;
    }

private:
    shardavail::config::NodeConfig &nodeConfig_;
    std::mutex mutex_;

    void parseLines(const std::string &text)
    {
        std::istringstream in(text);
        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw std::runtime_error("ConfigParser: line " + std::to_string(lineNo) +
                                         " has no '=': " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw std::runtime_error("ConfigParser: line " + std::to_string(lineNo) +
                                         " has an empty key");
            }
            applyKeyValue(key, val);
        }
    }

    void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "nodeName") {
            nodeConfig_.nodeName = val;
        }
        else if (key == "participantId") {
            nodeConfig_.participantId = val;
        }
        else if (key == "networkId") {
            nodeConfig_.networkId = val;
        }
        else if (key == "dataDirectory") {
            nodeConfig_.dataDirectory = val;
        }
        else if (key == "partStoreFile") {
            nodeConfig_.partStoreFile = val;
        }
        else if (key == "requestTimeoutMs") {
            nodeConfig_.requestTimeoutMs = parseU32(key, val);
        }
        else if (key == "retryCeiling") {
            nodeConfig_.retryCeiling = parseU32(key, val);
            if (nodeConfig_.retryCeiling == 0) {
                throw std::runtime_error("ConfigParser: retryCeiling must be at least 1");
            }
        }
        else if (key == "trackerTickMs") {
            nodeConfig_.trackerTickMs = parseU32(key, val);
        }
        else if (key == "workerThreads") {
            nodeConfig_.workerThreads = parseU32(key, val);
        }
        else if (key == "completedCacheSize") {
            nodeConfig_.completedCacheSize = parseU32(key, val);
            if (nodeConfig_.completedCacheSize == 0) {
                throw std::runtime_error("ConfigParser: completedCacheSize must be at least 1");
            }
        }
        else if (key == "ownerSelection") {
            if (val != "round_robin" && val != "random" && val != "reputation") {
                throw std::runtime_error("ConfigParser: unknown ownerSelection '" + val + "'");
            }
            nodeConfig_.ownerSelection = val;
        }
        else if (key == "logLevel") {
            // Validate eagerly; the value is applied by the caller.
            logger::parseLogLevel(val);
            nodeConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            nodeConfig_.logFile = val;
        }
        else if (key == "participants") {
            nodeConfig_.participants = splitList(val);
        }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    static void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        s.erase(s.find_last_not_of(whitespace) + 1);
    }

    static uint32_t parseU32(const std::string &key, const std::string &val)
    {
        uint64_t n = 0;
        try {
            size_t idx = 0;
            if (!val.empty() && val[0] == '-') {
                throw std::runtime_error("negative value");
            }
            n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw std::runtime_error("non-numeric suffix");
            }
        }
        catch (const std::exception &ex) {
            throw std::runtime_error("ConfigParser: " + key + " expects an unsigned integer, got '" +
                                     val + "': " + ex.what());
        }
        if (n > std::numeric_limits<uint32_t>::max()) {
            throw std::runtime_error("ConfigParser: " + key + " out of range: " + val);
        }
        return static_cast<uint32_t>(n);
    }
};

} // namespace util
} // namespace shardavail

#endif // SHARDAVAIL_UTIL_CONFIG_PARSER_HPP
