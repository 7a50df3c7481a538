#ifndef SHARDAVAIL_NETWORK_NETWORK_ADAPTER_HPP
#define SHARDAVAIL_NETWORK_NETWORK_ADAPTER_HPP

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "network/protocol_messages.hpp"
#include "util/hashing.hpp"
#include "util/logger.hpp"

namespace shardavail {
namespace network {

/*
  NetworkAdapter
  --------------------------------
  Outbound side of the network gateway as seen by the chunk subsystem. The
  transport itself (peer discovery, sockets, framing) lives outside; inbound
  messages are handed to ShardsManager directly.

  Required Methods:
    void sendRequest(const std::string &peer, const PartialEncodedChunkRequest &request)
    void sendResponse(const std::string &routeBack, const PartialEncodedChunkResponse &response)

  Both calls must not block on the remote side; delivery is best-effort and
  the request tracker covers loss.
*/

class NetworkAdapter
{
public:
    virtual ~NetworkAdapter() = default;

    virtual void sendRequest(const std::string &peer, const PartialEncodedChunkRequest &request) = 0;
    virtual void sendResponse(const std::string &routeBack, const PartialEncodedChunkResponse &response) = 0;
};

/**
 * @brief One message handed to the gateway: where to and the framed envelope.
 */
struct OutboundMessage
{
    // Peer id for requests, route-back token for responses.
    std::string destination;
    ProtocolMessage message;

    bool isRequest() const { return message.type == kPartialChunkRequestType; }
    bool isResponse() const { return message.type == kPartialChunkResponseType; }
};

/*
  QueueNetworkAdapter
  --------------------------------
  In-process gateway: encodes each outbound message and appends it to a FIFO.
  The demo node and the tests pop messages and deliver them by hand, which
  lets them drop, duplicate or reorder traffic at will.
*/
class QueueNetworkAdapter : public NetworkAdapter
{
public:
    void sendRequest(const std::string &peer, const PartialEncodedChunkRequest &request) override
    {
        push(peer, encodeRequest(request));
    }

    void sendResponse(const std::string &routeBack, const PartialEncodedChunkResponse &response) override
    {
        push(routeBack, encodeResponse(response));
    }

    std::optional<OutboundMessage> pop()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty()) {
            return std::nullopt;
        }
        OutboundMessage msg = std::move(m_queue.front());
        m_queue.pop_front();
        return msg;
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    void clear()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.clear();
    }

private:
    void push(const std::string &destination, ProtocolMessage msg)
    {
        util::logger::debug("[QueueNetworkAdapter] queued " + msg.type + " for " + destination +
                            ", payloadLen=" + std::to_string(msg.payload.size()));
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(OutboundMessage{destination, std::move(msg)});
    }

    mutable std::mutex m_mutex;
    std::deque<OutboundMessage> m_queue;
};

/*
  RouteBackRegistry
  --------------------------------
  Issues opaque route-back tokens and resolves them to the peer that owns
  them. A token is the short hex of sha256(peer || sequence), so it reveals
  nothing about the peer's address; the same peer may hold several tokens.
*/
class RouteBackRegistry
{
public:
    std::string issue(const std::string &peer)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        util::hashing::Sha256Builder builder;
        builder.update(peer);
        builder.updateU64(m_sequence++);
        std::string token = "rb-" + util::hashing::shortHex(builder.finish());
        m_routes[token] = peer;
        return token;
    }

    std::optional<std::string> resolve(const std::string &token) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_routes.find(token);
        if (it == m_routes.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void revoke(const std::string &token)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_routes.erase(token);
    }

private:
    mutable std::mutex m_mutex;
    std::map<std::string, std::string> m_routes;
    uint64_t m_sequence{0};
};

} // namespace network
} // namespace shardavail

#endif // SHARDAVAIL_NETWORK_NETWORK_ADAPTER_HPP
