#ifndef SHARDAVAIL_NETWORK_PROTOCOL_MESSAGES_HPP
#define SHARDAVAIL_NETWORK_PROTOCOL_MESSAGES_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/chunk_types.hpp"
#include "util/byte_io.hpp"

namespace shardavail {
namespace network {

/*
  protocol_messages.hpp
  --------------------------------
  The two message shapes exchanged for chunk parts, and the envelope that
  carries them over the network gateway.

  Public Structures:
   - struct ProtocolMessage
       A type tag (PARTIAL_CHUNK_REQUEST, PARTIAL_CHUNK_RESPONSE) and the
       serialized payload.
   - struct PartialEncodedChunkRequest
       Which parts of which chunk the sender wants, and the route-back token
       a responder addresses its reply to.
   - struct PartialEncodedChunkResponse
       The parts the responder holds, plus explicit "not available" markers
       for parts it owns but lacks.

  Encoding:
   - Big-endian, length-prefixed (see util/byte_io.hpp).
   - Frame layout matches the gateway framing: u32 type length, type bytes,
     u32 payload length, payload bytes.
   - Decoding throws std::runtime_error on truncated, oversized or trailing
     input; a peer can never make the node allocate more than the limits
     below.
*/

constexpr const char* kPartialChunkRequestType = "PARTIAL_CHUNK_REQUEST";
constexpr const char* kPartialChunkResponseType = "PARTIAL_CHUNK_RESPONSE";

constexpr uint32_t kMaxTypeLength = 64;
constexpr uint32_t kMaxRouteBackLength = 256;
constexpr uint32_t kMaxMessagePayload = 128u * 1024 * 1024;

struct ProtocolMessage
{
    // Message type tag, one of the constants above.
    std::string type;

    // Serialized request or response.
    std::vector<uint8_t> payload;
};

struct PartialEncodedChunkRequest
{
    core::ChunkHash chunkHash{};
    std::vector<core::PartOrd> partOrds;

    // Shards the requester tracks; informational, responders do not filter on it.
    std::vector<uint32_t> trackingShards;

    // Opaque token identifying where the response goes.
    std::string routeBack;
};

struct PartialEncodedChunkResponse
{
    core::ChunkHash chunkHash{};
    std::vector<core::PartialEncodedPart> parts;

    // Parts the responder owns but does not hold.
    std::vector<core::PartOrd> unavailableOrds;

    bool empty() const { return parts.empty() && unavailableOrds.empty(); }
};

namespace detail {

inline void writeOrds(util::ByteWriter &w, const std::vector<uint32_t> &ords)
{
    w.writeU32(static_cast<uint32_t>(ords.size()));
    for (uint32_t ord : ords) {
        w.writeU32(ord);
    }
}

inline std::vector<uint32_t> readOrds(util::ByteReader &r, const char *what)
{
    uint32_t count = r.readU32();
    if (count > core::kMaxTotalParts) {
        throw std::runtime_error(std::string(what) + ": " + std::to_string(count) +
                                 " entries exceeds limit");
    }
    std::vector<uint32_t> ords;
    ords.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        ords.push_back(r.readU32());
    }
    return ords;
}

} // namespace detail

inline ProtocolMessage encodeRequest(const PartialEncodedChunkRequest &req)
{
    if (req.routeBack.size() > kMaxRouteBackLength) {
        throw std::invalid_argument("encodeRequest: route-back token too long");
    }
    util::ByteWriter w;
    w.writeHash(req.chunkHash);
    detail::writeOrds(w, req.partOrds);
    detail::writeOrds(w, req.trackingShards);
    w.writeString(req.routeBack);

    ProtocolMessage msg;
    msg.type = kPartialChunkRequestType;
    msg.payload = w.take();
    return msg;
}

/**
 * @throw std::runtime_error on a wrong type tag or malformed payload.
 */
inline PartialEncodedChunkRequest decodeRequest(const ProtocolMessage &msg)
{
    if (msg.type != kPartialChunkRequestType) {
        throw std::runtime_error("decodeRequest: unexpected message type '" + msg.type + "'");
    }
    util::ByteReader r(msg.payload, "PartialEncodedChunkRequest");
    PartialEncodedChunkRequest req;
    req.chunkHash = r.readHash();
    req.partOrds = detail::readOrds(r, "PartialEncodedChunkRequest.partOrds");
    req.trackingShards = detail::readOrds(r, "PartialEncodedChunkRequest.trackingShards");
    req.routeBack = r.readString(kMaxRouteBackLength);
    r.expectEnd();
    return req;
}

inline ProtocolMessage encodeResponse(const PartialEncodedChunkResponse &resp)
{
    util::ByteWriter w;
    w.writeHash(resp.chunkHash);
    w.writeU32(static_cast<uint32_t>(resp.parts.size()));
    for (const auto &part : resp.parts) {
        part.writeTo(w);
    }
    detail::writeOrds(w, resp.unavailableOrds);

    ProtocolMessage msg;
    msg.type = kPartialChunkResponseType;
    msg.payload = w.take();
    return msg;
}

/**
 * @throw std::runtime_error on a wrong type tag or malformed payload.
 */
inline PartialEncodedChunkResponse decodeResponse(const ProtocolMessage &msg)
{
    if (msg.type != kPartialChunkResponseType) {
        throw std::runtime_error("decodeResponse: unexpected message type '" + msg.type + "'");
    }
    util::ByteReader r(msg.payload, "PartialEncodedChunkResponse");
    PartialEncodedChunkResponse resp;
    resp.chunkHash = r.readHash();
    uint32_t count = r.readU32();
    if (count > core::kMaxTotalParts) {
        throw std::runtime_error("PartialEncodedChunkResponse: " + std::to_string(count) +
                                 " parts exceeds limit");
    }
    resp.parts.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        resp.parts.push_back(core::PartialEncodedPart::readFrom(r));
    }
    resp.unavailableOrds = detail::readOrds(r, "PartialEncodedChunkResponse.unavailableOrds");
    r.expectEnd();
    return resp;
}

/**
 * @brief Gateway framing of an envelope.
 */
inline std::vector<uint8_t> encodeFrame(const ProtocolMessage &msg)
{
    util::ByteWriter w;
    w.writeString(msg.type);
    w.writeBytes(msg.payload);
    return w.take();
}

inline ProtocolMessage decodeFrame(const std::vector<uint8_t> &frame)
{
    util::ByteReader r(frame, "ProtocolMessage");
    ProtocolMessage msg;
    msg.type = r.readString(kMaxTypeLength);
    msg.payload = r.readBytes(kMaxMessagePayload);
    r.expectEnd();
    return msg;
}

} // namespace network
} // namespace shardavail

#endif // SHARDAVAIL_NETWORK_PROTOCOL_MESSAGES_HPP
