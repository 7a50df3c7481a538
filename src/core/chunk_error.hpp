#ifndef SHARDAVAIL_CORE_CHUNK_ERROR_HPP
#define SHARDAVAIL_CORE_CHUNK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace shardavail {
namespace core {

/*
  ChunkError
  --------------------------------
  Failures of the chunk-availability path that callers are expected to react to:

    InsufficientParts  decode attempted before enough distinct parts are held;
                       recoverable, wait for more responses.
    CorruptPart        a part failed its Merkle proof against the committed root;
                       the part is dropped, the sender penalized, the request
                       continues against other owners.
    ConflictingPart    the store already holds different bytes under the same
                       (chunk, part) key; a data-integrity violation that is
                       logged at CRITICAL and surfaced to the chain layer.
    RequestAbandoned   the retry ceiling was reached; the chain layer is told
                       the chunk is not currently available.

  Infrastructure failures (SQLite, OpenSSL, zlib) are plain std::runtime_error.
*/

enum class ChunkErrorKind
{
    InsufficientParts,
    CorruptPart,
    ConflictingPart,
    RequestAbandoned
};

inline const char* toString(ChunkErrorKind kind)
{
    switch (kind) {
    case ChunkErrorKind::InsufficientParts: return "InsufficientParts";
    case ChunkErrorKind::CorruptPart:       return "CorruptPart";
    case ChunkErrorKind::ConflictingPart:   return "ConflictingPart";
    case ChunkErrorKind::RequestAbandoned:  return "RequestAbandoned";
    }
    return "Unknown";
}

class ChunkError : public std::runtime_error
{
public:
    ChunkError(ChunkErrorKind kind, const std::string &detail)
        : std::runtime_error(std::string(toString(kind)) + ": " + detail)
        , kind_(kind)
    {
    }

    ChunkErrorKind kind() const { return kind_; }

private:
    ChunkErrorKind kind_;
};

} // namespace core
} // namespace shardavail

#endif // SHARDAVAIL_CORE_CHUNK_ERROR_HPP
