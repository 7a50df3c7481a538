#ifndef SHARDAVAIL_STORAGE_PART_STORE_HPP
#define SHARDAVAIL_STORAGE_PART_STORE_HPP

#include <array>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "core/chunk_types.hpp"

struct sqlite3;

namespace shardavail {
namespace storage {

/*
  PartStore
  --------------------------------
  Durable mapping (chunk hash, part ord) -> PartialEncodedPart, plus the chunk
  headers needed to validate and decode those parts. Backed by one SQLite file.

  Required Methods:
    PartStore(const std::string &dbPath)
    PutResult put(const ChunkHash &chunkHash, PartOrd partOrd, const PartialEncodedPart &part)
    std::optional<PartialEncodedPart> get(const ChunkHash &chunkHash, PartOrd partOrd) const
    bool hasChunk(const ChunkHash &chunkHash) const
    PutResult putHeader(const ChunkHeader &header)
    std::optional<ChunkHeader> getHeader(const ChunkHash &chunkHash) const

  Durability:
   - journal_mode=WAL with synchronous=FULL: once put() returns, the row
     survives a crash.
   - Destroying the store and opening the same file again is a restart; get()
     returns the identical bytes without re-validation.

  Integrity:
   - Each key is write-once. A second put with bit-identical content is a no-op
     (PutResult::AlreadyPresent); differing content throws
     ChunkError(ConflictingPart) and leaves the stored row untouched.
   - The read-compare-write of one key runs under a key-scoped lock (striped
     mutexes) inside a BEGIN IMMEDIATE transaction, so two racing puts for the
     same key cannot both pass the conflict check.
   - Part bytes are zlib-compressed at rest together with a CRC32 of the raw
     bytes; a row whose CRC no longer matches is reported as a storage failure
     instead of being served.

  THREAD-SAFETY:
   - All methods may be called concurrently; the SQLite connection is
     serialized by an internal mutex.
*/

class PartStore
{
public:
    enum class PutResult
    {
        Inserted,
        AlreadyPresent
    };

    /**
     * @throw std::runtime_error if the database cannot be opened or initialized.
     */
    explicit PartStore(const std::string &dbPath);
    ~PartStore();

    PartStore(const PartStore&) = delete;
    PartStore& operator=(const PartStore&) = delete;

    /**
     * @throw core::ChunkError(ConflictingPart) if a different header is stored under the same hash.
     */
    PutResult putHeader(const core::ChunkHeader &header);

    std::optional<core::ChunkHeader> getHeader(const core::ChunkHash &chunkHash) const;

    /**
     * @throw std::invalid_argument if part.chunkHash / part.partOrd disagree with the key.
     * @throw core::ChunkError(ConflictingPart) if the key already holds different content.
     */
    PutResult put(const core::ChunkHash &chunkHash, core::PartOrd partOrd,
                  const core::PartialEncodedPart &part);

    std::optional<core::PartialEncodedPart> get(const core::ChunkHash &chunkHash,
                                                core::PartOrd partOrd) const;

    std::vector<core::PartOrd> partOrds(const core::ChunkHash &chunkHash) const;
    std::vector<core::PartialEncodedPart> getParts(const core::ChunkHash &chunkHash) const;
    size_t partCount(const core::ChunkHash &chunkHash) const;

    /**
     * @brief True iff the header is known and at least dataParts parts are held.
     */
    bool hasChunk(const core::ChunkHash &chunkHash) const;

    /**
     * @brief Close the connection; further calls throw std::runtime_error.
     */
    void close();
    bool isOpen() const;

    const std::string& path() const { return m_path; }

private:
    static constexpr size_t kKeyStripes = 64;

    std::mutex& keyLock(const core::ChunkHash &chunkHash, core::PartOrd partOrd);
    sqlite3* connection() const;
    void initDatabaseSchema();
    void exec(const char *sql, const char *what);
    std::optional<core::PartialEncodedPart> readPartLocked(const core::ChunkHash &chunkHash,
                                                           core::PartOrd partOrd) const;

    std::string m_path;
    sqlite3 *m_db;
    mutable std::mutex m_dbMutex;
    std::array<std::mutex, kKeyStripes> m_keyLocks;
};

} // namespace storage
} // namespace shardavail

#endif // SHARDAVAIL_STORAGE_PART_STORE_HPP
