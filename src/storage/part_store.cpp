#include "storage/part_store.hpp"
#include "core/chunk_error.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <functional>
#include <memory>
#include <sqlite3.h>
#include <stdexcept>
#include <zlib.h>

namespace shardavail {
namespace storage {

using core::ChunkError;
using core::ChunkErrorKind;
using core::ChunkHash;
using core::ChunkHeader;
using core::PartOrd;
using core::PartialEncodedPart;

namespace {

struct StatementDeleter
{
    void operator()(sqlite3_stmt *stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3 *db, const char *sql)
{
    sqlite3_stmt *raw = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string("[PartStore] prepare failed: ") + sqlite3_errmsg(db));
    }
    return Statement(raw);
}

void bindBlob(sqlite3 *db, sqlite3_stmt *stmt, int idx, const uint8_t *data, size_t len)
{
    // Zero-length blobs are bound explicitly so they read back as empty, not NULL.
    int rc = (len == 0) ? sqlite3_bind_zeroblob(stmt, idx, 0)
                        : sqlite3_bind_blob(stmt, idx, data, static_cast<int>(len), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        throw std::runtime_error(std::string("[PartStore] bind failed: ") + sqlite3_errmsg(db));
    }
}

void bindInt64(sqlite3 *db, sqlite3_stmt *stmt, int idx, int64_t value)
{
    if (sqlite3_bind_int64(stmt, idx, value) != SQLITE_OK) {
        throw std::runtime_error(std::string("[PartStore] bind failed: ") + sqlite3_errmsg(db));
    }
}

std::vector<uint8_t> columnBlob(sqlite3_stmt *stmt, int col)
{
    const auto *blob = static_cast<const uint8_t*>(sqlite3_column_blob(stmt, col));
    int len = sqlite3_column_bytes(stmt, col);
    if (!blob || len <= 0) {
        return {};
    }
    return std::vector<uint8_t>(blob, blob + len);
}

uint32_t crcOf(const std::vector<uint8_t> &bytes)
{
    uLong crc = crc32(0L, Z_NULL, 0);
    if (!bytes.empty()) {
        crc = crc32(crc, bytes.data(), static_cast<uInt>(bytes.size()));
    }
    return static_cast<uint32_t>(crc);
}

std::vector<uint8_t> compressBytes(const std::vector<uint8_t> &raw)
{
    uLongf outSize = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> compressed(outSize);
    if (compress2(compressed.data(), &outSize, raw.data(), static_cast<uLong>(raw.size()),
                  Z_BEST_SPEED) != Z_OK) {
        throw std::runtime_error("[PartStore] zlib compression failed");
    }
    compressed.resize(outSize);
    return compressed;
}

std::vector<uint8_t> uncompressBytes(const std::vector<uint8_t> &compressed, size_t rawSize)
{
    std::vector<uint8_t> raw(rawSize);
    uLongf outSize = static_cast<uLongf>(rawSize);
    if (rawSize == 0) {
        return raw;
    }
    if (uncompress(raw.data(), &outSize, compressed.data(),
                   static_cast<uLong>(compressed.size())) != Z_OK || outSize != rawSize) {
        throw std::runtime_error("[PartStore] zlib decompression failed");
    }
    return raw;
}

std::vector<uint8_t> packProof(const std::vector<util::hashing::Hash> &proof)
{
    std::vector<uint8_t> out;
    out.reserve(proof.size() * 32);
    for (const auto &h : proof) {
        out.insert(out.end(), h.begin(), h.end());
    }
    return out;
}

std::vector<util::hashing::Hash> unpackProof(const std::vector<uint8_t> &packed)
{
    if (packed.size() % 32 != 0) {
        throw std::runtime_error("[PartStore] stored proof has invalid length");
    }
    std::vector<util::hashing::Hash> proof(packed.size() / 32);
    for (size_t i = 0; i < proof.size(); ++i) {
        std::copy(packed.begin() + static_cast<long>(i * 32),
                  packed.begin() + static_cast<long>((i + 1) * 32), proof[i].begin());
    }
    return proof;
}

} // namespace

PartStore::PartStore(const std::string &dbPath)
    : m_path(dbPath)
    , m_db(nullptr)
{
    int rc = sqlite3_open(m_path.c_str(), &m_db);
    if (rc != SQLITE_OK) {
        std::string msg = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        throw std::runtime_error("[PartStore] Cannot open database " + m_path + ": " + msg);
    }
    sqlite3_busy_timeout(m_db, 5000);

    try {
        exec("PRAGMA journal_mode=WAL;", "enable WAL");
        exec("PRAGMA synchronous=FULL;", "set synchronous");
        initDatabaseSchema();
    } catch (const std::exception &) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
    util::logger::info("[PartStore] Opened " + m_path);
}

PartStore::~PartStore()
{
    close();
}

void PartStore::close()
{
    std::lock_guard<std::mutex> lock(m_dbMutex);
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
        util::logger::debug("[PartStore] Closed " + m_path);
    }
}

bool PartStore::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_dbMutex);
    return m_db != nullptr;
}

sqlite3* PartStore::connection() const
{
    if (!m_db) {
        throw std::runtime_error("[PartStore] store is closed: " + m_path);
    }
    return m_db;
}

void PartStore::exec(const char *sql, const char *what)
{
    char *errMsg = nullptr;
    int rc = sqlite3_exec(connection(), sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : sqlite3_errmsg(m_db);
        if (errMsg) {
            sqlite3_free(errMsg);
        }
        throw std::runtime_error(std::string("[PartStore] Failed to ") + what + ": " + msg);
    }
}

void PartStore::initDatabaseSchema()
{
    exec("CREATE TABLE IF NOT EXISTS chunk_headers ("
         "  chunk_hash BLOB PRIMARY KEY,"
         "  header BLOB NOT NULL"
         ");"
         "CREATE TABLE IF NOT EXISTS chunk_parts ("
         "  chunk_hash BLOB NOT NULL,"
         "  part_ord INTEGER NOT NULL,"
         "  raw_size INTEGER NOT NULL,"
         "  crc INTEGER NOT NULL,"
         "  payload BLOB NOT NULL,"
         "  proof BLOB NOT NULL,"
         "  PRIMARY KEY (chunk_hash, part_ord)"
         ");",
         "create schema");
}

std::mutex& PartStore::keyLock(const ChunkHash &chunkHash, PartOrd partOrd)
{
    size_t h = 0;
    for (size_t i = 0; i < 8; ++i) {
        h = (h << 8) | chunkHash[i];
    }
    h ^= std::hash<uint32_t>{}(partOrd) * 0x9e3779b97f4a7c15ULL;
    return m_keyLocks[h % kKeyStripes];
}

PartStore::PutResult PartStore::putHeader(const ChunkHeader &header)
{
    const ChunkHash chunkHash = header.chunkHash();
    const std::vector<uint8_t> encoded = header.serialize();

    std::lock_guard<std::mutex> keyGuard(keyLock(chunkHash, 0xffffffffu));
    std::lock_guard<std::mutex> lock(m_dbMutex);
    sqlite3 *db = connection();

    exec("BEGIN IMMEDIATE;", "begin transaction");
    try {
        {
            Statement sel = prepare(db, "SELECT header FROM chunk_headers WHERE chunk_hash = ?;");
            bindBlob(db, sel.get(), 1, chunkHash.data(), chunkHash.size());
            int rc = sqlite3_step(sel.get());
            if (rc == SQLITE_ROW) {
                std::vector<uint8_t> existing = columnBlob(sel.get(), 0);
                sel.reset();
                exec("COMMIT;", "commit transaction");
                if (existing == encoded) {
                    return PutResult::AlreadyPresent;
                }
                util::logger::critical("[PartStore] Conflicting header for chunk " +
                                       util::hashing::shortHex(chunkHash));
                throw ChunkError(ChunkErrorKind::ConflictingPart,
                                 "header of chunk " + util::hashing::shortHex(chunkHash) +
                                 " differs from the stored one");
            }
            if (rc != SQLITE_DONE) {
                throw std::runtime_error(std::string("[PartStore] header lookup failed: ") +
                                         sqlite3_errmsg(db));
            }
        }

        Statement ins = prepare(db, "INSERT INTO chunk_headers (chunk_hash, header) VALUES (?, ?);");
        bindBlob(db, ins.get(), 1, chunkHash.data(), chunkHash.size());
        bindBlob(db, ins.get(), 2, encoded.data(), encoded.size());
        if (sqlite3_step(ins.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("[PartStore] header insert failed: ") +
                                     sqlite3_errmsg(db));
        }
        ins.reset();
        exec("COMMIT;", "commit transaction");
    } catch (const ChunkError &) {
        throw;
    } catch (const std::exception &) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    return PutResult::Inserted;
}

std::optional<ChunkHeader> PartStore::getHeader(const ChunkHash &chunkHash) const
{
    std::lock_guard<std::mutex> lock(m_dbMutex);
    sqlite3 *db = connection();

    Statement sel = prepare(db, "SELECT header FROM chunk_headers WHERE chunk_hash = ?;");
    bindBlob(db, sel.get(), 1, chunkHash.data(), chunkHash.size());
    int rc = sqlite3_step(sel.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("[PartStore] header lookup failed: ") +
                                 sqlite3_errmsg(db));
    }
    return ChunkHeader::deserialize(columnBlob(sel.get(), 0));
}

PartStore::PutResult PartStore::put(const ChunkHash &chunkHash, PartOrd partOrd,
                                    const PartialEncodedPart &part)
{
    if (part.chunkHash != chunkHash || part.partOrd != partOrd) {
        throw std::invalid_argument("[PartStore] part does not match key (" +
                                    util::hashing::shortHex(chunkHash) + ", " +
                                    std::to_string(partOrd) + ")");
    }

    std::lock_guard<std::mutex> keyGuard(keyLock(chunkHash, partOrd));
    std::lock_guard<std::mutex> lock(m_dbMutex);
    sqlite3 *db = connection();

    exec("BEGIN IMMEDIATE;", "begin transaction");
    try {
        std::optional<PartialEncodedPart> existing = readPartLocked(chunkHash, partOrd);
        if (existing) {
            exec("COMMIT;", "commit transaction");
            if (existing->sameContent(part)) {
                util::logger::debug("[PartStore] Part " + std::to_string(partOrd) + " of " +
                                    util::hashing::shortHex(chunkHash) + " already stored");
                return PutResult::AlreadyPresent;
            }
            util::logger::critical("[PartStore] Conflicting content for part " +
                                   std::to_string(partOrd) + " of chunk " +
                                   util::hashing::shortHex(chunkHash));
            throw ChunkError(ChunkErrorKind::ConflictingPart,
                             "part " + std::to_string(partOrd) + " of chunk " +
                             util::hashing::shortHex(chunkHash) + " differs from the stored one");
        }

        const std::vector<uint8_t> compressed = compressBytes(part.bytes);
        const std::vector<uint8_t> proof = packProof(part.merkleProof);

        Statement ins = prepare(db,
            "INSERT INTO chunk_parts (chunk_hash, part_ord, raw_size, crc, payload, proof) "
            "VALUES (?, ?, ?, ?, ?, ?);");
        bindBlob(db, ins.get(), 1, chunkHash.data(), chunkHash.size());
        bindInt64(db, ins.get(), 2, partOrd);
        bindInt64(db, ins.get(), 3, static_cast<int64_t>(part.bytes.size()));
        bindInt64(db, ins.get(), 4, crcOf(part.bytes));
        bindBlob(db, ins.get(), 5, compressed.data(), compressed.size());
        bindBlob(db, ins.get(), 6, proof.data(), proof.size());
        if (sqlite3_step(ins.get()) != SQLITE_DONE) {
            throw std::runtime_error(std::string("[PartStore] part insert failed: ") +
                                     sqlite3_errmsg(db));
        }
        ins.reset();
        exec("COMMIT;", "commit transaction");
    } catch (const ChunkError &) {
        throw;
    } catch (const std::exception &) {
        sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    return PutResult::Inserted;
}

std::optional<PartialEncodedPart> PartStore::readPartLocked(const ChunkHash &chunkHash,
                                                            PartOrd partOrd) const
{
    sqlite3 *db = connection();
    Statement sel = prepare(db,
        "SELECT raw_size, crc, payload, proof FROM chunk_parts "
        "WHERE chunk_hash = ? AND part_ord = ?;");
    bindBlob(db, sel.get(), 1, chunkHash.data(), chunkHash.size());
    bindInt64(db, sel.get(), 2, partOrd);

    int rc = sqlite3_step(sel.get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw std::runtime_error(std::string("[PartStore] part lookup failed: ") +
                                 sqlite3_errmsg(db));
    }

    const int64_t rawSize = sqlite3_column_int64(sel.get(), 0);
    const uint32_t storedCrc = static_cast<uint32_t>(sqlite3_column_int64(sel.get(), 1));
    if (rawSize < 0 || rawSize > core::kMaxPartBytes) {
        throw std::runtime_error("[PartStore] stored part has invalid size");
    }

    PartialEncodedPart part;
    part.chunkHash = chunkHash;
    part.partOrd = partOrd;
    part.bytes = uncompressBytes(columnBlob(sel.get(), 2), static_cast<size_t>(rawSize));
    part.merkleProof = unpackProof(columnBlob(sel.get(), 3));

    if (crcOf(part.bytes) != storedCrc) {
        util::logger::error("[PartStore] CRC mismatch on part " + std::to_string(partOrd) +
                            " of chunk " + util::hashing::shortHex(chunkHash));
        throw std::runtime_error("[PartStore] stored part failed CRC check");
    }
    return part;
}

std::optional<PartialEncodedPart> PartStore::get(const ChunkHash &chunkHash, PartOrd partOrd) const
{
    std::lock_guard<std::mutex> lock(m_dbMutex);
    return readPartLocked(chunkHash, partOrd);
}

std::vector<PartOrd> PartStore::partOrds(const ChunkHash &chunkHash) const
{
    std::lock_guard<std::mutex> lock(m_dbMutex);
    sqlite3 *db = connection();

    Statement sel = prepare(db,
        "SELECT part_ord FROM chunk_parts WHERE chunk_hash = ? ORDER BY part_ord;");
    bindBlob(db, sel.get(), 1, chunkHash.data(), chunkHash.size());

    std::vector<PartOrd> ords;
    int rc;
    while ((rc = sqlite3_step(sel.get())) == SQLITE_ROW) {
        ords.push_back(static_cast<PartOrd>(sqlite3_column_int64(sel.get(), 0)));
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("[PartStore] part listing failed: ") +
                                 sqlite3_errmsg(db));
    }
    return ords;
}

std::vector<PartialEncodedPart> PartStore::getParts(const ChunkHash &chunkHash) const
{
    std::vector<PartialEncodedPart> parts;
    for (PartOrd ord : partOrds(chunkHash)) {
        std::optional<PartialEncodedPart> part = get(chunkHash, ord);
        if (part) {
            parts.push_back(std::move(*part));
        }
    }
    return parts;
}

size_t PartStore::partCount(const ChunkHash &chunkHash) const
{
    std::lock_guard<std::mutex> lock(m_dbMutex);
    sqlite3 *db = connection();

    Statement sel = prepare(db, "SELECT COUNT(*) FROM chunk_parts WHERE chunk_hash = ?;");
    bindBlob(db, sel.get(), 1, chunkHash.data(), chunkHash.size());
    if (sqlite3_step(sel.get()) != SQLITE_ROW) {
        throw std::runtime_error(std::string("[PartStore] part count failed: ") +
                                 sqlite3_errmsg(db));
    }
    return static_cast<size_t>(sqlite3_column_int64(sel.get(), 0));
}

bool PartStore::hasChunk(const ChunkHash &chunkHash) const
{
    std::optional<ChunkHeader> header = getHeader(chunkHash);
    if (!header) {
        return false;
    }
    return partCount(chunkHash) >= header->dataParts;
}

} // namespace storage
} // namespace shardavail
