#ifndef SHARDAVAIL_ERASURE_REED_SOLOMON_HPP
#define SHARDAVAIL_ERASURE_REED_SOLOMON_HPP

#include <cstdint>
#include <map>
#include <vector>

/**
 * @file reed_solomon.hpp
 * @brief Systematic Reed-Solomon erasure code over GF(2^8).
 *
 * DESIGN:
 *   - The generator is an n x k Vandermonde matrix (row i = powers of i)
 *     multiplied by the inverse of its top k x k block, so the first k output
 *     shards are the data shards themselves and any k rows stay invertible.
 *   - encode() appends n - k parity shards to the k data shards.
 *   - reconstructData() takes any k distinct shards, inverts the matching
 *     k x k sub-matrix and multiplies it back out. The k lowest indices
 *     supplied are used, so a given shard set always decodes the same way.
 *   - Limits: 1 <= k <= n <= 255.
 */

namespace shardavail {
namespace erasure {

using Matrix = std::vector<std::vector<uint8_t>>;
using Shard = std::vector<uint8_t>;

class ReedSolomon
{
public:
    /**
     * @throw std::invalid_argument on unusable (dataShards, totalShards).
     */
    ReedSolomon(uint32_t dataShards, uint32_t totalShards);

    uint32_t dataShards() const { return k_; }
    uint32_t totalShards() const { return n_; }
    uint32_t parityShards() const { return n_ - k_; }

    /**
     * @brief Data shards in, all n shards out (data first, then parity).
     * @throw std::invalid_argument if the count is not k or lengths differ.
     */
    std::vector<Shard> encode(const std::vector<Shard> &data) const;

    /**
     * @brief Recover the k data shards from any k distinct shards (index -> bytes).
     * @throw core::ChunkError(InsufficientParts) with fewer than k shards.
     * @throw std::invalid_argument on out-of-range indices or unequal lengths.
     */
    std::vector<Shard> reconstructData(const std::map<uint32_t, Shard> &shards) const;

    const Matrix& generator() const { return generator_; }

private:
    uint32_t k_;
    uint32_t n_;
    Matrix generator_;
};

/**
 * @brief Gauss-Jordan inversion of a square matrix over GF(2^8).
 * @throw std::runtime_error if the matrix is singular.
 */
Matrix invertMatrix(Matrix m);

/**
 * @brief Row-major product a (r x m) * b (m x c).
 */
Matrix multiplyMatrix(const Matrix &a, const Matrix &b);

} // namespace erasure
} // namespace shardavail

#endif // SHARDAVAIL_ERASURE_REED_SOLOMON_HPP
