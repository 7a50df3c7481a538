#include "erasure/reed_solomon.hpp"
#include "core/chunk_error.hpp"
#include "core/chunk_types.hpp"
#include "erasure/galois_field.hpp"
#include <stdexcept>
#include <string>
#include <utility>

namespace shardavail {
namespace erasure {

namespace {

Matrix vandermonde(uint32_t rows, uint32_t cols)
{
    Matrix v(rows, std::vector<uint8_t>(cols, 0));
    for (uint32_t r = 0; r < rows; ++r) {
        for (uint32_t c = 0; c < cols; ++c) {
            v[r][c] = GF256::pow(static_cast<uint8_t>(r), c);
        }
    }
    return v;
}

} // namespace

Matrix multiplyMatrix(const Matrix &a, const Matrix &b)
{
    if (a.empty() || b.empty() || a[0].size() != b.size()) {
        throw std::invalid_argument("multiplyMatrix: dimension mismatch");
    }
    const size_t rows = a.size();
    const size_t inner = b.size();
    const size_t cols = b[0].size();
    Matrix out(rows, std::vector<uint8_t>(cols, 0));
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < cols; ++c) {
            uint8_t acc = 0;
            for (size_t i = 0; i < inner; ++i) {
                acc ^= GF256::mul(a[r][i], b[i][c]);
            }
            out[r][c] = acc;
        }
    }
    return out;
}

Matrix invertMatrix(Matrix m)
{
    const size_t size = m.size();
    for (const auto &row : m) {
        if (row.size() != size) {
            throw std::invalid_argument("invertMatrix: matrix is not square");
        }
    }

    Matrix inv(size, std::vector<uint8_t>(size, 0));
    for (size_t i = 0; i < size; ++i) {
        inv[i][i] = 1;
    }

    for (size_t col = 0; col < size; ++col) {
        // Find a pivot at or below the diagonal
        size_t pivot = col;
        while (pivot < size && m[pivot][col] == 0) {
            ++pivot;
        }
        if (pivot == size) {
            throw std::runtime_error("invertMatrix: singular matrix");
        }
        if (pivot != col) {
            std::swap(m[pivot], m[col]);
            std::swap(inv[pivot], inv[col]);
        }

        uint8_t scale = GF256::inv(m[col][col]);
        for (size_t c = 0; c < size; ++c) {
            m[col][c] = GF256::mul(m[col][c], scale);
            inv[col][c] = GF256::mul(inv[col][c], scale);
        }

        for (size_t r = 0; r < size; ++r) {
            if (r == col || m[r][col] == 0) {
                continue;
            }
            uint8_t factor = m[r][col];
            for (size_t c = 0; c < size; ++c) {
                m[r][c] ^= GF256::mul(factor, m[col][c]);
                inv[r][c] ^= GF256::mul(factor, inv[col][c]);
            }
        }
    }
    return inv;
}

ReedSolomon::ReedSolomon(uint32_t dataShards, uint32_t totalShards)
    : k_(dataShards), n_(totalShards)
{
    if (k_ == 0) {
        throw std::invalid_argument("ReedSolomon: dataShards must be positive");
    }
    if (k_ > n_) {
        throw std::invalid_argument("ReedSolomon: dataShards (" + std::to_string(k_) +
                                    ") exceeds totalShards (" + std::to_string(n_) + ")");
    }
    if (n_ > core::kMaxTotalParts) {
        throw std::invalid_argument("ReedSolomon: totalShards " + std::to_string(n_) +
                                    " exceeds " + std::to_string(core::kMaxTotalParts));
    }

    Matrix v = vandermonde(n_, k_);
    Matrix top(v.begin(), v.begin() + k_);
    generator_ = multiplyMatrix(v, invertMatrix(top));
}

std::vector<Shard> ReedSolomon::encode(const std::vector<Shard> &data) const
{
    if (data.size() != k_) {
        throw std::invalid_argument("ReedSolomon::encode: expected " + std::to_string(k_) +
                                    " data shards, got " + std::to_string(data.size()));
    }
    const size_t shardLen = data[0].size();
    for (const auto &s : data) {
        if (s.size() != shardLen) {
            throw std::invalid_argument("ReedSolomon::encode: data shards differ in length");
        }
    }

    std::vector<Shard> out(data.begin(), data.end());
    out.reserve(n_);
    for (uint32_t row = k_; row < n_; ++row) {
        Shard parity(shardLen, 0);
        for (uint32_t j = 0; j < k_; ++j) {
            uint8_t coef = generator_[row][j];
            if (coef == 0) {
                continue;
            }
            const Shard &src = data[j];
            for (size_t b = 0; b < shardLen; ++b) {
                parity[b] ^= GF256::mul(coef, src[b]);
            }
        }
        out.push_back(std::move(parity));
    }
    return out;
}

std::vector<Shard> ReedSolomon::reconstructData(const std::map<uint32_t, Shard> &shards) const
{
    if (shards.size() < k_) {
        throw core::ChunkError(core::ChunkErrorKind::InsufficientParts,
                               "have " + std::to_string(shards.size()) + " distinct shards, need " +
                               std::to_string(k_));
    }

    std::vector<uint32_t> rows;
    std::vector<const Shard*> inputs;
    rows.reserve(k_);
    inputs.reserve(k_);
    size_t shardLen = shards.begin()->second.size();
    for (const auto &entry : shards) {
        if (entry.first >= n_) {
            throw std::invalid_argument("ReedSolomon::reconstructData: shard index " +
                                        std::to_string(entry.first) + " out of range");
        }
        if (entry.second.size() != shardLen) {
            throw std::invalid_argument("ReedSolomon::reconstructData: shards differ in length");
        }
        if (rows.size() < k_) {
            rows.push_back(entry.first);
            inputs.push_back(&entry.second);
        }
    }

    // All data shards present: nothing to solve.
    if (rows.back() == k_ - 1) {
        std::vector<Shard> out;
        out.reserve(k_);
        for (const Shard *s : inputs) {
            out.push_back(*s);
        }
        return out;
    }

    Matrix sub;
    sub.reserve(k_);
    for (uint32_t r : rows) {
        sub.push_back(generator_[r]);
    }
    Matrix decode = invertMatrix(sub);

    std::vector<Shard> out(k_, Shard(shardLen, 0));
    for (uint32_t i = 0; i < k_; ++i) {
        for (uint32_t j = 0; j < k_; ++j) {
            uint8_t coef = decode[i][j];
            if (coef == 0) {
                continue;
            }
            const Shard &src = *inputs[j];
            for (size_t b = 0; b < shardLen; ++b) {
                out[i][b] ^= GF256::mul(coef, src[b]);
            }
        }
    }
    return out;
}

} // namespace erasure
} // namespace shardavail
