#ifndef SHARDAVAIL_TEST_TEST_HELPERS_HPP
#define SHARDAVAIL_TEST_TEST_HELPERS_HPP

#include <cstdint>
#include <cstdio>
#include <random>
#include <string>
#include <vector>

namespace shardavail {
namespace test {

/**
 * @brief A SQLite file path in the working directory, removed (with its WAL
 *        side files) on construction and destruction.
 */
class TempDbFile
{
public:
    explicit TempDbFile(const std::string &name)
        : m_path("test_" + name + ".sqlite")
    {
        removeAll();
    }

    ~TempDbFile() { removeAll(); }

    const std::string& path() const { return m_path; }

private:
    void removeAll() const
    {
        std::remove(m_path.c_str());
        std::remove((m_path + "-wal").c_str());
        std::remove((m_path + "-shm").c_str());
    }

    std::string m_path;
};

inline std::vector<uint8_t> makePayload(size_t size, uint32_t seed = 7)
{
    std::mt19937 rng(seed);
    std::vector<uint8_t> out(size);
    for (auto &b : out) {
        b = static_cast<uint8_t>(rng() & 0xFF);
    }
    return out;
}

inline std::vector<uint8_t> toBytes(const std::string &s)
{
    return std::vector<uint8_t>(s.begin(), s.end());
}

} // namespace test
} // namespace shardavail

#endif // SHARDAVAIL_TEST_TEST_HELPERS_HPP
