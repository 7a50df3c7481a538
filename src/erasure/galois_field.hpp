#ifndef SHARDAVAIL_ERASURE_GALOIS_FIELD_HPP
#define SHARDAVAIL_ERASURE_GALOIS_FIELD_HPP

#include <array>
#include <cstdint>
#include <stdexcept>

namespace shardavail {
namespace erasure {

/*
  GF256
  --------------------------------
  Arithmetic in GF(2^8) with the primitive polynomial x^8 + x^4 + x^3 + x^2 + 1
  (0x11d) and generator 2. Addition is XOR; multiplication and division go
  through log/antilog tables built once on first use.

  The exp table is doubled (512 entries) so mul() can index log[a] + log[b]
  without a modulo.
*/

class GF256
{
public:
    static uint8_t add(uint8_t a, uint8_t b) { return a ^ b; }
    static uint8_t sub(uint8_t a, uint8_t b) { return a ^ b; }

    static uint8_t mul(uint8_t a, uint8_t b)
    {
        if (a == 0 || b == 0) {
            return 0;
        }
        const Tables &t = tables();
        return t.exp[t.log[a] + t.log[b]];
    }

    /**
     * @throw std::domain_error on division by zero.
     */
    static uint8_t div(uint8_t a, uint8_t b)
    {
        if (b == 0) {
            throw std::domain_error("GF256::div: division by zero");
        }
        if (a == 0) {
            return 0;
        }
        const Tables &t = tables();
        return t.exp[t.log[a] + 255 - t.log[b]];
    }

    static uint8_t inv(uint8_t a) { return div(1, a); }

    /// a^n, with 0^0 == 1 (Vandermonde rows start with a constant 1).
    static uint8_t pow(uint8_t a, unsigned n)
    {
        if (n == 0) {
            return 1;
        }
        if (a == 0) {
            return 0;
        }
        const Tables &t = tables();
        return t.exp[(t.log[a] * n) % 255];
    }

private:
    static constexpr uint16_t PRIMITIVE_POLY = 0x11d;

    struct Tables
    {
        std::array<uint8_t, 512> exp{};
        std::array<uint16_t, 256> log{};

        Tables()
        {
            uint16_t x = 1;
            for (uint16_t i = 0; i < 255; ++i) {
                exp[i] = static_cast<uint8_t>(x);
                log[x] = i;
                x <<= 1;
                if (x & 0x100) {
                    x ^= PRIMITIVE_POLY;
                }
            }
            for (uint16_t i = 255; i < 512; ++i) {
                exp[i] = exp[i - 255];
            }
        }
    };

    static const Tables& tables()
    {
        static const Tables t;
        return t;
    }
};

} // namespace erasure
} // namespace shardavail

#endif // SHARDAVAIL_ERASURE_GALOIS_FIELD_HPP
