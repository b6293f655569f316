/**
 * EC Multiplier
 *
 * Computes the double-base product a*G + b*P used by Schnorr verification.
 *
 * window_bits == 0: plain double-and-add, each product computed on its own
 *                   and summed (the Generic reference).
 * window_bits 2..8: fixed-window Strauss-Shamir; both scalars share one
 *                   doubling chain. The multiples of G are built once in the
 *                   constructor, the multiples of P per call.
 */

#pragma once

#include "secp256k1.hpp"

#include <vector>

namespace conhal {
namespace crypto {

class EcMultiplier {
public:
    explicit EcMultiplier(unsigned window_bits = 0);

    unsigned window_bits() const { return window_; }

    // a*G + b*P
    ECPoint mul_add(const uint256_t& a, const uint256_t& b, const AffinePoint& P) const;

    // k*G
    ECPoint mul_base(const uint256_t& k) const;

private:
    ECPoint double_and_add(const uint256_t& k, const AffinePoint& P) const;
    ECPoint strauss(const uint256_t& a, const uint256_t& b, const std::vector<ECPoint>* p_table) const;
    static std::vector<ECPoint> build_table(const AffinePoint& P, unsigned window);

    unsigned window_;
    std::vector<ECPoint> g_table_;  // i*G for i in [0, 2^window)
};

}  // namespace crypto
}  // namespace conhal
