/**
 * EC Multiplier implementation
 */

#include "ec_multiplier.hpp"

#include <stdexcept>
#include <string>

namespace conhal {
namespace crypto {

EcMultiplier::EcMultiplier(unsigned window_bits) : window_(window_bits) {
    if (window_ == 1 || window_ > 8) {
        throw std::invalid_argument("EcMultiplier: unsupported window " + std::to_string(window_));
    }
    if (window_ != 0) {
        g_table_ = build_table(generator(), window_);
    }
}

std::vector<ECPoint> EcMultiplier::build_table(const AffinePoint& P, unsigned window) {
    size_t size = size_t(1) << window;
    std::vector<ECPoint> table(size);
    table[0].set_infinity();
    table[1] = ECPoint(P);
    for (size_t i = 2; i < size; i++) {
        ec_add(table[i], table[i - 1], P);
    }
    return table;
}

ECPoint EcMultiplier::double_and_add(const uint256_t& k, const AffinePoint& P) const {
    ECPoint R;
    for (int i = 255; i >= 0; i--) {
        ec_double(R, R);
        if (k.bit(i)) {
            ec_add(R, R, P);
        }
    }
    return R;
}

ECPoint EcMultiplier::strauss(const uint256_t& a, const uint256_t& b,
                              const std::vector<ECPoint>* p_table) const {
    const int w = int(window_);
    const int windows = (256 + w - 1) / w;

    ECPoint R;
    for (int j = windows - 1; j >= 0; j--) {
        for (int i = 0; i < w; i++) {
            ec_double(R, R);
        }
        unsigned da = a.bits(j * w, w);
        if (da) ec_add(R, R, g_table_[da]);
        if (p_table) {
            unsigned db = b.bits(j * w, w);
            if (db) ec_add(R, R, (*p_table)[db]);
        }
    }
    return R;
}

ECPoint EcMultiplier::mul_add(const uint256_t& a, const uint256_t& b, const AffinePoint& P) const {
    if (window_ == 0) {
        ECPoint aG = double_and_add(a, generator());
        ECPoint bP = double_and_add(b, P);
        ECPoint R;
        ec_add(R, aG, bP);
        return R;
    }
    std::vector<ECPoint> p_table = build_table(P, window_);
    return strauss(a, b, &p_table);
}

ECPoint EcMultiplier::mul_base(const uint256_t& k) const {
    if (window_ == 0) {
        return double_and_add(k, generator());
    }
    return strauss(k, uint256_t(), nullptr);
}

}  // namespace crypto
}  // namespace conhal
