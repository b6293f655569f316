/**
 * secp256k1 Arithmetic
 *
 * Portable 256-bit field (mod p) and scalar (mod n) arithmetic plus Jacobian
 * point operations. Not constant-time; consensus verification only handles
 * public data. The signer in schnorr.hpp is for corpus synthesis and tests.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>

namespace conhal {
namespace crypto {

/**
 * Simple 256-bit integer for modular arithmetic
 */
struct uint256_t {
    uint64_t d[4];  // Little-endian

    uint256_t() : d{0, 0, 0, 0} {}

    explicit uint256_t(uint64_t lo) : d{lo, 0, 0, 0} {}

    uint256_t(uint64_t d0, uint64_t d1, uint64_t d2, uint64_t d3)
        : d{d0, d1, d2, d3} {}

    bool is_zero() const {
        return d[0] == 0 && d[1] == 0 && d[2] == 0 && d[3] == 0;
    }

    bool is_odd() const { return d[0] & 1; }

    bool bit(int i) const { return (d[i / 64] >> (i % 64)) & 1; }

    // `width` bits starting at bit `pos` (width <= 8)
    unsigned bits(int pos, int width) const {
        unsigned v = 0;
        for (int i = width - 1; i >= 0; i--) {
            int b = pos + i;
            v = (v << 1) | (b < 256 ? unsigned(bit(b)) : 0u);
        }
        return v;
    }

    bool operator<(const uint256_t& o) const {
        for (int i = 3; i >= 0; i--) {
            if (d[i] < o.d[i]) return true;
            if (d[i] > o.d[i]) return false;
        }
        return false;
    }

    bool operator>=(const uint256_t& o) const { return !(*this < o); }

    bool operator==(const uint256_t& o) const {
        return d[0] == o.d[0] && d[1] == o.d[1] && d[2] == o.d[2] && d[3] == o.d[3];
    }

    bool operator!=(const uint256_t& o) const { return !(*this == o); }

    // Big-endian 32 bytes
    static uint256_t from_bytes(const uint8_t* in) {
        uint256_t r;
        for (int limb = 0; limb < 4; limb++) {
            uint64_t v = 0;
            for (int i = 0; i < 8; i++) v = (v << 8) | in[(3 - limb) * 8 + i];
            r.d[limb] = v;
        }
        return r;
    }

    void to_bytes(uint8_t* out) const {
        for (int limb = 0; limb < 4; limb++) {
            for (int i = 0; i < 8; i++) {
                out[(3 - limb) * 8 + i] = uint8_t(d[limb] >> (56 - 8 * i));
            }
        }
    }

    std::array<uint8_t, 32> to_bytes() const {
        std::array<uint8_t, 32> out;
        to_bytes(out.data());
        return out;
    }
};

// secp256k1 field prime p = 2^256 - 2^32 - 977
inline const uint256_t SECP256K1_P(
    0xFFFFFFFEFFFFFC2FULL, 0xFFFFFFFFFFFFFFFFULL,
    0xFFFFFFFFFFFFFFFFULL, 0xFFFFFFFFFFFFFFFFULL
);

// secp256k1 generator point G
inline const uint256_t SECP256K1_GX(
    0x59F2815B16F81798ULL, 0x029BFCDB2DCE28D9ULL,
    0x55A06295CE870B07ULL, 0x79BE667EF9DCBBACULL
);

inline const uint256_t SECP256K1_GY(
    0x9C47D08FFB10D4B8ULL, 0xFD17B448A6855419ULL,
    0x5DA4FBFC0E1108A8ULL, 0x483ADA7726A3C465ULL
);

// secp256k1 curve order n
inline const uint256_t SECP256K1_N(
    0xBFD25E8CD0364141ULL, 0xBAAEDCE6AF48A03BULL,
    0xFFFFFFFFFFFFFFFEULL, 0xFFFFFFFFFFFFFFFFULL
);

// (p+1)/4, square root exponent (p = 3 mod 4)
inline const uint256_t SECP256K1_SQRT_EXP(
    0xFFFFFFFFBFFFFF0CULL, 0xFFFFFFFFFFFFFFFFULL,
    0xFFFFFFFFFFFFFFFFULL, 0x3FFFFFFFFFFFFFFFULL
);

// ============================================================================
// 256-bit helpers
// ============================================================================

// Add two 256-bit numbers, return carry
inline uint64_t add256(uint256_t& r, const uint256_t& a, const uint256_t& b) {
    __uint128_t carry = 0;
    for (int i = 0; i < 4; i++) {
        __uint128_t sum = (__uint128_t)a.d[i] + b.d[i] + carry;
        r.d[i] = (uint64_t)sum;
        carry = sum >> 64;
    }
    return (uint64_t)carry;
}

// Subtract: r = a - b, return borrow
inline uint64_t sub256(uint256_t& r, const uint256_t& a, const uint256_t& b) {
    __int128_t borrow = 0;
    for (int i = 0; i < 4; i++) {
        __int128_t diff = (__int128_t)a.d[i] - b.d[i] - borrow;
        r.d[i] = (uint64_t)diff;
        borrow = (diff < 0) ? 1 : 0;
    }
    return (uint64_t)borrow;
}

inline void mul64_128(uint64_t a, uint64_t b, uint64_t& lo, uint64_t& hi) {
    __uint128_t prod = (__uint128_t)a * b;
    lo = (uint64_t)prod;
    hi = (uint64_t)(prod >> 64);
}

// ============================================================================
// Field arithmetic mod p
// ============================================================================

inline void mod_add(uint256_t& r, const uint256_t& a, const uint256_t& b) {
    if (add256(r, a, b) || r >= SECP256K1_P) {
        sub256(r, r, SECP256K1_P);
    }
}

inline void mod_sub(uint256_t& r, const uint256_t& a, const uint256_t& b) {
    if (sub256(r, a, b)) {
        add256(r, r, SECP256K1_P);
    }
}

inline void mod_neg(uint256_t& r, const uint256_t& a) {
    if (a.is_zero()) {
        r = a;
    } else {
        sub256(r, SECP256K1_P, a);
    }
}

// Schoolbook 256x256 product, then fold the high half by 2^256 = 0x1000003D1 (mod p)
inline void mod_mul(uint256_t& r, const uint256_t& a, const uint256_t& b) {
    uint64_t prod[8] = {0, 0, 0, 0, 0, 0, 0, 0};

    for (int i = 0; i < 4; i++) {
        uint64_t carry = 0;
        for (int j = 0; j < 4; j++) {
            uint64_t mul_lo, mul_hi;
            mul64_128(a.d[i], b.d[j], mul_lo, mul_hi);

            __uint128_t sum = (__uint128_t)prod[i + j] + mul_lo + carry;
            prod[i + j] = (uint64_t)sum;
            carry = mul_hi + (uint64_t)(sum >> 64);
        }
        prod[i + 4] = carry;
    }

    const uint64_t C = 0x1000003D1ULL;

    // Each fold shrinks the high part; at most three rounds are ever needed
    while (prod[4] | prod[5] | prod[6] | prod[7]) {
        uint64_t high[4] = {prod[4], prod[5], prod[6], prod[7]};
        prod[4] = prod[5] = prod[6] = prod[7] = 0;

        uint64_t carry = 0;
        for (int i = 0; i < 4; i++) {
            uint64_t mul_lo, mul_hi;
            mul64_128(high[i], C, mul_lo, mul_hi);
            __uint128_t sum = (__uint128_t)prod[i] + mul_lo + carry;
            prod[i] = (uint64_t)sum;
            carry = mul_hi + (uint64_t)(sum >> 64);
        }
        prod[4] = carry;
    }

    for (int i = 0; i < 4; i++) {
        r.d[i] = prod[i];
    }

    while (r >= SECP256K1_P) {
        sub256(r, r, SECP256K1_P);
    }
}

// r = base^exp mod p
inline void mod_pow(uint256_t& r, const uint256_t& base_in, const uint256_t& exp) {
    uint256_t base = base_in;
    r = uint256_t(1);

    for (int i = 0; i < 256; i++) {
        if (exp.bit(i)) {
            mod_mul(r, r, base);
        }
        mod_mul(base, base, base);
    }
}

// Fermat: a^(p-2) mod p
inline void mod_inv(uint256_t& r, const uint256_t& a) {
    uint256_t exp;
    sub256(exp, SECP256K1_P, uint256_t(2));
    mod_pow(r, a, exp);
}

// ============================================================================
// Scalar arithmetic mod n
// ============================================================================

// Reduce a 256-bit value mod n (n > 2^255, so one subtraction suffices)
inline uint256_t scalar_reduce(const uint256_t& a) {
    uint256_t r = a;
    if (r >= SECP256K1_N) sub256(r, r, SECP256K1_N);
    return r;
}

inline uint256_t scalar_add(const uint256_t& a, const uint256_t& b) {
    uint256_t r;
    if (add256(r, a, b) || r >= SECP256K1_N) {
        sub256(r, r, SECP256K1_N);
    }
    return r;
}

inline uint256_t scalar_neg(const uint256_t& a) {
    if (a.is_zero()) return a;
    uint256_t r;
    sub256(r, SECP256K1_N, a);
    return r;
}

// Double-and-add over the bits of b; both inputs reduced mod n
inline uint256_t scalar_mul(const uint256_t& a, const uint256_t& b) {
    uint256_t r;
    for (int i = 255; i >= 0; i--) {
        r = scalar_add(r, r);
        if (b.bit(i)) r = scalar_add(r, a);
    }
    return r;
}

// ============================================================================
// Points
// ============================================================================

struct AffinePoint {
    uint256_t x, y;
    bool infinity = false;

    bool has_even_y() const { return !infinity && !y.is_odd(); }

    bool operator==(const AffinePoint& o) const {
        if (infinity || o.infinity) return infinity == o.infinity;
        return x == o.x && y == o.y;
    }
};

inline AffinePoint generator() {
    return AffinePoint{SECP256K1_GX, SECP256K1_GY, false};
}

// Point in Jacobian coordinates
struct ECPoint {
    uint256_t X, Y, Z;

    ECPoint() { set_infinity(); }

    explicit ECPoint(const AffinePoint& a) {
        if (a.infinity) {
            set_infinity();
        } else {
            X = a.x;
            Y = a.y;
            Z = uint256_t(1);
        }
    }

    bool is_infinity() const { return Z.is_zero(); }

    void set_infinity() {
        X = uint256_t(1);
        Y = uint256_t(1);
        Z = uint256_t(0);
    }
};

inline void ec_double(ECPoint& R, const ECPoint& P) {
    if (P.is_infinity()) {
        R.set_infinity();
        return;
    }

    uint256_t S, M, T, Y2;

    mod_mul(Y2, P.Y, P.Y);

    // S = 4 * X * Y^2
    mod_mul(S, P.X, Y2);
    mod_add(S, S, S);
    mod_add(S, S, S);

    // M = 3 * X^2 (a=0 for secp256k1)
    mod_mul(M, P.X, P.X);
    mod_add(T, M, M);
    mod_add(M, T, M);

    // Z' = 2 * Y * Z, computed before R.Y may alias P.Y
    uint256_t Z3;
    mod_mul(Z3, P.Y, P.Z);
    mod_add(Z3, Z3, Z3);

    // X' = M^2 - 2*S
    uint256_t X3;
    mod_mul(X3, M, M);
    mod_sub(X3, X3, S);
    mod_sub(X3, X3, S);

    // Y' = M * (S - X') - 8 * Y^4
    mod_sub(T, S, X3);
    mod_mul(T, M, T);
    mod_mul(Y2, Y2, Y2);
    mod_add(Y2, Y2, Y2);
    mod_add(Y2, Y2, Y2);
    mod_add(Y2, Y2, Y2);
    mod_sub(R.Y, T, Y2);

    R.X = X3;
    R.Z = Z3;
}

// Mixed addition: P Jacobian, Q affine
inline void ec_add(ECPoint& R, const ECPoint& P, const AffinePoint& Q) {
    if (Q.infinity) {
        R = P;
        return;
    }
    if (P.is_infinity()) {
        R = ECPoint(Q);
        return;
    }

    uint256_t Z1Z1, U2, S2, H, HH, I, J, r, V;

    mod_mul(Z1Z1, P.Z, P.Z);
    mod_mul(U2, Q.x, Z1Z1);
    mod_mul(S2, Q.y, P.Z);
    mod_mul(S2, S2, Z1Z1);
    mod_sub(H, U2, P.X);
    mod_sub(r, S2, P.Y);
    mod_add(r, r, r);

    if (H.is_zero()) {
        if (r.is_zero()) {
            ec_double(R, P);
            return;
        }
        R.set_infinity();
        return;
    }

    mod_mul(HH, H, H);
    mod_add(I, HH, HH);
    mod_add(I, I, I);
    mod_mul(J, H, I);
    mod_mul(V, P.X, I);

    ECPoint out;
    // X3 = r^2 - J - 2*V
    mod_mul(out.X, r, r);
    mod_sub(out.X, out.X, J);
    mod_sub(out.X, out.X, V);
    mod_sub(out.X, out.X, V);

    // Y3 = r * (V - X3) - 2 * Y1 * J
    mod_sub(V, V, out.X);
    mod_mul(out.Y, r, V);
    mod_mul(J, P.Y, J);
    mod_add(J, J, J);
    mod_sub(out.Y, out.Y, J);

    // Z3 = 2 * Z1 * H
    mod_mul(out.Z, P.Z, H);
    mod_add(out.Z, out.Z, out.Z);

    R = out;
}

// General addition, both Jacobian
inline void ec_add(ECPoint& R, const ECPoint& P, const ECPoint& Q) {
    if (P.is_infinity()) {
        R = Q;
        return;
    }
    if (Q.is_infinity()) {
        R = P;
        return;
    }

    uint256_t Z1Z1, Z2Z2, U1, U2, S1, S2, H, rr;
    mod_mul(Z1Z1, P.Z, P.Z);
    mod_mul(Z2Z2, Q.Z, Q.Z);
    mod_mul(U1, P.X, Z2Z2);
    mod_mul(U2, Q.X, Z1Z1);
    mod_mul(S1, P.Y, Q.Z);
    mod_mul(S1, S1, Z2Z2);
    mod_mul(S2, Q.Y, P.Z);
    mod_mul(S2, S2, Z1Z1);
    mod_sub(H, U2, U1);
    mod_sub(rr, S2, S1);

    if (H.is_zero()) {
        if (rr.is_zero()) {
            ec_double(R, P);
            return;
        }
        R.set_infinity();
        return;
    }

    uint256_t H2, H3, U1H2, T;
    mod_mul(H2, H, H);
    mod_mul(H3, H2, H);
    mod_mul(U1H2, U1, H2);

    ECPoint out;
    // X3 = r^2 - H^3 - 2*U1*H^2
    mod_mul(out.X, rr, rr);
    mod_sub(out.X, out.X, H3);
    mod_sub(out.X, out.X, U1H2);
    mod_sub(out.X, out.X, U1H2);

    // Y3 = r * (U1*H^2 - X3) - S1*H^3
    mod_sub(T, U1H2, out.X);
    mod_mul(out.Y, rr, T);
    mod_mul(T, S1, H3);
    mod_sub(out.Y, out.Y, T);

    // Z3 = H * Z1 * Z2
    mod_mul(out.Z, H, P.Z);
    mod_mul(out.Z, out.Z, Q.Z);

    R = out;
}

inline ECPoint ec_negate(const ECPoint& P) {
    ECPoint out = P;
    if (!P.is_infinity()) mod_neg(out.Y, P.Y);
    return out;
}

inline AffinePoint ec_to_affine(const ECPoint& P) {
    AffinePoint out;
    if (P.is_infinity()) {
        out.infinity = true;
        return out;
    }

    uint256_t z_inv, z_inv2, z_inv3;
    mod_inv(z_inv, P.Z);
    mod_mul(z_inv2, z_inv, z_inv);
    mod_mul(z_inv3, z_inv2, z_inv);
    mod_mul(out.x, P.X, z_inv2);
    mod_mul(out.y, P.Y, z_inv3);
    return out;
}

/**
 * BIP-340 lift_x: the point with x-coordinate x and even y, if any.
 */
inline std::optional<AffinePoint> lift_x(const uint256_t& x) {
    if (x >= SECP256K1_P) return std::nullopt;

    uint256_t x2, x3, c;
    mod_mul(x2, x, x);
    mod_mul(x3, x2, x);
    mod_add(c, x3, uint256_t(7));

    uint256_t y;
    mod_pow(y, c, SECP256K1_SQRT_EXP);

    uint256_t check;
    mod_mul(check, y, y);
    if (check != c) return std::nullopt;

    if (y.is_odd()) mod_neg(y, y);
    return AffinePoint{x, y, false};
}

}  // namespace crypto
}  // namespace conhal
