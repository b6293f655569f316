/**
 * Reference SHA-256
 *
 * Portable scalar SHA-256. This is the Generic backend's hash kernel and the
 * ground truth every accelerated engine is compared against.
 */

#pragma once

#include "../core/types.hpp"

#include <array>
#include <cstdint>
#include <cstring>

namespace conhal {
namespace crypto {

namespace sha256_detail {

inline constexpr uint32_t K[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2
};

inline constexpr uint32_t IV[8] = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
    0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

inline uint32_t rotr(uint32_t x, int n) { return (x >> n) | (x << (32 - n)); }
inline uint32_t ch(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (~x & z); }
inline uint32_t maj(uint32_t x, uint32_t y, uint32_t z) { return (x & y) ^ (x & z) ^ (y & z); }
inline uint32_t sig0(uint32_t x) { return rotr(x, 2) ^ rotr(x, 13) ^ rotr(x, 22); }
inline uint32_t sig1(uint32_t x) { return rotr(x, 6) ^ rotr(x, 11) ^ rotr(x, 25); }
inline uint32_t ep0(uint32_t x) { return rotr(x, 7) ^ rotr(x, 18) ^ (x >> 3); }
inline uint32_t ep1(uint32_t x) { return rotr(x, 17) ^ rotr(x, 19) ^ (x >> 10); }

inline uint32_t load_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

inline void store_be32(uint8_t* p, uint32_t v) {
    p[0] = uint8_t(v >> 24);
    p[1] = uint8_t(v >> 16);
    p[2] = uint8_t(v >> 8);
    p[3] = uint8_t(v);
}

/**
 * Merkle-Damgard padding: message || 0x80 || zeros || bit length (big-endian).
 * Result length is a multiple of 64.
 */
inline Bytes pad_message(ByteView msg) {
    size_t padded_len = ((msg.size() + 8) / 64 + 1) * 64;
    Bytes out(padded_len, 0);
    if (!msg.empty()) std::memcpy(out.data(), msg.data(), msg.size());
    out[msg.size()] = 0x80;
    uint64_t bitlen = uint64_t(msg.size()) * 8;
    for (int i = 0; i < 8; i++) {
        out[padded_len - 1 - i] = uint8_t(bitlen >> (8 * i));
    }
    return out;
}

}  // namespace sha256_detail

class SHA256 {
public:
    static constexpr size_t HASH_SIZE = 32;

    static Hash256 hash(const uint8_t* data, size_t len) {
        SHA256 ctx;
        ctx.update(data, len);
        return ctx.finalize();
    }

    static Hash256 hash(ByteView data) { return hash(data.data(), data.size()); }

    SHA256() {
        std::memcpy(state, sha256_detail::IV, sizeof(state));
        bitlen = 0;
        buflen = 0;
    }

    void update(const uint8_t* data, size_t len) {
        for (size_t i = 0; i < len; i++) {
            buffer[buflen++] = data[i];
            if (buflen == 64) {
                transform(state, buffer);
                bitlen += 512;
                buflen = 0;
            }
        }
    }

    void update(ByteView data) { update(data.data(), data.size()); }

    Hash256 finalize() {
        uint32_t i = buflen;

        buffer[i++] = 0x80;
        if (buflen < 56) {
            while (i < 56) buffer[i++] = 0;
        } else {
            while (i < 64) buffer[i++] = 0;
            transform(state, buffer);
            std::memset(buffer, 0, 56);
        }

        bitlen += uint64_t(buflen) * 8;
        for (int j = 0; j < 8; j++) {
            buffer[63 - j] = uint8_t(bitlen >> (8 * j));
        }
        transform(state, buffer);

        Hash256 hash;
        for (int j = 0; j < 8; j++) {
            sha256_detail::store_be32(&hash[j * 4], state[j]);
        }
        return hash;
    }

    /**
     * One compression round over a 64-byte block.
     */
    static void transform(uint32_t st[8], const uint8_t* block) {
        using namespace sha256_detail;
        uint32_t w[64];

        for (int i = 0; i < 16; i++) {
            w[i] = load_be32(block + i * 4);
        }
        for (int i = 16; i < 64; i++) {
            w[i] = ep1(w[i-2]) + w[i-7] + ep0(w[i-15]) + w[i-16];
        }

        uint32_t a = st[0], b = st[1], c = st[2], d = st[3];
        uint32_t e = st[4], f = st[5], g = st[6], h = st[7];

        for (int i = 0; i < 64; i++) {
            uint32_t t1 = h + sig1(e) + ch(e, f, g) + K[i] + w[i];
            uint32_t t2 = sig0(a) + maj(a, b, c);
            h = g; g = f; f = e; e = d + t1;
            d = c; c = b; b = a; a = t1 + t2;
        }

        st[0] += a; st[1] += b; st[2] += c; st[3] += d;
        st[4] += e; st[5] += f; st[6] += g; st[7] += h;
    }

private:
    uint32_t state[8];
    uint64_t bitlen;
    uint8_t buffer[64];
    uint32_t buflen;
};

}  // namespace crypto
}  // namespace conhal
