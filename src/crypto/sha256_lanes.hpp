/**
 * Multi-buffer SHA-256
 *
 * Hashes up to N independent messages at once with the state laid out
 * lane-major (state[word][lane]). Every round is a loop over lanes with no
 * cross-lane dependency, which the compiler maps onto the target's vector
 * registers: N=4 for NEON and RVV, N=8 for AVX2 and SVE-256, N=16 for AVX-512.
 *
 * Messages of different lengths share a group; a lane whose message has run
 * out of blocks keeps computing but its state update is masked off.
 */

#pragma once

#include "sha256.hpp"

#include <algorithm>
#include <array>
#include <cstdint>

namespace conhal {
namespace crypto {

template <size_t N>
class Sha256Lanes {
public:
    static_assert(N >= 1 && N <= 64, "lane count out of range");
    static constexpr size_t LANES = N;

    /**
     * out[i] = SHA256(msgs[i]) for i < count.
     */
    static void hash_many(const ByteView* msgs, size_t count, Hash256* out) {
        for (size_t base = 0; base < count; base += N) {
            size_t active = std::min(N, count - base);
            hash_group(msgs + base, active, out + base);
        }
    }

private:
    static void hash_group(const ByteView* msgs, size_t active, Hash256* out) {
        using namespace sha256_detail;

        std::array<Bytes, N> padded;
        std::array<size_t, N> blocks{};
        size_t max_blocks = 0;
        for (size_t l = 0; l < active; l++) {
            padded[l] = pad_message(msgs[l]);
            blocks[l] = padded[l].size() / 64;
            max_blocks = std::max(max_blocks, blocks[l]);
        }

        alignas(64) uint32_t st[8][N];
        for (int k = 0; k < 8; k++) {
            for (size_t l = 0; l < N; l++) st[k][l] = IV[k];
        }

        for (size_t blk = 0; blk < max_blocks; blk++) {
            alignas(64) uint32_t w[64][N];
            alignas(64) uint32_t mask[N];

            for (size_t l = 0; l < N; l++) {
                bool live = l < active && blk < blocks[l];
                mask[l] = live ? 0xFFFFFFFFu : 0u;
                const uint8_t* src = live ? padded[l].data() + blk * 64 : nullptr;
                for (int i = 0; i < 16; i++) {
                    w[i][l] = src ? load_be32(src + i * 4) : 0;
                }
            }

            for (int i = 16; i < 64; i++) {
                for (size_t l = 0; l < N; l++) {
                    w[i][l] = ep1(w[i-2][l]) + w[i-7][l] + ep0(w[i-15][l]) + w[i-16][l];
                }
            }

            alignas(64) uint32_t a[N], b[N], c[N], d[N], e[N], f[N], g[N], h[N];
            for (size_t l = 0; l < N; l++) {
                a[l] = st[0][l]; b[l] = st[1][l]; c[l] = st[2][l]; d[l] = st[3][l];
                e[l] = st[4][l]; f[l] = st[5][l]; g[l] = st[6][l]; h[l] = st[7][l];
            }

            for (int i = 0; i < 64; i++) {
                for (size_t l = 0; l < N; l++) {
                    uint32_t t1 = h[l] + sig1(e[l]) + ch(e[l], f[l], g[l]) + K[i] + w[i][l];
                    uint32_t t2 = sig0(a[l]) + maj(a[l], b[l], c[l]);
                    h[l] = g[l]; g[l] = f[l]; f[l] = e[l]; e[l] = d[l] + t1;
                    d[l] = c[l]; c[l] = b[l]; b[l] = a[l]; a[l] = t1 + t2;
                }
            }

            for (size_t l = 0; l < N; l++) {
                uint32_t m = mask[l];
                st[0][l] += a[l] & m; st[1][l] += b[l] & m;
                st[2][l] += c[l] & m; st[3][l] += d[l] & m;
                st[4][l] += e[l] & m; st[5][l] += f[l] & m;
                st[6][l] += g[l] & m; st[7][l] += h[l] & m;
            }
        }

        for (size_t l = 0; l < active; l++) {
            for (int k = 0; k < 8; k++) {
                store_be32(&out[l][k * 4], st[k][l]);
            }
        }
    }
};

}  // namespace crypto
}  // namespace conhal
