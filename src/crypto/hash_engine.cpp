/**
 * Hash Engine implementation
 */

#include "hash_engine.hpp"
#include "sha256.hpp"
#include "sha256_lanes.hpp"
#include "../core/errors.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <string>
#include <vector>

namespace conhal {
namespace crypto {

namespace {

Hash256 openssl_sha256(ByteView data) {
    Hash256 out{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1 ||
        len != out.size()) {
        throw BackendUnavailable("OpenSSL EVP_Digest(sha256) failed");
    }
    return out;
}

// SHA256("abc")
constexpr std::array<uint8_t, 32> ABC_DIGEST = {
    0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
    0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad
};

}  // namespace

const char* to_string(HashEngineKind kind) {
    switch (kind) {
        case HashEngineKind::Reference: return "reference";
        case HashEngineKind::Lanes4:    return "lanes4";
        case HashEngineKind::Lanes8:    return "lanes8";
        case HashEngineKind::Lanes16:   return "lanes16";
        case HashEngineKind::Hardware:  return "hardware";
    }
    return "unknown";
}

HashEngine::HashEngine(HashEngineKind kind) : kind_(kind) {
    if (kind_ == HashEngineKind::Hardware) {
        Hash256 got = openssl_sha256(as_view(std::string_view("abc")));
        if (!std::equal(got.begin(), got.end(), ABC_DIGEST.begin())) {
            throw BackendUnavailable("OpenSSL sha256 self-test produced a wrong digest");
        }
    }
}

Hash256 HashEngine::sha256(ByteView data) const {
    Hash256 out;
    sha256_batch(&data, 1, &out);
    return out;
}

Hash256 HashEngine::hash256(ByteView data) const {
    Hash256 out;
    hash256_batch(&data, 1, &out);
    return out;
}

Hash256 HashEngine::tagged_hash(std::string_view tag, ByteView msg) const {
    Hash256 tag_hash = sha256(as_view(tag));
    Bytes buf;
    buf.reserve(64 + msg.size());
    append(buf, as_view(tag_hash));
    append(buf, as_view(tag_hash));
    append(buf, msg);
    return sha256(as_view(buf));
}

void HashEngine::sha256_batch(const ByteView* msgs, size_t count, Hash256* out) const {
    switch (kind_) {
        case HashEngineKind::Reference:
            for (size_t i = 0; i < count; i++) out[i] = SHA256::hash(msgs[i]);
            return;
        case HashEngineKind::Lanes4:
            Sha256Lanes<4>::hash_many(msgs, count, out);
            return;
        case HashEngineKind::Lanes8:
            Sha256Lanes<8>::hash_many(msgs, count, out);
            return;
        case HashEngineKind::Lanes16:
            Sha256Lanes<16>::hash_many(msgs, count, out);
            return;
        case HashEngineKind::Hardware:
            for (size_t i = 0; i < count; i++) out[i] = openssl_sha256(msgs[i]);
            return;
    }
}

void HashEngine::hash256_batch(const ByteView* msgs, size_t count, Hash256* out) const {
    std::vector<Hash256> first(count);
    sha256_batch(msgs, count, first.data());

    std::vector<ByteView> second(count);
    for (size_t i = 0; i < count; i++) second[i] = as_view(first[i]);
    sha256_batch(second.data(), count, out);
}

Hash256 merkle_root(const HashEngine& engine, std::vector<Hash256> level) {
    if (level.empty()) {
        throw std::invalid_argument("merkle_root: no leaves");
    }

    while (level.size() > 1) {
        if (level.size() % 2 != 0) level.push_back(level.back());

        size_t pairs = level.size() / 2;
        std::vector<Bytes> joined(pairs);
        std::vector<ByteView> views(pairs);
        for (size_t i = 0; i < pairs; i++) {
            joined[i].reserve(64);
            append(joined[i], as_view(level[2 * i]));
            append(joined[i], as_view(level[2 * i + 1]));
            views[i] = as_view(joined[i]);
        }

        std::vector<Hash256> next(pairs);
        engine.hash256_batch(views.data(), pairs, next.data());
        level = std::move(next);
    }
    return level[0];
}

}  // namespace crypto
}  // namespace conhal
