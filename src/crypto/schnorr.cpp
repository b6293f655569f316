/**
 * BIP-340 Schnorr implementation
 */

#include "schnorr.hpp"

#include <algorithm>

namespace conhal {
namespace crypto {

namespace {

constexpr const char* TAG_CHALLENGE = "BIP0340/challenge";
constexpr const char* TAG_AUX = "BIP0340/aux";
constexpr const char* TAG_NONCE = "BIP0340/nonce";

uint256_t challenge(const HashEngine& hash, const uint8_t* r32, const uint8_t* px32, ByteView msg) {
    Bytes buf;
    buf.reserve(64 + msg.size());
    append(buf, ByteView(r32, 32));
    append(buf, ByteView(px32, 32));
    append(buf, msg);
    Hash256 e = hash.tagged_hash(TAG_CHALLENGE, as_view(buf));
    return scalar_reduce(uint256_t::from_bytes(e.data()));
}

// R = s*G - e*P must have even y and x(R) = r
bool check_equation(const EcMultiplier& ec, const AffinePoint& P, const uint256_t& r,
                    const uint256_t& s, const uint256_t& e) {
    AffinePoint R = ec_to_affine(ec.mul_add(s, scalar_neg(e), P));
    if (R.infinity || !R.has_even_y()) return false;
    return R.x == r;
}

}  // namespace

bool SchnorrVerifier::verify(ByteView msg, ByteView pubkey, ByteView sig) const {
    if (pubkey.size() != 32 || sig.size() != 64) return false;

    auto P = lift_x(uint256_t::from_bytes(pubkey.data()));
    if (!P) return false;

    uint256_t r = uint256_t::from_bytes(sig.data());
    uint256_t s = uint256_t::from_bytes(sig.data() + 32);
    if (r >= SECP256K1_P || s >= SECP256K1_N) return false;

    uint256_t e = challenge(hash_, sig.data(), pubkey.data(), msg);
    return check_equation(ec_, *P, r, s, e);
}

std::vector<bool> SchnorrVerifier::verify_batch(const std::vector<SchnorrBatchItem>& items) const {
    const size_t n = items.size();
    std::vector<bool> result(n, false);
    if (n == 0) return result;

    // tag || tag || r || P || m for every well-sized item
    Hash256 tag = hash_.sha256(as_view(std::string_view(TAG_CHALLENGE)));
    std::vector<Bytes> preimages(n);
    for (size_t i = 0; i < n; i++) {
        const SchnorrBatchItem& it = items[i];
        if (it.pubkey.size() != 32 || it.sig.size() != 64) continue;
        Bytes& buf = preimages[i];
        buf.reserve(128 + it.msg.size());
        append(buf, as_view(tag));
        append(buf, as_view(tag));
        append(buf, it.sig.subspan(0, 32));
        append(buf, it.pubkey);
        append(buf, it.msg);
    }

    std::vector<ByteView> views(n);
    for (size_t i = 0; i < n; i++) views[i] = as_view(preimages[i]);
    std::vector<Hash256> digests(n);
    hash_.sha256_batch(views.data(), n, digests.data());

    for (size_t i = 0; i < n; i++) {
        const SchnorrBatchItem& it = items[i];
        if (preimages[i].empty()) continue;

        auto P = lift_x(uint256_t::from_bytes(it.pubkey.data()));
        if (!P) continue;

        uint256_t r = uint256_t::from_bytes(it.sig.data());
        uint256_t s = uint256_t::from_bytes(it.sig.data() + 32);
        if (r >= SECP256K1_P || s >= SECP256K1_N) continue;

        uint256_t e = scalar_reduce(uint256_t::from_bytes(digests[i].data()));
        result[i] = check_equation(ec_, *P, r, s, e);
    }
    return result;
}

std::optional<XOnlyPubKey> xonly_pubkey(ByteView seckey) {
    if (seckey.size() != 32) return std::nullopt;
    uint256_t d = uint256_t::from_bytes(seckey.data());
    if (d.is_zero() || d >= SECP256K1_N) return std::nullopt;

    EcMultiplier ec;
    AffinePoint P = ec_to_affine(ec.mul_base(d));
    return P.x.to_bytes();
}

std::optional<SchnorrSig> schnorr_sign(ByteView seckey, ByteView msg, ByteView aux) {
    if (seckey.size() != 32 || aux.size() != 32) return std::nullopt;

    uint256_t d0 = uint256_t::from_bytes(seckey.data());
    if (d0.is_zero() || d0 >= SECP256K1_N) return std::nullopt;

    HashEngine hash;
    EcMultiplier ec;

    AffinePoint P = ec_to_affine(ec.mul_base(d0));
    uint256_t d = P.has_even_y() ? d0 : scalar_neg(d0);
    auto px = P.x.to_bytes();

    // t = bytes(d) xor hash_aux(a)
    Hash256 aux_hash = hash.tagged_hash(TAG_AUX, aux);
    auto d_bytes = d.to_bytes();
    Bytes nonce_input(32);
    for (int i = 0; i < 32; i++) nonce_input[i] = d_bytes[i] ^ aux_hash[i];
    append(nonce_input, ByteView(px.data(), 32));
    append(nonce_input, msg);

    Hash256 rand = hash.tagged_hash(TAG_NONCE, as_view(nonce_input));
    uint256_t k0 = scalar_reduce(uint256_t::from_bytes(rand.data()));
    if (k0.is_zero()) return std::nullopt;

    AffinePoint R = ec_to_affine(ec.mul_base(k0));
    uint256_t k = R.has_even_y() ? k0 : scalar_neg(k0);
    auto rx = R.x.to_bytes();

    uint256_t e = challenge(hash, rx.data(), px.data(), msg);
    uint256_t s = scalar_add(k, scalar_mul(e, d));

    SchnorrSig sig;
    std::copy(rx.begin(), rx.end(), sig.begin());
    s.to_bytes(sig.data() + 32);
    return sig;
}

}  // namespace crypto
}  // namespace conhal
