/**
 * conhal Core Types
 *
 * Byte containers, hex helpers and Bitcoin CompactSize encoding shared by the
 * crypto kernels, the script interpreter and the operation codecs.
 */

#pragma once

#include <array>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace conhal {

// -----------------------------------------------------------------------------
// Byte Types
// -----------------------------------------------------------------------------

using Bytes = std::vector<uint8_t>;
using ByteView = std::span<const uint8_t>;

/**
 * 32-byte digest (SHA-256, hash256, merkle node).
 */
using Hash256 = std::array<uint8_t, 32>;

inline ByteView as_view(const Bytes& b) { return ByteView(b.data(), b.size()); }
inline ByteView as_view(const Hash256& h) { return ByteView(h.data(), h.size()); }
inline ByteView as_view(std::string_view s) {
    return ByteView(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

inline void append(Bytes& out, ByteView in) {
    out.insert(out.end(), in.begin(), in.end());
}

// -----------------------------------------------------------------------------
// Hex
// -----------------------------------------------------------------------------

inline std::string to_hex(ByteView data) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

inline int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/**
 * Decode a hex string. Returns nullopt on odd length or a non-hex digit.
 */
inline std::optional<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    Bytes out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        int hi = hex_nibble(hex[2 * i]);
        int lo = hex_nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return out;
}

// -----------------------------------------------------------------------------
// CompactSize
// -----------------------------------------------------------------------------

inline void write_compact_size(Bytes& out, uint64_t n) {
    if (n < 0xFD) {
        out.push_back(static_cast<uint8_t>(n));
    } else if (n <= 0xFFFF) {
        out.push_back(0xFD);
        for (int i = 0; i < 2; i++) out.push_back(static_cast<uint8_t>(n >> (8 * i)));
    } else if (n <= 0xFFFFFFFFULL) {
        out.push_back(0xFE);
        for (int i = 0; i < 4; i++) out.push_back(static_cast<uint8_t>(n >> (8 * i)));
    } else {
        out.push_back(0xFF);
        for (int i = 0; i < 8; i++) out.push_back(static_cast<uint8_t>(n >> (8 * i)));
    }
}

/**
 * Forward-only reader over an input buffer. Every read reports truncation
 * instead of reading past the end.
 */
class ByteReader {
public:
    explicit ByteReader(ByteView data) : data_(data) {}

    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ == data_.size(); }

    bool read(size_t n, ByteView& out) {
        if (remaining() < n) return false;
        out = data_.subspan(pos_, n);
        pos_ += n;
        return true;
    }

    /**
     * Reads a CompactSize, rejecting non-canonical encodings.
     */
    bool read_compact_size(uint64_t& n) {
        ByteView b;
        if (!read(1, b)) return false;
        uint8_t tag = b[0];
        if (tag < 0xFD) {
            n = tag;
            return true;
        }
        size_t width = tag == 0xFD ? 2 : tag == 0xFE ? 4 : 8;
        if (!read(width, b)) return false;
        n = 0;
        for (size_t i = 0; i < width; i++) n |= static_cast<uint64_t>(b[i]) << (8 * i);
        uint64_t min = width == 2 ? 0xFD : width == 4 ? 0x10000 : 0x100000000ULL;
        return n >= min;
    }

private:
    ByteView data_;
    size_t pos_ = 0;
};

}  // namespace conhal
