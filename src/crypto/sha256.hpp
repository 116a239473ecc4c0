#pragma once

// Header-only streaming SHA-256 (FIPS 180-4).
// Used for chunk and payload hashes and for item content hashes.
// Internal header, not installed.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>

namespace peersync::crypto {

using Digest = std::array<std::byte, 32>;

namespace detail {

inline constexpr std::uint32_t k[64] = {
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
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline constexpr auto rotr(std::uint32_t x, unsigned n) -> std::uint32_t {
    return (x >> n) | (x << (32 - n));
}

inline auto read_be32(const std::byte* p) -> std::uint32_t {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           (static_cast<std::uint32_t>(p[3]));
}

inline void write_be32(std::byte* p, std::uint32_t v) {
    p[0] = static_cast<std::byte>(v >> 24);
    p[1] = static_cast<std::byte>(v >> 16);
    p[2] = static_cast<std::byte>(v >> 8);
    p[3] = static_cast<std::byte>(v);
}

}  // namespace detail

// Incremental hasher: update() any number of times, then finish() once.
class Sha256 {
public:
    void update(std::span<const std::byte> data) {
        if (data.empty()) return;
        total_bytes_ += data.size();
        auto* p = data.data();
        auto n = data.size();

        if (buffered_ > 0) {
            auto take = std::min(n, block_.size() - buffered_);
            std::memcpy(block_.data() + buffered_, p, take);
            buffered_ += take;
            p += take;
            n -= take;
            if (buffered_ < block_.size()) return;
            compress(block_.data());
            buffered_ = 0;
        }
        while (n >= block_.size()) {
            compress(p);
            p += block_.size();
            n -= block_.size();
        }
        if (n > 0) {
            std::memcpy(block_.data(), p, n);
            buffered_ = n;
        }
    }

    void update(std::string_view text) {
        update(std::as_bytes(std::span{text.data(), text.size()}));
    }

    auto finish() -> Digest {
        const auto bit_len = static_cast<std::uint64_t>(total_bytes_) * 8;

        // Padding: 0x80, zeros up to 56 mod 64, then the 64-bit length.
        block_[buffered_++] = std::byte{0x80};
        if (buffered_ > 56) {
            std::memset(block_.data() + buffered_, 0, block_.size() - buffered_);
            compress(block_.data());
            buffered_ = 0;
        }
        std::memset(block_.data() + buffered_, 0, 56 - buffered_);
        for (int i = 0; i < 8; ++i) {
            block_[56 + static_cast<std::size_t>(i)] =
                static_cast<std::byte>(bit_len >> (56 - 8 * i));
        }
        compress(block_.data());

        auto result = Digest{};
        for (std::size_t i = 0; i < 8; ++i) {
            detail::write_be32(result.data() + i * 4, h_[i]);
        }
        return result;
    }

private:
    void compress(const std::byte* bp) {
        using namespace detail;
        auto w = std::array<std::uint32_t, 64>{};
        for (std::size_t i = 0; i < 16; ++i) w[i] = read_be32(bp + i * 4);
        for (std::size_t i = 16; i < 64; ++i) {
            auto g0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
            auto g1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
            w[i] = g1 + w[i - 7] + g0 + w[i - 16];
        }

        auto a = h_[0], b = h_[1], c = h_[2], d = h_[3];
        auto e = h_[4], f = h_[5], g = h_[6], hh = h_[7];

        for (std::size_t i = 0; i < 64; ++i) {
            auto s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
            auto ch = (e & f) ^ (~e & g);
            auto t1 = hh + s1 + ch + k[i] + w[i];
            auto s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
            auto maj = (a & b) ^ (a & c) ^ (b & c);
            auto t2 = s0 + maj;
            hh = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }

        h_[0] += a; h_[1] += b; h_[2] += c; h_[3] += d;
        h_[4] += e; h_[5] += f; h_[6] += g; h_[7] += hh;
    }

    std::array<std::uint32_t, 8> h_{
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
    };
    std::array<std::byte, 64> block_{};
    std::size_t buffered_ = 0;
    std::uint64_t total_bytes_ = 0;
};

inline auto sha256(std::span<const std::byte> input) -> Digest {
    auto hasher = Sha256{};
    hasher.update(input);
    return hasher.finish();
}

inline auto to_hex(const Digest& digest) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(digest.size() * 2);
    for (auto b : digest) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

inline auto sha256_hex(std::span<const std::byte> input) -> std::string {
    return to_hex(sha256(input));
}

inline auto sha256_hex(std::string_view text) -> std::string {
    auto hasher = Sha256{};
    hasher.update(text);
    return to_hex(hasher.finish());
}

}  // namespace peersync::crypto
