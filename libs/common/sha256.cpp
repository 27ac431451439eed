/**
 * @file sha256.cpp
 * @brief SHA-256 digests of in-memory data and of files (used for content
 *        hashes in differential scans)
 */

#include "pkgaudit/common.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <cstddef>
#include <cstring>
#include <format>
#include <fstream>
#include <ranges>
#include <span>

namespace pkgaudit::common {

namespace {

constexpr std::size_t kBlockSize = 64;
constexpr std::size_t kFileChunkSize = 64 * 1024;

constexpr std::array<std::uint32_t, 64> kRoundConstants = {{
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
}};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
};

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2) ^ std::rotr(x, 13) ^ std::rotr(x, 22);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6) ^ std::rotr(x, 11) ^ std::rotr(x, 25);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7) ^ std::rotr(x, 18) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17) ^ std::rotr(x, 19) ^ (x >> 10U);
}

[[nodiscard]] std::uint32_t load_be32(const unsigned char* bytes) noexcept
{
    std::uint32_t value{};
    std::memcpy(&value, bytes, sizeof(value));
    if constexpr (std::endian::native == std::endian::little) {
        return std::byteswap(value);
    }
    return value;
}

/// Incremental hasher; whole blocks are compressed straight from the input.
class Sha256Hasher
{
public:
    void update(std::span<const unsigned char> data)
    {
        m_total_bytes += data.size();

        if (m_pending_len > 0) {
            const std::size_t take = std::min(kBlockSize - m_pending_len, data.size());
            std::memcpy(m_pending.data() + m_pending_len, data.data(), take);
            m_pending_len += take;
            data = data.subspan(take);
            if (m_pending_len < kBlockSize) {
                return;
            }
            compress(m_pending.data());
            m_pending_len = 0;
        }

        while (data.size() >= kBlockSize) {
            compress(data.data());
            data = data.subspan(kBlockSize);
        }

        std::memcpy(m_pending.data(), data.data(), data.size());
        m_pending_len = data.size();
    }

    void update(std::string_view data)
    {
        update(std::as_bytes(std::span(data.data(), data.size())));
    }

    void update(std::span<const std::byte> data)
    {
        update(std::span<const unsigned char>(reinterpret_cast<const unsigned char*>(data.data()),
                                              data.size()));
    }

    [[nodiscard]] std::string hex_digest()
    {
        const std::uint64_t total_bits = m_total_bytes * 8U;

        std::array<unsigned char, kBlockSize * 2> tail{};
        std::memcpy(tail.data(), m_pending.data(), m_pending_len);
        tail[m_pending_len] = 0x80;
        const std::size_t tail_len = (m_pending_len + 1 + 8 <= kBlockSize) ? kBlockSize
                                                                           : kBlockSize * 2;
        for (std::size_t i = 0; i < 8; ++i) {
            tail[tail_len - 1 - i] = static_cast<unsigned char>(total_bits >> (8U * i));
        }
        for (std::size_t offset = 0; offset < tail_len; offset += kBlockSize) {
            compress(tail.data() + offset);
        }

        std::string out;
        out.reserve(64);
        for (std::uint32_t word : m_state) {
            out += std::format("{:08x}", word);
        }
        return out;
    }

private:
    void compress(const unsigned char* block)
    {
        std::array<std::uint32_t, 64> w{};
        for (std::size_t i = 0; i < 16; ++i) {
            w[i] = load_be32(block + (i * 4));
        }
        for (std::size_t i = 16; i < 64; ++i) {
            w[i] = small_sigma1(w[i - 2]) + w[i - 7] + small_sigma0(w[i - 15]) + w[i - 16];
        }

        auto [a, b, c, d, e, f, g, h] = m_state;
        for (auto [i, word] : std::views::enumerate(w)) {
            const std::uint32_t t1 = h + big_sigma1(e) + ((e & f) ^ (~e & g))
                                     + kRoundConstants[static_cast<std::size_t>(i)] + word;
            const std::uint32_t t2 = big_sigma0(a) + ((a & b) ^ (a & c) ^ (b & c));
            h = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }

        const std::array<std::uint32_t, 8> rounds = {a, b, c, d, e, f, g, h};
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            m_state[i] += rounds[i];
        }
    }

    std::array<std::uint32_t, 8> m_state = kInitialState;
    std::array<unsigned char, kBlockSize> m_pending{};
    std::size_t m_pending_len = 0;
    std::uint64_t m_total_bytes = 0;
};

}  // namespace

std::string sha256(std::string_view data)
{
    Sha256Hasher hasher;
    hasher.update(data);
    return hasher.hex_digest();
}

pkgaudit::Result<std::string> sha256_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open file for hashing: " + path.string()));
    }

    Sha256Hasher hasher;
    std::array<char, kFileChunkSize> chunk{};
    while (in) {
        in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got > 0) {
            hasher.update(std::string_view(chunk.data(), got));
        }
    }
    if (in.bad()) {
        return std::unexpected(
            Error::make("IOError", "Failed to read file for hashing: " + path.string()));
    }
    return hasher.hex_digest();
}

}  // namespace pkgaudit::common
