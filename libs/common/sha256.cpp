/**
 * @file sha256.cpp
 * @brief SHA-256 (FIPS 180-4), standalone, plus hash-derived URNs
 */

#include "kcfgvex/common.hpp"

#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <format>
#include <span>

namespace kcfgvex::common {

namespace {

constexpr std::array<std::uint32_t, 64> kRoundConstants = {
    {0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4,
     0xab1c5ed5, 0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe,
     0x9bdc06a7, 0xc19bf174, 0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f,
     0x4a7484aa, 0x5cb0a9dc, 0x76f988da, 0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
     0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967, 0x27b70a85, 0x2e1b2138, 0x4d2c6dfc,
     0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85, 0xa2bfe8a1, 0xa81a664b,
     0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070, 0x19a4c116,
     0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
     0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7,
     0xc67178f2}
};

constexpr std::array<std::uint32_t, 8> kInitialState = {
    {0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab,
     0x5be0cd19}
};

[[nodiscard]] constexpr std::uint32_t choose(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (~x & z);
}

[[nodiscard]] constexpr std::uint32_t majority(std::uint32_t x, std::uint32_t y, std::uint32_t z) noexcept
{
    return (x & y) ^ (x & z) ^ (y & z);
}

[[nodiscard]] constexpr std::uint32_t big_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 2U) ^ std::rotr(x, 13U) ^ std::rotr(x, 22U);
}

[[nodiscard]] constexpr std::uint32_t big_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 6U) ^ std::rotr(x, 11U) ^ std::rotr(x, 25U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma0(std::uint32_t x) noexcept
{
    return std::rotr(x, 7U) ^ std::rotr(x, 18U) ^ (x >> 3U);
}

[[nodiscard]] constexpr std::uint32_t small_sigma1(std::uint32_t x) noexcept
{
    return std::rotr(x, 17U) ^ std::rotr(x, 19U) ^ (x >> 10U);
}

class Sha256Hasher
{
public:
    Sha256Hasher()
        : m_state(kInitialState)
        , m_block{}
        , m_block_len(0)
        , m_total_bits(0)
    {}

    void update(std::string_view data)
    {
        for (char c : data) {
            m_block[m_block_len++] = static_cast<std::uint8_t>(c);
            if (m_block_len == m_block.size()) {
                compress();
                m_total_bits += 512;
                m_block_len = 0;
            }
        }
    }

    [[nodiscard]] std::array<std::uint8_t, 32> finish()
    {
        const std::uint64_t total_bits = m_total_bits + (m_block_len * 8U);

        m_block[m_block_len++] = 0x80;
        if (m_block_len > 56) {
            while (m_block_len < m_block.size()) {
                m_block[m_block_len++] = 0;
            }
            compress();
            m_block_len = 0;
        }
        while (m_block_len < 56) {
            m_block[m_block_len++] = 0;
        }
        for (int i = 7; i >= 0; --i) {
            m_block[m_block_len++] =
                static_cast<std::uint8_t>(total_bits >> (static_cast<unsigned>(i) * 8U));
        }
        compress();

        std::array<std::uint8_t, 32> digest{};
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            digest[(i * 4) + 0] = static_cast<std::uint8_t>(m_state[i] >> 24U);
            digest[(i * 4) + 1] = static_cast<std::uint8_t>(m_state[i] >> 16U);
            digest[(i * 4) + 2] = static_cast<std::uint8_t>(m_state[i] >> 8U);
            digest[(i * 4) + 3] = static_cast<std::uint8_t>(m_state[i]);
        }
        return digest;
    }

private:
    void compress()
    {
        std::array<std::uint32_t, 64> schedule{};
        for (std::size_t i = 0; i < 16; ++i) {
            std::uint32_t word = 0;
            std::memcpy(&word, &m_block[i * 4], sizeof(word));
            if constexpr (std::endian::native == std::endian::little) {
                word = std::byteswap(word);
            }
            schedule[i] = word;
        }
        for (std::size_t i = 16; i < schedule.size(); ++i) {
            schedule[i] = small_sigma1(schedule[i - 2]) + schedule[i - 7]
                          + small_sigma0(schedule[i - 15]) + schedule[i - 16];
        }

        std::array<std::uint32_t, 8> v = m_state;
        for (std::size_t i = 0; i < schedule.size(); ++i) {
            const std::uint32_t t1 =
                v[7] + big_sigma1(v[4]) + choose(v[4], v[5], v[6]) + kRoundConstants[i] + schedule[i];
            const std::uint32_t t2 = big_sigma0(v[0]) + majority(v[0], v[1], v[2]);
            v[7] = v[6];
            v[6] = v[5];
            v[5] = v[4];
            v[4] = v[3] + t1;
            v[3] = v[2];
            v[2] = v[1];
            v[1] = v[0];
            v[0] = t1 + t2;
        }
        for (std::size_t i = 0; i < m_state.size(); ++i) {
            m_state[i] += v[i];
        }
    }

    std::array<std::uint32_t, 8> m_state;
    std::array<std::uint8_t, 64> m_block;
    std::size_t m_block_len;
    std::uint64_t m_total_bits;
};

[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes)
{
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (std::uint8_t b : bytes) {
        hex += std::format("{:02x}", b);
    }
    return hex;
}

}  // namespace

std::string sha256(std::string_view data)
{
    Sha256Hasher hasher;
    hasher.update(data);
    const auto digest = hasher.finish();
    return to_hex(digest);
}

std::string sha256_prefixed(std::string_view data)
{
    return "sha256:" + sha256(data);
}

std::string uuid_urn_from_hash(std::string_view data)
{
    std::string hex = sha256(data);
    // Version nibble 5 (name-based), RFC 4122 variant bits.
    hex[12] = '5';
    constexpr std::string_view kVariantDigits = "89ab";
    const auto variant_index = static_cast<std::size_t>(
        std::string_view("0123456789abcdef").find(hex[16]) % kVariantDigits.size());
    hex[16] = kVariantDigits[variant_index];
    return std::format("urn:uuid:{}-{}-{}-{}-{}",
                       hex.substr(0, 8),
                       hex.substr(8, 4),
                       hex.substr(12, 4),
                       hex.substr(16, 4),
                       hex.substr(20, 12));
}

}  // namespace kcfgvex::common
