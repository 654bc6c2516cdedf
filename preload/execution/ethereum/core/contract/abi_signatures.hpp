#pragma once

#include <preload/core/bytes.hpp>
#include <preload/core/config.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

PRELOAD_NAMESPACE_BEGIN

namespace detail
{
    inline constexpr uint64_t KECCAK_ROUND_CONSTANTS[24] = {
        0x0000000000000001, 0x0000000000008082, 0x800000000000808a,
        0x8000000080008000, 0x000000000000808b, 0x0000000080000001,
        0x8000000080008081, 0x8000000000008009, 0x000000000000008a,
        0x0000000000000088, 0x0000000080008009, 0x000000008000000a,
        0x000000008000808b, 0x800000000000008b, 0x8000000000008089,
        0x8000000000008003, 0x8000000000008002, 0x8000000000000080,
        0x000000000000800a, 0x800000008000000a, 0x8000000080008081,
        0x8000000000008080, 0x0000000080000001, 0x8000000080008008,
    };

    inline constexpr unsigned KECCAK_ROTATIONS[24] = {
        1,  3,  6,  10, 15, 21, 28, 36, 45, 55, 2,  14,
        27, 41, 56, 8,  25, 43, 62, 18, 39, 61, 20, 44,
    };

    inline constexpr unsigned KECCAK_PI_LANES[24] = {
        10, 7,  11, 17, 18, 3, 5,  16, 8,  21, 24, 4,
        15, 23, 19, 13, 12, 2, 20, 14, 22, 9,  6,  1,
    };

    constexpr uint64_t rotl64(uint64_t const x, unsigned const s) noexcept
    {
        return (x << s) | (x >> (64 - s));
    }

    constexpr void keccak_f1600(uint64_t (&st)[25]) noexcept
    {
        for (size_t round = 0; round < 24; ++round) {
            // theta
            uint64_t bc[5]{};
            for (size_t i = 0; i < 5; ++i) {
                bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^
                        st[i + 20];
            }
            for (size_t i = 0; i < 5; ++i) {
                uint64_t const t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
                for (size_t j = 0; j < 25; j += 5) {
                    st[j + i] ^= t;
                }
            }

            // rho and pi
            uint64_t t = st[1];
            for (size_t i = 0; i < 24; ++i) {
                size_t const j = KECCAK_PI_LANES[i];
                uint64_t const next = st[j];
                st[j] = rotl64(t, KECCAK_ROTATIONS[i]);
                t = next;
            }

            // chi
            for (size_t j = 0; j < 25; j += 5) {
                for (size_t i = 0; i < 5; ++i) {
                    bc[i] = st[j + i];
                }
                for (size_t i = 0; i < 5; ++i) {
                    st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
                }
            }

            // iota
            st[0] ^= KECCAK_ROUND_CONSTANTS[round];
        }
    }

    // Same digest as the runtime keccak256, usable in constant expressions
    // so selectors and event topics are fixed at compile time.
    constexpr bytes32_t constexpr_keccak256(std::string_view const input)
    {
        constexpr size_t RATE = 136;

        uint64_t st[25]{};
        auto const absorb = [&st](size_t const pos, unsigned char const c) {
            st[pos / 8] ^= static_cast<uint64_t>(c) << (8 * (pos % 8));
        };

        size_t i = 0;
        for (; input.size() - i >= RATE; i += RATE) {
            for (size_t k = 0; k < RATE; ++k) {
                absorb(k, static_cast<unsigned char>(input[i + k]));
            }
            keccak_f1600(st);
        }
        size_t const rem = input.size() - i;
        for (size_t k = 0; k < rem; ++k) {
            absorb(k, static_cast<unsigned char>(input[i + k]));
        }
        absorb(rem, 0x01);
        absorb(RATE - 1, 0x80);
        keccak_f1600(st);

        bytes32_t out{};
        for (size_t k = 0; k < sizeof(out.bytes); ++k) {
            out.bytes[k] = static_cast<uint8_t>(st[k / 8] >> (8 * (k % 8)));
        }
        return out;
    }
}

// First four bytes of keccak256 of the canonical signature, big endian
constexpr uint32_t abi_encode_selector(std::string_view const signature)
{
    bytes32_t const hash = detail::constexpr_keccak256(signature);
    return (static_cast<uint32_t>(hash.bytes[0]) << 24) |
           (static_cast<uint32_t>(hash.bytes[1]) << 16) |
           (static_cast<uint32_t>(hash.bytes[2]) << 8) |
           static_cast<uint32_t>(hash.bytes[3]);
}

// topic[0] of a non-anonymous event
constexpr bytes32_t abi_encode_event_signature(std::string_view const signature)
{
    return detail::constexpr_keccak256(signature);
}

PRELOAD_NAMESPACE_END
