#include <preload/core/byte_string.hpp>
#include <preload/core/bytes.hpp>
#include <preload/core/keccak.hpp>
#include <preload/core/sha256.hpp>

#include <gtest/gtest.h>

#include <string_view>

using namespace preload;

TEST(Hash, keccak256)
{
    EXPECT_EQ(
        keccak256({}),
        0xc5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470_bytes32);
}

TEST(Hash, sha256)
{
    using namespace std::string_view_literals;

    EXPECT_EQ(
        sha256(to_byte_string_view("abc"sv)),
        0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad_bytes32);
}

TEST(Hash, sha256_pair)
{
    // root of two empty chunks, the first zero hash of every SSZ tree
    bytes32_t const zero{};
    EXPECT_EQ(
        sha256(zero, zero),
        0xf5a5fd42d16a20302798ef6ed309979b43003d2320d9f0e8ea9831a92759fb4b_bytes32);

    byte_string concatenated{to_byte_string_view(zero)};
    concatenated += to_byte_string_view(zero);
    EXPECT_EQ(sha256(concatenated), sha256(zero, zero));
}
