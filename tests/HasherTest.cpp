#include <gtest/gtest.h>

#include "Hasher.hpp"

namespace {
    const std::string kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
    const std::string kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
}

TEST(HasherTest, KnownSha256Digests)
{
    auto [ok, hex, err] = Hasher::HexDigest(Hasher::Type::SHA256, "abc");
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(hex, kAbcSha256);

    auto [empty_ok, empty_hex, empty_err] = Hasher::HexDigest(Hasher::Type::SHA256, "");
    ASSERT_TRUE(empty_ok) << empty_err.message;
    EXPECT_EQ(empty_hex, kEmptySha256);
}

TEST(HasherTest, IncrementalUpdatesMatchOneShot)
{
    Hasher hasher(Hasher::Type::SHA256);
    ASSERT_FALSE(hasher.Initialize().has_value());
    ASSERT_FALSE(hasher.Update("a").has_value());
    ASSERT_FALSE(hasher.Update("bc", 2).has_value());

    auto [ok, digest, err] = hasher.Finalize();
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(digest.size(), hasher.GetDigestSize());
    EXPECT_EQ(Hasher::ToHex(digest), kAbcSha256);
}

TEST(HasherTest, CanBeReinitialized)
{
    Hasher hasher(Hasher::Type::SHA256);

    for (int round = 0; round < 2; round++) {
        ASSERT_FALSE(hasher.Initialize().has_value());
        ASSERT_FALSE(hasher.Update("abc").has_value());

        auto [ok, digest, err] = hasher.Finalize();
        ASSERT_TRUE(ok) << err.message;
        EXPECT_EQ(Hasher::ToHex(digest), kAbcSha256);
    }
}

TEST(HasherTest, UpdateBeforeInitializeFails)
{
    Hasher hasher(Hasher::Type::SHA256);

    EXPECT_TRUE(hasher.Update("abc").has_value());

    auto [ok, digest, err] = hasher.Finalize();
    EXPECT_FALSE(ok);
}

TEST(HasherTest, Sha512DigestSize)
{
    Hasher hasher(Hasher::Type::SHA512);
    EXPECT_EQ(hasher.GetType(), Hasher::Type::SHA512);
    EXPECT_EQ(hasher.GetDigestSize(), 64U);

    auto [ok, hex, err] = Hasher::HexDigest(Hasher::Type::SHA512, "abc");
    ASSERT_TRUE(ok) << err.message;
    EXPECT_EQ(hex.size(), 128U);
    EXPECT_EQ(hex.substr(0, 16), "ddaf35a193617aba");
}

TEST(HasherTest, HexIsLowercaseAndZeroPadded)
{
    EXPECT_EQ(Hasher::ToHex({ 0x00, 0x0f, 0xa0, 0xff }), "000fa0ff");
    EXPECT_EQ(Hasher::ToHex({}), "");
}
