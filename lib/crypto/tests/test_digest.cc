#include "crypto/digest.hpp"
#include "crypto/error.hpp"
#include "merkle_test_utils.hpp"
#include <gtest/gtest.h>

namespace Ledger::Crypto {

namespace {
    struct Note {
        std::string text;

        Digest digest() const { return digest_of(as_span(text)); }
    };
} // namespace

static_assert(Hashable<Digest>);
static_assert(Hashable<std::vector<Byte>>);
static_assert(Hashable<Note>);
static_assert(!Hashable<int>);

TEST(DigestTest, HexRoundTrip)
{
    const std::string hex = "6e18c8441bc8b0d1f0d4dc442c0d82ff2b4f38e2d7ca487c92e6db435d820a10";
    auto d = digest_from_hex(hex);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ((*d)[0], 0x6e);
    EXPECT_EQ((*d)[31], 0x10);
    EXPECT_EQ(to_hex(*d), hex);
}

TEST(DigestTest, HexAcceptsPrefixAndUppercase)
{
    auto lower = digest_from_hex("00000000000000000000000000000000000000000000000000000000000000ab");
    auto upper = digest_from_hex("0x00000000000000000000000000000000000000000000000000000000000000AB");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*lower, *upper);
}

TEST(DigestTest, HexRejectsMalformed)
{
    auto too_short = digest_from_hex("abcd");
    ASSERT_FALSE(too_short.has_value());
    EXPECT_EQ(too_short.error(), Error::InvalidHexLength);

    auto bad_digit = digest_from_hex("zz00000000000000000000000000000000000000000000000000000000000000");
    ASSERT_FALSE(bad_digit.has_value());
    EXPECT_EQ(bad_digit.error(), Error::InvalidHexDigit);
    EXPECT_EQ(bad_digit.error().category().name(), std::string("LedgerCrypto"));
}

TEST(DigestTest, FromBytesChecksLength)
{
    std::vector<Byte> raw(32, 0x5a);
    auto d = digest_from_bytes(raw);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ((*d)[17], 0x5a);

    raw.pop_back();
    auto bad = digest_from_bytes(raw);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error(), Error::InvalidDigestLength);
}

TEST(DigestTest, ZeroDigest)
{
    EXPECT_EQ(to_hex(zero_digest()), std::string(64, '0'));
}

// Digest 当作条目时要再哈希一次
TEST(DigestTest, DigestItemIsHashed)
{
    Digest item = hex_digest("0a0b0c0d0e0f0e0d0a0b0c0d0e0f0e0d0a0b0c0d0e0f0e0d0a0b0c0d0e0f0e0d");
    EXPECT_EQ(digest_of(item), hex_digest("b69566be6e1720872f73651d1851a0eae0060a132cf0f64a0ffaea248de6cba0"));
}

TEST(DigestTest, MemberDigestIsUsed)
{
    Note note { "hello" };
    EXPECT_EQ(digest_of(note), digest_of(to_bytes("hello")));
}

} // namespace Ledger::Crypto
