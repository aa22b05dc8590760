#include <cstdlib>
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "crypto/psk_aead.hpp"

using namespace aead;

namespace
{
struct EnvGuard
{
    std::string var;
    std::string old;
    bool        had = false;

    EnvGuard(const char *v, const char *val) : var(v)
    {
        if (const char *p = std::getenv(var.c_str()))
        {
            had = true;
            old = p;
        }
        ::setenv(var.c_str(), val, 1);
    }

    ~EnvGuard()
    {
        if (had)
            ::setenv(var.c_str(), old.c_str(), 1);
        else
            ::unsetenv(var.c_str());
    }
};

std::vector<std::uint8_t> bytes_of(const std::string &s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
}  // namespace

TEST(AEAD_Gcm, FromEnv_InvalidText)
{
    EnvGuard g("CLIPSYNC_PSK", "not-hex!");
    EXPECT_FALSE(GcmPskAead::from_env("CLIPSYNC_PSK").has_value());
}

TEST(AEAD_Gcm, FromEnv_WrongKeySize)
{
    // 20 bytes
    EnvGuard g("CLIPSYNC_PSK", "0102030405060708090a0b0c0d0e0f1011121314");
    EXPECT_FALSE(GcmPskAead::from_env("CLIPSYNC_PSK").has_value());
}

TEST(AEAD_Gcm, FromEnv_HexAndBase64)
{
    {
        EnvGuard g("CLIPSYNC_PSK", "  000102030405060708090a0b0c0d0e0f  ");
        auto     s = GcmPskAead::from_env("CLIPSYNC_PSK");
        ASSERT_TRUE(s.has_value());
        EXPECT_EQ(s->key_size(), 16u);
    }
    {
        // 32 bytes of 0x00 in base64
        EnvGuard g("CLIPSYNC_PSK", "AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA=");
        auto     s = GcmPskAead::from_env("CLIPSYNC_PSK");
        ASSERT_TRUE(s.has_value());
        EXPECT_EQ(s->key_size(), 32u);
    }
}

TEST(AEAD_Gcm, FromEnv_Unset)
{
    ::unsetenv("CLIPSYNC_PSK_UNSET_FOR_TEST");
    EXPECT_FALSE(GcmPskAead::from_env("CLIPSYNC_PSK_UNSET_FOR_TEST").has_value());
}

TEST(AEAD_Gcm, ParsePsk)
{
    std::vector<std::uint8_t> out;
    ASSERT_TRUE(parse_psk("DEADbeef", out));
    EXPECT_EQ(out, (std::vector<std::uint8_t>{0xDE, 0xAD, 0xBE, 0xEF}));
    ASSERT_TRUE(parse_psk("aGk=", out));
    EXPECT_EQ(out, bytes_of("hi"));
    EXPECT_FALSE(parse_psk("   ", out));
    EXPECT_FALSE(parse_psk("@@@@", out));
}

TEST(AEAD_Gcm, Roundtrip_Hello)
{
    // 32-byte key: all 0x11 -> 64 hex '11...'
    const char *keyhex = "1111111111111111111111111111111111111111111111111111111111111111";
    EnvGuard    g("CLIPSYNC_PSK", keyhex);

    auto s = GcmPskAead::from_env("CLIPSYNC_PSK");
    ASSERT_TRUE(s.has_value());
    GcmPskAead aead = *s;

    const auto                msg = bytes_of("hello");
    std::vector<std::uint8_t> ct, pt;

    ASSERT_TRUE(aead.seal(msg, nullptr, 0, ct));
    // out = NONCE || ciphertext || TAG
    EXPECT_EQ(ct.size(), NONCE_SIZE + msg.size() + TAG_SIZE);
    ASSERT_TRUE(aead.open(ct, nullptr, 0, pt));
    EXPECT_EQ(pt, msg);

    ct.back() ^= 0x01;
    EXPECT_FALSE(aead.open(ct, nullptr, 0, pt));
}

TEST(AEAD_Gcm, FreshNoncePerSeal)
{
    auto s = GcmPskAead::from_key(std::vector<std::uint8_t>(16, 0x42));
    ASSERT_TRUE(s.has_value());

    std::vector<std::uint8_t> a, b;
    ASSERT_TRUE(s->seal(bytes_of("same"), nullptr, 0, a));
    ASSERT_TRUE(s->seal(bytes_of("same"), nullptr, 0, b));
    EXPECT_NE(std::vector<std::uint8_t>(a.begin(), a.begin() + NONCE_SIZE),
              std::vector<std::uint8_t>(b.begin(), b.begin() + NONCE_SIZE));
}

TEST(AEAD_Gcm, Roundtrip_ZeroLen)
{
    auto s = GcmPskAead::from_key(std::vector<std::uint8_t>(24, 0x22));
    ASSERT_TRUE(s.has_value());

    std::vector<std::uint8_t> ct, pt{1, 2, 3};
    ASSERT_TRUE(s->seal({}, nullptr, 0, ct));
    EXPECT_EQ(ct.size(), MIN_SEALED_SIZE);
    ASSERT_TRUE(s->open(ct, nullptr, 0, pt));
    EXPECT_TRUE(pt.empty());
}

TEST(AEAD_Gcm, AAD_Mismatch_Fails)
{
    auto s = GcmPskAead::from_key(std::vector<std::uint8_t>(32, 0xAA));
    ASSERT_TRUE(s.has_value());

    const std::uint8_t aad_ok[2]  = {0x01, 0x06};
    const std::uint8_t aad_bad[2] = {0x02, 0x06};

    std::vector<std::uint8_t> ct, pt;
    ASSERT_TRUE(s->seal(bytes_of("with aad"), aad_ok, sizeof(aad_ok), ct));
    ASSERT_TRUE(s->open(ct, aad_ok, sizeof(aad_ok), pt));
    EXPECT_EQ(pt, bytes_of("with aad"));

    pt.clear();
    EXPECT_FALSE(s->open(ct, aad_bad, sizeof(aad_bad), pt));
    EXPECT_TRUE(pt.empty());
}

TEST(AEAD_Gcm, WrongKeyFails)
{
    auto a = GcmPskAead::from_key(std::vector<std::uint8_t>(32, 0x01));
    auto b = GcmPskAead::from_key(std::vector<std::uint8_t>(32, 0x02));
    ASSERT_TRUE(a && b);

    std::vector<std::uint8_t> ct, pt;
    ASSERT_TRUE(a->seal(bytes_of("secret"), nullptr, 0, ct));
    EXPECT_FALSE(b->open(ct, nullptr, 0, pt));
}

TEST(AEAD_Gcm, ShortInputFails)
{
    auto s = GcmPskAead::from_key(std::vector<std::uint8_t>(16, 0x01));
    ASSERT_TRUE(s.has_value());
    std::vector<std::uint8_t> pt;
    EXPECT_FALSE(s->open(std::vector<std::uint8_t>(MIN_SEALED_SIZE - 1, 0), nullptr, 0, pt));
}
