#include <array>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <openssl/evp.h>
#include <optional>
#include <sodium.h>
#include <string>

#include "crypto/psk_aead.hpp"
#include "util/log.hpp"

namespace aead
{

namespace
{

bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

const EVP_CIPHER *gcm_for_key(std::size_t key_len)
{
    switch (key_len)
    {
        case 16:
            return EVP_aes_128_gcm();
        case 24:
            return EVP_aes_192_gcm();
        case 32:
            return EVP_aes_256_gcm();
        default:
            return nullptr;
    }
}

struct CtxDeleter
{
    void operator()(EVP_CIPHER_CTX *c) const { EVP_CIPHER_CTX_free(c); }
};
using CtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CtxDeleter>;

bool is_hex_str(const std::string &s)
{
    if (s.empty() || s.size() % 2)
        return false;
    for (unsigned char c : s)
    {
        if (!std::isxdigit(c))
            return false;
    }
    return true;
}

}  // namespace

bool valid_key_size(std::size_t n)
{
    return n == 16 || n == 24 || n == 32;
}

bool parse_psk(std::string_view text, std::vector<std::uint8_t> &out)
{
    out.clear();
    const auto whitespace = " \t\r\n";
    const auto s_start    = text.find_first_not_of(whitespace);
    if (s_start == std::string_view::npos)
        return false;
    const auto  s_end = text.find_last_not_of(whitespace);
    std::string s(text.substr(s_start, s_end - s_start + 1));

    ensure_sodium_init();
    std::size_t real_len = 0;
    if (is_hex_str(s))
    {
        out.resize(s.size() / 2);
        if (sodium_hex2bin(out.data(), out.size(), s.c_str(), s.size(), nullptr, &real_len,
                           nullptr) != 0)
        {
            out.clear();
            return false;
        }
        out.resize(real_len);
        return true;
    }

    out.resize(s.size() / 4 * 3 + 3);
    if (sodium_base642bin(out.data(), out.size(), s.c_str(), s.size(), nullptr, &real_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        out.clear();
        return false;
    }
    out.resize(real_len);
    return true;
}

GcmPskAead::~GcmPskAead()
{
    if (!key_.empty())
        sodium_memzero(key_.data(), key_.size());
}

std::optional<GcmPskAead> GcmPskAead::from_key(const std::vector<std::uint8_t> &key)
{
    if (!valid_key_size(key.size()))
        return std::nullopt;
    return GcmPskAead{key};
}

std::optional<GcmPskAead> GcmPskAead::from_env(const char *env_var)
{
    if (!env_var)
        return std::nullopt;
    const char *s = std::getenv(env_var);
    if (!s || !*s)
        return std::nullopt;

    std::vector<std::uint8_t> key;
    if (!parse_psk(s, key))
    {
        LOG_WARN("%s is neither hex nor base64", env_var);
        return std::nullopt;
    }
    if (!valid_key_size(key.size()))
    {
        LOG_WARN("%s decodes to %zu bytes (expect 16, 24 or 32)", env_var, key.size());
        sodium_memzero(key.data(), key.size());
        return std::nullopt;
    }
    auto out = from_key(key);
    sodium_memzero(key.data(), key.size());
    return out;
}

bool GcmPskAead::seal(const std::vector<std::uint8_t> &plaintext,
                      const std::uint8_t              *aad,
                      std::size_t                      aad_len,
                      std::vector<std::uint8_t>       &out) const
{
    const EVP_CIPHER *cipher = gcm_for_key(key_.size());
    if (!cipher || plaintext.size() > INT_MAX || aad_len > INT_MAX)
        return false;

    ensure_sodium_init();
    const std::size_t mlen = plaintext.size();
    out.resize(NONCE_SIZE + mlen + TAG_SIZE);
    std::uint8_t *npub = out.data();
    std::uint8_t *c    = out.data() + NONCE_SIZE;
    std::uint8_t *tag  = out.data() + NONCE_SIZE + mlen;
    randombytes_buf(npub, NONCE_SIZE);

    CtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
        return false;

    int len = 0;
    std::array<std::uint8_t, 16> fin{};
    if (EVP_EncryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), npub) != 1)
    {
        out.clear();
        return false;
    }
    if (aad && aad_len &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad, static_cast<int>(aad_len)) != 1)
    {
        out.clear();
        return false;
    }
    if (mlen &&
        EVP_EncryptUpdate(ctx.get(), c, &len, plaintext.data(), static_cast<int>(mlen)) != 1)
    {
        out.clear();
        return false;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), fin.data(), &len) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE, tag) != 1)
    {
        out.clear();
        return false;
    }
    return true;
}

bool GcmPskAead::open(const std::vector<std::uint8_t> &in,
                      const std::uint8_t              *aad,
                      std::size_t                      aad_len,
                      std::vector<std::uint8_t>       &out) const
{
    const EVP_CIPHER *cipher = gcm_for_key(key_.size());
    // [npub (NONCE_SIZE)] [ciphertext] [tag (TAG_SIZE)]
    if (!cipher || in.size() < MIN_SEALED_SIZE || in.size() > INT_MAX || aad_len > INT_MAX)
        return false;

    const std::size_t   clen = in.size() - MIN_SEALED_SIZE;
    const std::uint8_t *npub = in.data();
    const std::uint8_t *c    = in.data() + NONCE_SIZE;
    std::array<std::uint8_t, TAG_SIZE> tag{};
    std::memcpy(tag.data(), in.data() + NONCE_SIZE + clen, TAG_SIZE);

    CtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
        return false;

    std::vector<std::uint8_t>    plain(clen);
    std::array<std::uint8_t, 16> fin{};
    int                          len = 0;
    bool ok = EVP_DecryptInit_ex(ctx.get(), cipher, nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) == 1 &&
              EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key_.data(), npub) == 1;
    if (ok && aad && aad_len)
        ok = EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad, static_cast<int>(aad_len)) == 1;
    if (ok && clen)
        ok = EVP_DecryptUpdate(ctx.get(), plain.data(), &len, c, static_cast<int>(clen)) == 1;
    if (ok)
        ok = EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag.data()) == 1;
    if (ok)
        ok = EVP_DecryptFinal_ex(ctx.get(), fin.data(), &len) > 0;

    if (!ok)
    {
        // never hand out unauthenticated plaintext
        if (!plain.empty())
            sodium_memzero(plain.data(), plain.size());
        return false;
    }
    out = std::move(plain);
    return true;
}

}  // namespace aead
