#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace aead
{

constexpr std::size_t NONCE_SIZE      = 12;  // GCM IV
constexpr std::size_t TAG_SIZE        = 16;  // GCM tag
constexpr std::size_t MIN_SEALED_SIZE = NONCE_SIZE + TAG_SIZE;

class PskAead
{
  public:
    virtual ~PskAead() = default;

    // out = [NONCE][CIPHERTEXT (len(plaintext) bytes)][TAG]
    virtual bool seal(const std::vector<std::uint8_t> &plaintext,
                      const std::uint8_t              *aad,
                      std::size_t                      aad_len,
                      std::vector<std::uint8_t>       &out) const = 0;

    // out is only written on successful tag verification
    virtual bool open(const std::vector<std::uint8_t> &in,
                      const std::uint8_t              *aad,
                      std::size_t                      aad_len,
                      std::vector<std::uint8_t>       &out) const = 0;
};

// AES-GCM with a pre-shared key; 16/24/32-byte keys pick AES-128/192/256.
class GcmPskAead : public PskAead
{
  public:
    GcmPskAead(const GcmPskAead &other) = default;
    GcmPskAead &operator=(const GcmPskAead &other) = default;
    ~GcmPskAead() override;

    bool seal(const std::vector<std::uint8_t> &plaintext,
              const std::uint8_t              *aad,
              std::size_t                      aad_len,
              std::vector<std::uint8_t>       &out) const override;

    bool open(const std::vector<std::uint8_t> &in,
              const std::uint8_t              *aad,
              std::size_t                      aad_len,
              std::vector<std::uint8_t>       &out) const override;

    std::size_t key_size() const { return key_.size(); }

    static std::optional<GcmPskAead> from_key(const std::vector<std::uint8_t> &key);
    static std::optional<GcmPskAead> from_env(const char *env_var);

  private:
    explicit GcmPskAead(std::vector<std::uint8_t> key) : key_(std::move(key)) {}

    std::vector<std::uint8_t> key_;
};

bool valid_key_size(std::size_t n);

// Hex first, then standard base64; surrounding blanks are ignored
bool parse_psk(std::string_view text, std::vector<std::uint8_t> &out);

}  // namespace aead
