#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "crypto/psk_aead.hpp"
#include "proto/error.hpp"

namespace envelope
{

inline constexpr std::size_t LEN_PREFIX   = 4;            // u32 BE original length
inline constexpr std::size_t MAX_INFLATED = 256u << 20;  // refuse to inflate past this

struct Wrapped
{
    std::vector<std::uint8_t> bytes;
    std::uint8_t              flags{0};  // FLAG_COMPRESSED | FLAG_ENCRYPTED, never FLAG_LAST
};

// Compress-then-encrypt around a message body. Immutable once built, safe to share between
// the send and receive paths.
class Envelope
{
  public:
    // cipher == nullptr: no key configured, bodies travel in the clear
    Envelope(const aead::PskAead *cipher, std::size_t compression_threshold)
        : cipher_(cipher), threshold_(compression_threshold)
    {
    }

    // nullopt only when a key is configured and sealing failed; the send must be dropped
    std::optional<Wrapped> wrap(const std::vector<std::uint8_t> &body, std::uint8_t type) const;

    // flags are the reassembled message flags; FLAG_LAST is ignored
    proto::Error unwrap(const std::vector<std::uint8_t> &bytes,
                        std::uint8_t                     type,
                        std::uint8_t                     flags,
                        std::vector<std::uint8_t>       &out) const;

    bool        encrypting() const { return cipher_ != nullptr; }
    std::size_t compression_threshold() const { return threshold_; }

  private:
    const aead::PskAead *cipher_;
    std::size_t          threshold_;
};

// Raw deflate (no zlib/gzip header)
bool         deflate_raw(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out);
proto::Error inflate_raw(const std::uint8_t        *data,
                         std::size_t                len,
                         std::size_t                expected,
                         std::vector<std::uint8_t> &out);

}  // namespace envelope
