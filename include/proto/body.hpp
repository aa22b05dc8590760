#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proto
{

// Frame `type` byte doubles as the content type
enum class ContentType : std::uint8_t
{
    Text  = 1,
    Image = 2,  // PNG bytes
    File  = 3,
};

struct Content
{
    ContentType               type{ContentType::Text};
    std::vector<std::uint8_t> data;
    std::string               file_name;  // File only
};

inline constexpr std::size_t SENDER_ID_SIZE = 8;
inline constexpr std::size_t MAX_NAME_LEN   = UINT16_MAX;
inline constexpr std::size_t HASH_SIZE      = 32;

using ContentHash = std::array<std::uint8_t, HASH_SIZE>;

struct DecodedBody
{
    std::uint64_t             sender_id{0};
    std::vector<std::uint8_t> content;
};

bool is_known_type(std::uint8_t t);

// Text/Image: data as-is. File: [name_len u16 BE][name][data]
std::vector<std::uint8_t> encode_content(const Content &c);
std::optional<Content>    decode_content(std::uint8_t type, const std::vector<std::uint8_t> &bytes);

// [sender_id u64 BE][content]
std::vector<std::uint8_t>  encode_body(std::uint64_t sender_id, const std::vector<std::uint8_t> &content);
std::optional<DecodedBody> decode_body(const std::vector<std::uint8_t> &bytes);

// SHA-256 of the encoded content (no sender prefix)
ContentHash content_hash(const std::vector<std::uint8_t> &content);

Content text_content(const std::string &text);

}  // namespace proto
