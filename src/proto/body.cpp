#include <sodium.h>

#include "proto/body.hpp"
#include "util/log.hpp"

namespace proto
{

bool is_known_type(std::uint8_t t)
{
    return t >= static_cast<std::uint8_t>(ContentType::Text) &&
           t <= static_cast<std::uint8_t>(ContentType::File);
}

std::vector<std::uint8_t> encode_content(const Content &c)
{
    if (c.type != ContentType::File)
        return c.data;

    std::size_t name_len = c.file_name.size();
    if (name_len > MAX_NAME_LEN)
    {
        LOG_WARN("encode_content: file name truncated from %zu bytes", name_len);
        name_len = MAX_NAME_LEN;
    }

    std::vector<std::uint8_t> out;
    out.reserve(2 + name_len + c.data.size());
    out.push_back(static_cast<std::uint8_t>(name_len >> 8));
    out.push_back(static_cast<std::uint8_t>(name_len & 0xFF));
    out.insert(out.end(), c.file_name.begin(), c.file_name.begin() + name_len);
    out.insert(out.end(), c.data.begin(), c.data.end());
    return out;
}

std::optional<Content> decode_content(std::uint8_t type, const std::vector<std::uint8_t> &bytes)
{
    if (!is_known_type(type))
        return std::nullopt;

    Content c;
    c.type = static_cast<ContentType>(type);
    if (c.type != ContentType::File)
    {
        c.data = bytes;
        return c;
    }

    if (bytes.size() < 2)
        return std::nullopt;
    const std::size_t name_len = (static_cast<std::size_t>(bytes[0]) << 8) | bytes[1];
    if (bytes.size() < 2 + name_len)
        return std::nullopt;
    c.file_name.assign(bytes.begin() + 2, bytes.begin() + 2 + name_len);
    c.data.assign(bytes.begin() + 2 + name_len, bytes.end());
    return c;
}

std::vector<std::uint8_t> encode_body(std::uint64_t sender_id, const std::vector<std::uint8_t> &content)
{
    std::vector<std::uint8_t> out;
    out.reserve(SENDER_ID_SIZE + content.size());
    for (int shift = 56; shift >= 0; shift -= 8)
        out.push_back(static_cast<std::uint8_t>(sender_id >> shift));
    out.insert(out.end(), content.begin(), content.end());
    return out;
}

std::optional<DecodedBody> decode_body(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.size() < SENDER_ID_SIZE)
        return std::nullopt;

    DecodedBody d;
    for (std::size_t i = 0; i < SENDER_ID_SIZE; ++i)
        d.sender_id = (d.sender_id << 8) | bytes[i];
    d.content.assign(bytes.begin() + SENDER_ID_SIZE, bytes.end());
    return d;
}

ContentHash content_hash(const std::vector<std::uint8_t> &content)
{
    ContentHash h{};
    crypto_hash_sha256(h.data(), content.data(), content.size());
    return h;
}

Content text_content(const std::string &text)
{
    Content c;
    c.type = ContentType::Text;
    c.data.assign(text.begin(), text.end());
    return c;
}

}  // namespace proto
