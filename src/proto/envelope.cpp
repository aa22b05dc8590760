#include <algorithm>
#include <climits>
#include <cstdint>
#include <zlib.h>

#include "proto/envelope.hpp"
#include "proto/frag.hpp"
#include "util/log.hpp"

namespace envelope
{

bool deflate_raw(const std::vector<std::uint8_t> &in, std::vector<std::uint8_t> &out)
{
    if (in.size() > UINT_MAX)
        return false;

    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) !=
        Z_OK)
        return false;

    out.resize(deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in   = const_cast<Bytef *>(in.data());
    zs.avail_in  = static_cast<uInt>(in.size());
    zs.next_out  = out.data();
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END)
    {
        out.clear();
        return false;
    }
    out.resize(produced);
    return true;
}

// ======================================================================
// Function: inflate_raw
// - In: raw deflate stream and the length the sender declared
// - Out: None with the inflated bytes, or DecompressError
// - Note: a cleanly ended stream of the wrong length is tolerated (logged)
// ======================================================================
proto::Error inflate_raw(const std::uint8_t        *data,
                         std::size_t                len,
                         std::size_t                expected,
                         std::vector<std::uint8_t> &out)
{
    if (expected > MAX_INFLATED || len > UINT_MAX)
    {
        LOG_WARN("inflate_raw: refusing declared length %zu", expected);
        return proto::Error::DecompressError;
    }

    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK)
        return proto::Error::DecompressError;

    std::vector<std::uint8_t> buf(std::max<std::size_t>(expected, 64));
    std::size_t               produced = 0;
    zs.next_in  = const_cast<Bytef *>(data);
    zs.avail_in = static_cast<uInt>(len);

    int rc = Z_OK;
    while (true)
    {
        if (produced == buf.size())
        {
            if (buf.size() >= MAX_INFLATED)
            {
                rc = Z_MEM_ERROR;
                break;
            }
            buf.resize(std::min(buf.size() * 2, MAX_INFLATED));
        }
        zs.next_out  = buf.data() + produced;
        zs.avail_out = static_cast<uInt>(buf.size() - produced);
        rc           = inflate(&zs, Z_NO_FLUSH);
        produced     = buf.size() - zs.avail_out;

        if (rc == Z_STREAM_END)
            break;
        if (rc == Z_OK || (rc == Z_BUF_ERROR && zs.avail_out == 0))
            continue;
        break;  // corrupt stream, or input exhausted before the end marker
    }
    inflateEnd(&zs);
    buf.resize(produced);

    if (rc != Z_STREAM_END)
    {
        if (rc == Z_BUF_ERROR && produced >= expected)
        {
            LOG_WARN("inflate_raw: stream ends without end marker after %zu bytes", produced);
        }
        else
        {
            LOG_WARN("inflate_raw: failed (zlib rc=%d, %zu of %zu bytes)", rc, produced,
                     expected);
            return proto::Error::DecompressError;
        }
    }
    else if (produced != expected)
    {
        LOG_WARN("inflate_raw: length mismatch (declared %zu, got %zu); keeping data", expected,
                 produced);
    }
    out = std::move(buf);
    return proto::Error::None;
}

std::optional<Wrapped> Envelope::wrap(const std::vector<std::uint8_t> &body,
                                      std::uint8_t                     type) const
{
    Wrapped w;
    w.bytes = body;

    if (body.size() >= threshold_)
    {
        std::vector<std::uint8_t> z;
        if (body.size() <= UINT32_MAX && deflate_raw(body, z))
        {
            const auto                n = static_cast<std::uint32_t>(body.size());
            std::vector<std::uint8_t> c;
            c.reserve(LEN_PREFIX + z.size());
            c.push_back(static_cast<std::uint8_t>(n >> 24));
            c.push_back(static_cast<std::uint8_t>(n >> 16));
            c.push_back(static_cast<std::uint8_t>(n >> 8));
            c.push_back(static_cast<std::uint8_t>(n));
            c.insert(c.end(), z.begin(), z.end());
            w.bytes = std::move(c);
            w.flags |= frag::FLAG_COMPRESSED;
        }
        else
        {
            LOG_WARN("Envelope::wrap: deflate failed, sending %zu bytes uncompressed",
                     body.size());
        }
    }

    if (cipher_)
    {
        const std::uint8_t aad[2] = {type,
                                     static_cast<std::uint8_t>(w.flags | frag::FLAG_ENCRYPTED)};
        std::vector<std::uint8_t> sealed;
        if (!cipher_->seal(w.bytes, aad, sizeof(aad), sealed))
        {
            LOG_ERROR("Envelope::wrap: AEAD seal failed");
            return std::nullopt;
        }
        w.bytes = std::move(sealed);
        w.flags |= frag::FLAG_ENCRYPTED;
    }
    return w;
}

proto::Error Envelope::unwrap(const std::vector<std::uint8_t> &bytes,
                              std::uint8_t                     type,
                              std::uint8_t                     flags,
                              std::vector<std::uint8_t>       &out) const
{
    // AAD covers every header flag except the per-fragment last bit
    const std::uint8_t msg_flags = flags & static_cast<std::uint8_t>(~frag::FLAG_LAST);

    std::vector<std::uint8_t> plain;
    bool                      opened = false;
    if (msg_flags & frag::FLAG_ENCRYPTED)
    {
        if (!cipher_)
        {
            LOG_WARN("Envelope::unwrap: encrypted body but no key configured");
            return proto::Error::DecryptError;
        }
        if (bytes.size() < aead::MIN_SEALED_SIZE)
            return proto::Error::DecryptError;
        const std::uint8_t aad[2] = {type, msg_flags};
        if (!cipher_->open(bytes, aad, sizeof(aad), plain))
            return proto::Error::DecryptError;
        opened = true;
    }
    else if (cipher_)
    {
        LOG_DEBUG("Envelope::unwrap: peer sent an unencrypted body while a key is configured");
    }

    const std::vector<std::uint8_t> &src = opened ? plain : bytes;
    if (msg_flags & frag::FLAG_COMPRESSED)
    {
        if (src.size() < LEN_PREFIX)
            return proto::Error::DecompressError;
        const std::size_t expected = (static_cast<std::size_t>(src[0]) << 24) |
                                     (static_cast<std::size_t>(src[1]) << 16) |
                                     (static_cast<std::size_t>(src[2]) << 8) |
                                     static_cast<std::size_t>(src[3]);
        return inflate_raw(src.data() + LEN_PREFIX, src.size() - LEN_PREFIX, expected, out);
    }

    if (opened)
        out = std::move(plain);
    else
        out = bytes;
    return proto::Error::None;
}

}  // namespace envelope
