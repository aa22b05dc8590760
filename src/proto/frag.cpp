#include <algorithm>
#include <arpa/inet.h>  // htons, ntohs
#include <cstdint>
#include <cstring>

#include "proto/frag.hpp"
#include "util/log.hpp"

namespace frag
{

std::vector<Frame> make_frames(std::uint8_t                     type,
                               std::uint8_t                     flags_base,
                               const std::vector<std::uint8_t> &body,
                               std::size_t                      max_chunk)
{
    if (max_chunk < 1 || max_chunk > UINT16_MAX)
    {
        LOG_ERROR("make_frames: invalid chunk size (%zu)", max_chunk);
        return {};
    }
    const std::uint8_t base = flags_base & static_cast<std::uint8_t>(~FLAG_LAST);

    // an empty body still produces one zero-length frame
    const std::size_t num_frames =
        body.empty() ? 1 : (body.size() + max_chunk - 1) / max_chunk;
    if (num_frames > MAX_FRAMES)
    {
        LOG_ERROR("make_frames: body too large (%zu bytes, needs %zu frames)", body.size(),
                  num_frames);
        return {};
    }

    std::vector<Frame> out;
    out.reserve(num_frames);
    for (std::size_t i = 0; i < num_frames; i++)
    {
        const std::size_t start   = i * max_chunk;
        const std::size_t take    = std::min(max_chunk, body.size() - start);
        const bool        is_last = (i + 1 == num_frames);
        Frame             f;
        f.hdr.type  = type;
        f.hdr.flags = is_last ? static_cast<std::uint8_t>(base | FLAG_LAST) : base;
        f.hdr.seq   = static_cast<std::uint16_t>(i);
        f.hdr.total = static_cast<std::uint16_t>(num_frames);
        f.hdr.len   = static_cast<std::uint16_t>(take);
        if (take)
            f.payload.assign(body.begin() + start, body.begin() + start + take);
        out.push_back(std::move(f));
    }
    return out;
}

std::vector<std::uint8_t> serialize(const Frame &f)
{
    if (f.payload.size() != f.hdr.len)
    {
        LOG_ERROR("serialize: payload size mismatch (%zu != %u)", f.payload.size(),
                  static_cast<unsigned>(f.hdr.len));
        return {};
    }

    std::vector<std::uint8_t> out(HDR_SIZE + f.payload.size());
    if (!pack_header(f.hdr, out.data()))
    {
        LOG_ERROR("serialize: invalid header (seq=%u total=%u)", f.hdr.seq, f.hdr.total);
        return {};
    }
    if (!f.payload.empty())
        std::memcpy(out.data() + HDR_SIZE, f.payload.data(), f.payload.size());
    return out;
}

std::optional<Frame> parse(const std::vector<std::uint8_t> &bytes)
{
    if (bytes.size() < HDR_SIZE)
    {
        LOG_DEBUG("parse: frame too short (%zu)", bytes.size());
        return std::nullopt;
    }
    Header h{};
    if (!unpack_header(bytes.data(), h))
    {
        LOG_DEBUG("parse: inconsistent header (seq=%u total=%u)", h.seq, h.total);
        return std::nullopt;
    }
    const std::size_t avail = bytes.size() - HDR_SIZE;
    if (h.len > avail)
    {
        LOG_DEBUG("parse: declared length %u exceeds %zu available bytes", h.len, avail);
        return std::nullopt;
    }

    // trailing bytes past the declared length are ignored
    Frame f;
    f.hdr = h;
    if (h.len)
        f.payload.assign(bytes.begin() + HDR_SIZE, bytes.begin() + HDR_SIZE + h.len);
    return f;
}

bool pack_header(const Header &in, std::uint8_t out[HDR_SIZE])
{
    if (in.total == 0 || in.seq >= in.total)
        return false;

    out[0] = in.type;
    out[1] = in.flags;

    std::uint16_t seq_be = htons(in.seq);
    std::memcpy(out + 2, &seq_be, sizeof seq_be);

    std::uint16_t total_be = htons(in.total);
    std::memcpy(out + 4, &total_be, sizeof total_be);

    std::uint16_t len_be = htons(in.len);
    std::memcpy(out + 6, &len_be, sizeof len_be);

    return true;
}

bool unpack_header(const std::uint8_t in[HDR_SIZE], Header &out)
{
    out.type  = in[0];
    out.flags = in[1];

    std::uint16_t seq_be;
    std::memcpy(&seq_be, in + 2, sizeof seq_be);
    out.seq = ntohs(seq_be);

    std::uint16_t total_be;
    std::memcpy(&total_be, in + 4, sizeof total_be);
    out.total = ntohs(total_be);

    std::uint16_t len_be;
    std::memcpy(&len_be, in + 6, sizeof len_be);
    out.len = ntohs(len_be);

    return out.total != 0 && out.seq < out.total;
}

// ======================================================================
// Function: Reassembler::append
// - In: one parsed frame (any order, duplicates allowed)
// - Out: the message once chunk count == total, nullopt otherwise
// - Note: seq 0 or a type/total change restarts; old partial data is dropped
// ======================================================================
std::optional<Message> Reassembler::append(const Frame &f)
{
    if (f.hdr.total == 0 || f.hdr.seq >= f.hdr.total || f.hdr.len != f.payload.size())
    {
        LOG_WARN("Reassembler::append: invalid frame");
        return std::nullopt;
    }

    const auto now = now_();
    if (is_stale(now))
    {
        LOG_INFO("Reassembler: dropping partial message idle for more than %lld ms (%zu/%u)",
                 static_cast<long long>(idle_timeout_.count()), chunks_.size(), total_);
        reset();
    }

    if (!active_ || f.hdr.seq == 0 || f.hdr.type != type_ || f.hdr.total != total_)
    {
        if (active_ && !chunks_.empty())
            LOG_DEBUG("Reassembler: discarding partial message (type=%u %zu/%u)", type_,
                      chunks_.size(), total_);
        reset();
        active_ = true;
        type_   = f.hdr.type;
        total_  = f.hdr.total;
    }
    flags_         = f.hdr.flags & static_cast<std::uint8_t>(~FLAG_LAST);
    last_activity_ = now;

    // last write wins
    chunks_[f.hdr.seq] = f.payload;

    if (chunks_.size() < total_)
        return std::nullopt;  // not done yet

    Message     m;
    std::size_t bytes = 0;
    for (const auto &kv : chunks_)
        bytes += kv.second.size();
    m.type  = type_;
    m.flags = flags_;
    m.body.reserve(bytes);
    for (std::uint16_t i = 0; i < total_; i++)
    {
        auto it = chunks_.find(i);
        if (it == chunks_.end())
            continue;
        m.body.insert(m.body.end(), it->second.begin(), it->second.end());
    }
    reset();
    return m;
}

bool Reassembler::is_stale(Clock::time_point now) const
{
    return active_ && idle_timeout_.count() > 0 && now - last_activity_ > idle_timeout_;
}

bool Reassembler::evict_idle()
{
    if (!is_stale(now_()))
        return false;
    LOG_INFO("Reassembler: evicting idle partial message (%zu/%u)", chunks_.size(), total_);
    reset();
    return true;
}

void Reassembler::reset()
{
    active_ = false;
    type_   = 0;
    total_  = 0;
    flags_  = 0;
    chunks_.clear();
}

}  // namespace frag
