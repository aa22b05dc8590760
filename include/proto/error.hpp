#pragma once
#include <cstdint>

namespace proto
{

// Outcome of processing one inbound frame. Nothing here is ever reported back to the peer.
enum class Error : std::uint8_t
{
    None = 0,         // message complete and delivered
    Incomplete,       // frame stored, message still missing fragments
    MalformedFrame,   // truncated or inconsistent header
    DecryptError,     // AEAD verification failed or no key for an encrypted body
    DecompressError,  // declared length unreachable from the deflate stream
    MalformedBody,    // no sender id, or content layout broken
    SelfEcho,         // sender id equals our own
    UntrustedSender,  // decoded fine, sender not (yet) trusted
    ClipboardError,   // clipboard collaborator refused the write
};

inline const char *error_name(Error e)
{
    switch (e)
    {
        case Error::None:
            return "none";
        case Error::Incomplete:
            return "incomplete";
        case Error::MalformedFrame:
            return "malformed-frame";
        case Error::DecryptError:
            return "decrypt-error";
        case Error::DecompressError:
            return "decompress-error";
        case Error::MalformedBody:
            return "malformed-body";
        case Error::SelfEcho:
            return "self-echo";
        case Error::UntrustedSender:
            return "untrusted-sender";
        case Error::ClipboardError:
            return "clipboard-error";
    }
    return "?";
}

}  // namespace proto
