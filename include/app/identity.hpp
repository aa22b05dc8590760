#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace app
{

inline constexpr std::size_t DEVICE_ID_BYTES = 8;

// Random, never zero
std::uint64_t generate_device_id();

// Reads <path> (8 bytes, big-endian) or creates it on first run. A file of any other size is
// reported and left alone.
std::optional<std::uint64_t> load_or_create_device_id(const std::string &path);

// 16 lowercase hex digits
std::string                  format_device_id(std::uint64_t id);
std::optional<std::uint64_t> parse_device_id(std::string_view text);

}  // namespace app
