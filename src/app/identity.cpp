#include <array>
#include <cctype>
#include <cinttypes>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sodium.h>
#include <system_error>
#include <vector>

#include "app/identity.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace app
{

std::uint64_t generate_device_id()
{
    if (sodium_init() < 0)
        LOG_WARN("sodium_init failed");
    std::uint64_t id = 0;
    while (id == 0)
        randombytes_buf(&id, sizeof(id));
    return id;
}

std::optional<std::uint64_t> load_or_create_device_id(const std::string &path)
{
    std::error_code ec;
    if (fs::exists(path, ec))
    {
        std::ifstream             in(path, std::ios::binary);
        std::vector<std::uint8_t> raw((std::istreambuf_iterator<char>(in)),
                                      std::istreambuf_iterator<char>());
        if (!in.good() && !in.eof())
        {
            LOG_ERROR("Cannot read device id from %s", path.c_str());
            return std::nullopt;
        }
        if (raw.size() != DEVICE_ID_BYTES)
        {
            LOG_ERROR("%s holds %zu bytes, expected %zu; refusing to replace it", path.c_str(),
                      raw.size(), DEVICE_ID_BYTES);
            return std::nullopt;
        }
        std::uint64_t id = 0;
        for (auto b : raw)
            id = (id << 8) | b;
        if (id == 0)
        {
            LOG_ERROR("%s holds a zero device id", path.c_str());
            return std::nullopt;
        }
        return id;
    }

    const fs::path p(path);
    if (p.has_parent_path())
    {
        fs::create_directories(p.parent_path(), ec);
        if (ec)
        {
            LOG_ERROR("Cannot create %s: %s", p.parent_path().c_str(), ec.message().c_str());
            return std::nullopt;
        }
    }

    const std::uint64_t               id = generate_device_id();
    std::array<char, DEVICE_ID_BYTES> raw{};
    for (std::size_t i = 0; i < DEVICE_ID_BYTES; ++i)
        raw[i] = static_cast<char>(id >> (8 * (DEVICE_ID_BYTES - 1 - i)));

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(raw.data(), raw.size());
    out.close();
    if (!out)
    {
        LOG_ERROR("Cannot write device id to %s", path.c_str());
        return std::nullopt;
    }
    LOG_INFO("Created device id %s in %s", format_device_id(id).c_str(), path.c_str());
    return id;
}

std::string format_device_id(std::uint64_t id)
{
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016" PRIx64, id);
    return std::string(buf);
}

std::optional<std::uint64_t> parse_device_id(std::string_view text)
{
    if (text.empty() || text.size() > 16)
        return std::nullopt;
    std::uint64_t v = 0;
    for (char ch : text)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isxdigit(c))
            return std::nullopt;
        const int d = std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10;
        v = (v << 4) | static_cast<std::uint64_t>(d);
    }
    return v;
}

}  // namespace app
