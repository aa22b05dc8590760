#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <sys/wait.h>
#include <system_error>

#include "clip/wayland_clipboard.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace clip
{

namespace
{

constexpr const char *MIME_TEXT     = "text/plain;charset=utf-8";
constexpr const char *MIME_PNG      = "image/png";
constexpr const char *MIME_URI_LIST = "text/uri-list";
// Larger files would need more than 65535 frames anyway
constexpr std::uintmax_t MAX_FILE_SIZE = 64u << 20;

std::optional<std::vector<std::uint8_t>> run_capture(const std::string &cmd)
{
    FILE *p = popen(cmd.c_str(), "r");
    if (!p)
        return std::nullopt;
    std::vector<std::uint8_t> out;
    std::uint8_t              buf[4096];
    std::size_t               n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), p)) > 0)
        out.insert(out.end(), buf, buf + n);
    const int status = pclose(p);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0)
        return std::nullopt;
    return out;
}

bool run_feed(const std::string &cmd, const std::vector<std::uint8_t> &data)
{
    FILE *p = popen(cmd.c_str(), "w");
    if (!p)
        return false;
    const std::size_t n      = data.empty() ? 0 : std::fwrite(data.data(), 1, data.size(), p);
    const int         status = pclose(p);
    if (n != data.size())
        return false;
    return status != -1 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::optional<std::vector<std::uint8_t>> read_file(const std::string &path)
{
    std::error_code ec;
    const auto      size = fs::file_size(path, ec);
    if (ec || size > MAX_FILE_SIZE)
        return std::nullopt;
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open())
        return std::nullopt;
    return std::vector<std::uint8_t>((std::istreambuf_iterator<char>(in)),
                                     std::istreambuf_iterator<char>());
}

proto::ContentHash offer_hash(const proto::Content &c)
{
    std::vector<std::uint8_t> tagged;
    tagged.push_back(static_cast<std::uint8_t>(c.type));
    const auto enc = proto::encode_content(c);
    tagged.insert(tagged.end(), enc.begin(), enc.end());
    return proto::content_hash(tagged);
}

int hex_val(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string sanitize_file_name(const std::string &name)
{
    std::string base = name;
    const auto  slash = base.find_last_of("/\\");
    if (slash != std::string::npos)
        base = base.substr(slash + 1);
    for (auto &c : base)
    {
        if (static_cast<unsigned char>(c) < 0x20 || c == ':' || c == '*' || c == '?' ||
            c == '"' || c == '<' || c == '>' || c == '|')
            c = '_';
    }
    if (base.empty() || base == "." || base == "..")
        return "file";
    return base;
}

std::string shell_quote(const std::string &s)
{
    std::string out = "'";
    for (char c : s)
    {
        if (c == '\'')
            out += "'\\''";
        else
            out += c;
    }
    out += "'";
    return out;
}

std::string file_uri(const std::string &path)
{
    static const char hex[] = "0123456789ABCDEF";
    std::string       out   = "file://";
    for (unsigned char c : path)
    {
        if (std::isalnum(c) || c == '/' || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out += static_cast<char>(c);
        }
        else
        {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0xF];
        }
    }
    return out;
}

std::optional<std::string> path_from_uri_list(const std::string &uri_list)
{
    std::istringstream in(uri_list);
    std::string        line;
    while (std::getline(in, line))
    {
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;
        if (line.rfind("file://", 0) != 0)
            return std::nullopt;
        std::string rest = line.substr(7);
        // file://host/path: drop the host part
        const auto slash = rest.find('/');
        if (slash == std::string::npos)
            return std::nullopt;
        rest = rest.substr(slash);

        std::string path;
        for (std::size_t i = 0; i < rest.size(); ++i)
        {
            if (rest[i] == '%' && i + 2 < rest.size())
            {
                const int hi = hex_val(rest[i + 1]);
                const int lo = hex_val(rest[i + 2]);
                if (hi >= 0 && lo >= 0)
                {
                    path += static_cast<char>((hi << 4) | lo);
                    i += 2;
                    continue;
                }
            }
            path += rest[i];
        }
        return path;
    }
    return std::nullopt;
}

WaylandClipboard::WaylandClipboard(std::string recv_dir, std::chrono::milliseconds poll_interval)
    : recv_dir_(std::move(recv_dir)), poll_interval_(poll_interval)
{
}

WaylandClipboard::~WaylandClipboard()
{
    stop();
}

bool WaylandClipboard::start()
{
    if (!stop_.load())
        return true;
    const char *wd = std::getenv("WAYLAND_DISPLAY");
    if (!wd || !*wd)
        LOG_WARN("WAYLAND_DISPLAY is not set; wl-paste will probably fail");

    // Whatever is on the clipboard at startup is not a change
    if (auto c = read_current())
    {
        std::lock_guard<std::mutex> lk(mu_);
        last_seen_ = offer_hash(*c);
    }
    stop_.store(false);
    poll_thr_ = std::thread([this] { poll_loop(); });
    LOG_INFO("Polling the Wayland clipboard every %lld ms",
             static_cast<long long>(poll_interval_.count()));
    return true;
}

void WaylandClipboard::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_.store(true);
    }
    stop_cv_.notify_all();
    if (poll_thr_.joinable())
        poll_thr_.join();
}

void WaylandClipboard::poll_loop()
{
    while (!stop_.load())
    {
        {
            std::unique_lock<std::mutex> lk(mu_);
            stop_cv_.wait_for(lk, poll_interval_, [this] { return stop_.load(); });
        }
        if (stop_.load())
            break;

        auto c = read_current();
        if (!c)
            continue;
        const auto h = offer_hash(*c);
        OnChange   cb;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (last_seen_ && *last_seen_ == h)
                continue;
            last_seen_ = h;
            cb         = on_change_;
        }
        LOG_DEBUG("Clipboard offer changed");
        if (cb)
            cb();
    }
}

std::optional<proto::Content> WaylandClipboard::read_current()
{
    auto types_raw = run_capture("wl-paste --list-types 2>/dev/null");
    if (!types_raw)
        return std::nullopt;
    const std::string types(types_raw->begin(), types_raw->end());
    auto              offers = [&types](const char *mime) {
        std::istringstream in(types);
        std::string        line;
        while (std::getline(in, line))
        {
            if (line == mime)
                return true;
        }
        return false;
    };

    if (offers(MIME_URI_LIST))
    {
        auto list = run_capture(std::string("wl-paste --no-newline --type ") + MIME_URI_LIST +
                                " 2>/dev/null");
        if (list)
        {
            if (auto path = path_from_uri_list(std::string(list->begin(), list->end())))
            {
                std::error_code ec;
                if (fs::is_regular_file(*path, ec))
                {
                    if (auto data = read_file(*path))
                    {
                        proto::Content c;
                        c.type      = proto::ContentType::File;
                        c.data      = std::move(*data);
                        c.file_name = fs::path(*path).filename().string();
                        return c;
                    }
                    LOG_WARN("Cannot read %s (missing or too large)", path->c_str());
                }
            }
        }
    }

    if (offers(MIME_PNG))
    {
        auto png = run_capture(std::string("wl-paste --type ") + MIME_PNG + " 2>/dev/null");
        if (png && !png->empty())
        {
            proto::Content c;
            c.type = proto::ContentType::Image;
            c.data = std::move(*png);
            return c;
        }
    }

    auto text = run_capture(std::string("wl-paste --no-newline --type ") +
                            shell_quote(MIME_TEXT) + " 2>/dev/null");
    if (!text)
        text = run_capture("wl-paste --no-newline 2>/dev/null");
    if (!text || text->empty())
        return std::nullopt;
    proto::Content c;
    c.type = proto::ContentType::Text;
    c.data = std::move(*text);
    return c;
}

std::optional<std::string> WaylandClipboard::store_file(const proto::Content &content)
{
    std::error_code ec;
    fs::create_directories(recv_dir_, ec);
    if (ec)
    {
        LOG_ERROR("Cannot create %s: %s", recv_dir_.c_str(), ec.message().c_str());
        return std::nullopt;
    }

    const fs::path wanted(sanitize_file_name(content.file_name));
    fs::path       target = fs::path(recv_dir_) / wanted;
    for (int n = 1; fs::exists(target, ec) && n < 1000; ++n)
    {
        target = fs::path(recv_dir_) /
                 (wanted.stem().string() + " (" + std::to_string(n) + ")" +
                  wanted.extension().string());
    }

    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!content.data.empty())
        out.write(reinterpret_cast<const char *>(content.data.data()),
                  static_cast<std::streamsize>(content.data.size()));
    out.close();
    if (!out)
    {
        LOG_ERROR("Cannot write %s", target.c_str());
        return std::nullopt;
    }
    return target.string();
}

bool WaylandClipboard::write(const proto::Content &content)
{
    proto::Content seen = content;
    bool           ok   = false;
    switch (content.type)
    {
        case proto::ContentType::Text:
            ok = run_feed(std::string("wl-copy --type ") + shell_quote(MIME_TEXT), content.data);
            break;
        case proto::ContentType::Image:
            ok = run_feed(std::string("wl-copy --type ") + MIME_PNG, content.data);
            break;
        case proto::ContentType::File:
        {
            auto path = store_file(content);
            if (!path)
                return false;
            LOG_SYSTEM("[RECV] saved %s", path->c_str());
            const std::string         uri = file_uri(*path) + "\r\n";
            std::vector<std::uint8_t> list(uri.begin(), uri.end());
            ok             = run_feed(std::string("wl-copy --type ") + MIME_URI_LIST, list);
            seen.file_name = fs::path(*path).filename().string();
            break;
        }
    }
    if (!ok)
    {
        LOG_ERROR("wl-copy failed");
        return false;
    }
    note_and_notify(seen);
    return true;
}

// The poller must not report our own write a second time
void WaylandClipboard::note_and_notify(const proto::Content &content)
{
    OnChange cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        last_seen_ = offer_hash(content);
        cb         = on_change_;
    }
    if (cb)
        cb();
}

void WaylandClipboard::set_on_change(OnChange cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_change_ = std::move(cb);
}

}  // namespace clip
