#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec) && !fs::create_directories(dir, ec))
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                  ec.message().c_str());
        return false;
    }
    // Enforce 0700 on the directory
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    return true;
}

static bool fill_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &addr_len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, sock_path.c_str(), sock_path.size() + 1);
    addr_len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + sock_path.size() + 1);
    return true;
}

static int cloexec_socket()
{
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
    return fd;
}

static bool write_all(int fd, const std::string &data)
{
    std::size_t sent = 0;
    while (sent < data.size())
    {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}

// Reads until EOF or, when stop_at_newline, the first '\n'
static bool read_until(int fd, std::string &out, bool stop_at_newline)
{
    char buf[512];
    while (out.size() < MAX_LINE)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            out.append(buf, static_cast<std::size_t>(n));
            if (stop_at_newline && out.find('\n') != std::string::npos)
                return true;
            continue;
        }
        if (n == 0)
            return true;  // EOF
        if (errno == EINTR)
            continue;
        return false;
    }
    return true;
}

// ======================================================================
// Function: start_server
// - In: socket path, handler producing reply lines, optional stop flag
// - Out: true after a clean QUIT/stop, false on socket errors
// - Note: blocks the calling thread; clients are served one at a time
// ======================================================================
bool start_server(const std::string &sock_path, const LineHandler &on_line,
                  const std::atomic<bool> *stop)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return false;
    if (!ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    int fd = cloexec_socket();
    if (fd == -1)
        return false;
    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("bind() failed: %s", std::strerror(errno));
        return false;
    }
    if (listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Listening on %s", sock_path.c_str());

    bool ok = true;
    while (!(stop && stop->load()))
    {
        int cfd = accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd == -1)
        {
            if (errno == EINTR)
                continue;  // loop condition re-checks the stop flag
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }

        // a silent client must not wedge the daemon
        timeval tv{2, 0};
        setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        std::string line;
        if (!read_until(cfd, line, true))
        {
            LOG_WARN("recv() failed: %s", std::strerror(errno));
            close(cfd);
            continue;
        }

        // take first line only
        auto        pos   = line.find('\n');
        std::string first = (pos == std::string::npos) ? line : line.substr(0, pos);
        if (!first.empty() && first.back() == '\r')
            first.pop_back();

        std::vector<std::string> reply;
        if (on_line)
            reply = on_line(first);

        std::string out;
        for (const auto &r : reply)
        {
            out += r;
            out += '\n';
        }
        if (!out.empty() && !write_all(cfd, out))
            LOG_WARN("reply send() failed: %s", std::strerror(errno));
        close(cfd);

        if (first == "QUIT")
            break;  // graceful shutdown
    }

    close(fd);
    unlink(sock_path.c_str());
    return ok;
}

bool send_line(const std::string &sock_path, const std::string &line,
               std::vector<std::string> *reply)
{
    if (line.empty() || line.size() >= MAX_LINE || line.find('\n') != std::string::npos)
    {
        errno = EINVAL;
        LOG_ERROR("Invalid line");
        return false;
    }
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!fill_addr(sock_path, addr, addr_len))
        return false;

    int fd = cloexec_socket();
    if (fd == -1)
        return false;

    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_DEBUG("connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending line: %s", line.c_str());
    if (!write_all(fd, line + "\n"))
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    shutdown(fd, SHUT_WR);

    std::string raw;
    const bool  ok = read_until(fd, raw, false);
    close(fd);
    if (!ok)
    {
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    if (reply)
    {
        reply->clear();
        std::size_t start = 0;
        while (start < raw.size())
        {
            auto end = raw.find('\n', start);
            if (end == std::string::npos)
                end = raw.size();
            reply->push_back(raw.substr(start, end - start));
            start = end + 1;
        }
    }
    return true;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
    }
    return p;
}

}  // namespace ipc
