#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace ipc
{

inline constexpr std::size_t MAX_LINE = 64 * 1024;

// One request line in, reply lines out
using LineHandler = std::function<std::vector<std::string>(const std::string &line)>;

// Serves one connection at a time until a "QUIT" line is handled or *stop becomes true
// (checked when accept() is interrupted by a signal).
bool start_server(const std::string      &sock_path,
                  const LineHandler      &on_line,
                  const std::atomic<bool> *stop = nullptr);

// Sends one line and collects the reply until the server closes. errno is preserved on
// connect failure so callers can tell "no daemon" apart.
bool send_line(const std::string        &sock_path,
               const std::string        &line,
               std::vector<std::string> *reply = nullptr);

std::string expand_user(const std::string &path);

}  // namespace ipc
