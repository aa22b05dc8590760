#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <system_error>
#include <unordered_map>
#include <vector>

#include "app/identity.hpp"
#include "ctl/ipc.hpp"
#include "util/constants.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

static std::string to_lower(std::string s)
{
    for (auto &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string join(const std::vector<std::string> &args, std::size_t from)
{
    std::string out;
    for (std::size_t i = from; i < args.size(); ++i)
    {
        if (i > from)
            out.push_back(' ');
        out += args[i];
    }
    return out;
}

// --------------------------------------------------------------------
// CLI usage
// --------------------------------------------------------------------
static void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  clipsyncctl [--sock <path>] <command> [args]\n"
                         "\n"
                         "Commands:\n"
                         "  send <text...>\n"
                         "  send-file <path>\n"
                         "  cancel\n"
                         "  status\n"
                         "  trust list\n"
                         "  trust add <device-id> [alias...]\n"
                         "  trust remove <device-id>\n"
                         "  trust clear\n"
                         "  trust alias <device-id> [alias...]\n"
                         "  trust allow-next\n"
                         "  trust pending\n"
                         "  trust allow|deny <device-id>\n"
                         "  quit\n");
}

static int send_one_line(const std::string &sock, const std::string &line)
{
    if (line.empty() || line.find('\n') != std::string::npos)
    {
        print_usage();
        if (line.empty())
            std::fprintf(stderr, "error: empty command line to daemon\n");
        else
            std::fprintf(stderr, "error: command line must not contain newline characters\n");

        return exitc::bad_args;
    }
    std::vector<std::string> reply;
    if (!ipc::send_line(sock, line, &reply))
    {
        if (errno == ENOENT || errno == ECONNREFUSED)
        {
            std::fprintf(stderr, "error: cannot reach daemon at %s\n", sock.c_str());
            return exitc::no_server;
        }
        std::fprintf(stderr, "error: talking to daemon at %s failed\n", sock.c_str());
        return exitc::failure;
    }
    for (const auto &r : reply)
        std::printf("%s\n", r.c_str());
    if (reply.empty() || reply.front().rfind("ERR", 0) == 0)
        return exitc::failure;
    return exitc::ok;
}

static int run_trust(const std::vector<std::string>                &args,
                     const std::function<int(const std::string &)> &send_line)
{
    if (args.size() < 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    const std::string sub = to_lower(args[1]);

    if (sub == "list" || sub == "clear" || sub == "allow-next" || sub == "pending")
    {
        if (args.size() != 2)
        {
            print_usage();
            return exitc::bad_args;
        }
        std::string upper = sub;
        for (auto &c : upper)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return send_line("TRUST " + upper);
    }

    static const std::unordered_map<std::string, std::string> with_id = {
        {"add", "ADD"}, {"remove", "REMOVE"}, {"alias", "ALIAS"}, {"allow", "ALLOW"},
        {"deny", "DENY"}};
    auto it = with_id.find(sub);
    if (it == with_id.end())
    {
        std::fprintf(stderr, "Unknown trust command: %s\n", args[1].c_str());
        print_usage();
        return exitc::bad_args;
    }
    if (args.size() < 3)
    {
        print_usage();
        return exitc::bad_args;
    }
    auto id = app::parse_device_id(args[2]);
    if (!id)
    {
        std::fprintf(stderr, "error: invalid device id: %s\n", args[2].c_str());
        return exitc::bad_args;
    }
    const bool takes_alias = (sub == "add" || sub == "alias");
    if (!takes_alias && args.size() != 3)
    {
        print_usage();
        return exitc::bad_args;
    }
    std::string line = "TRUST " + it->second + " " + app::format_device_id(*id);
    if (takes_alias && args.size() > 3)
        line += " " + join(args, 3);
    return send_line(line);
}

static int run_cmd(const std::string                             &cmd,
                   const std::vector<std::string>                &args,
                   const std::function<int(const std::string &)> &send_line)
{
    std::unordered_map<std::string, std::function<int()>> cmd_map = {
        {"send",
         [&]() -> int {
             if (args.size() < 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             return send_line("SEND " + join(args, 1));
         }},
        {"send-file",
         [&]() -> int {
             if (args.size() != 2)
             {
                 print_usage();
                 return exitc::bad_args;
             }
             // the daemon may run with another working directory
             std::error_code ec;
             auto            p = std::filesystem::absolute(ipc::expand_user(args[1]), ec);
             if (ec)
             {
                 std::fprintf(stderr, "error: bad path %s: %s\n", args[1].c_str(),
                              ec.message().c_str());
                 return exitc::bad_args;
             }
             return send_line("SEND-FILE " + p.lexically_normal().string());
         }},
        {"cancel", [&]() -> int { return send_line("CANCEL"); }},
        {"status", [&]() -> int { return send_line("STATUS"); }},
        {"trust", [&]() -> int { return run_trust(args, send_line); }},
        {"quit", [&]() -> int { return send_line("QUIT"); }},
    };

    auto it = cmd_map.find(cmd);
    if (it == cmd_map.end())
    {
        std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
        print_usage();
        return exitc::bad_args;
    }
    LOG_DEBUG("Running command: %s", cmd.c_str());
    return it->second();
}
}  // namespace

int main(int argc, char **argv)
{
    if (argc < 2)
    {
        print_usage();
        return exitc::bad_args;
    }
    if (const char *lv = std::getenv("CLIPSYNC_LOG_LEVEL"); lv && *lv)
    {
        if (!clipsync::set_log_level_by_name(lv))
            LOG_WARN("unknown log level '%s', using info", lv);
    }

    // CLIPSYNC_CTL_SOCK is honoured by ctl_sock_path(); --sock overrides both
    std::string sock = ipc::expand_user(constants::ctl_sock_path());

    std::vector<std::string> args;
    args.reserve(argc - 1);

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--sock")
        {
            if (i + 1 >= argc)
            {
                print_usage();
                return exitc::bad_args;
            }
            sock = ipc::expand_user(argv[++i]);
        }
        else
        {
            args.push_back(std::move(a));
        }
    }
    if (args.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    const std::string cmd    = to_lower(args[0]);
    auto              sender = [&](const std::string &line) -> int { return send_one_line(sock, line); };

    return run_cmd(cmd, args, sender);
}
