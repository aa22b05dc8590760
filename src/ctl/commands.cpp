#include <filesystem>
#include <system_error>

#include "app/identity.hpp"
#include "ctl/commands.hpp"
#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ctl
{

namespace
{

std::string trim(const std::string &s)
{
    const auto l = s.find_first_not_of(" \t\r");
    if (l == std::string::npos)
        return std::string();
    const auto r = s.find_last_not_of(" \t\r");
    return s.substr(l, r - l + 1);
}

// "WORD rest" -> {"WORD", "rest"}
std::pair<std::string, std::string> split_word(const std::string &s)
{
    const std::string t  = trim(s);
    const auto        sp = t.find_first_of(" \t");
    if (sp == std::string::npos)
        return {t, std::string()};
    return {t.substr(0, sp), trim(t.substr(sp + 1))};
}

std::vector<std::string> ok(std::string msg = std::string())
{
    return {msg.empty() ? "OK" : "OK " + msg};
}

std::vector<std::string> err(const std::string &msg)
{
    return {"ERR " + msg};
}

}  // namespace

CommandDispatcher::CommandDispatcher(app::ClipSyncService &svc,
                                     app::TrustStore      &trust,
                                     app::PendingConsent  &consent,
                                     Executor              exec)
    : svc_(svc), trust_(trust), consent_(consent), exec_(std::move(exec))
{
}

void CommandDispatcher::note_progress(const std::string &label, std::size_t sent,
                                      std::size_t total)
{
    std::lock_guard<std::mutex> lk(progress_mu_);
    progress_ = label + " " + std::to_string(sent) + "/" + std::to_string(total);
}

std::vector<std::string> CommandDispatcher::handle(const std::string &line)
{
    const auto [cmd, arg] = split_word(line);
    LOG_DEBUG("CMD: %s", cmd.c_str());

    if (cmd == "SEND")
        return cmd_send(arg);
    if (cmd == "SEND-FILE")
        return cmd_send_file(arg);
    if (cmd == "CANCEL")
    {
        if (!svc_.sending())
            return ok("nothing to cancel");
        svc_.cancel_send();
        return ok();
    }
    if (cmd == "STATUS")
        return cmd_status();
    if (cmd == "TRUST")
        return cmd_trust(arg);
    if (cmd == "QUIT")
    {
        LOG_INFO("Received QUIT command, exiting...");
        return ok("bye");
    }
    return err("unknown command: " + cmd);
}

std::vector<std::string> CommandDispatcher::cmd_send(const std::string &arg)
{
    if (arg.empty())
        return err("SEND needs text");
    LOG_INFO("CMD: SEND %zu bytes of text", arg.size());
    const bool queued = exec_([this, text = arg] {
        if (!svc_.send_text(text))
            LOG_WARN("SEND failed");
    });
    return queued ? ok("queued") : err("daemon is shutting down");
}

std::vector<std::string> CommandDispatcher::cmd_send_file(const std::string &arg)
{
    if (arg.empty())
        return err("SEND-FILE needs a path");
    const std::string path = ipc::expand_user(arg);
    std::error_code   ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return err("not a regular file: " + path);

    const bool queued = exec_([this, path] {
        if (!svc_.send_file(path))
            LOG_WARN("SEND-FILE %s failed", path.c_str());
    });
    if (!queued)
        return err("daemon is shutting down");
    return ok("queued " + std::filesystem::path(path).filename().string());
}

std::vector<std::string> CommandDispatcher::cmd_status()
{
    std::vector<std::string> out = ok();
    out.push_back(svc_.status_line());
    out.push_back("trusted=" + std::to_string(trust_.size()) +
                  " pending=" + std::to_string(consent_.pending().size()) +
                  " allow-next=" + (trust_.grant_pending() ? "yes" : "no"));
    if (svc_.sending())
    {
        std::lock_guard<std::mutex> lk(progress_mu_);
        if (!progress_.empty())
            out.push_back("progress " + progress_);
    }
    return out;
}

// ======================================================================
// Function: CommandDispatcher::cmd_trust
// - In: "LIST" | "ADD <id> [alias]" | "REMOVE <id>" | "CLEAR" | "ALIAS <id> [alias]"
//       | "ALLOW-NEXT" | "PENDING" | "ALLOW <id>" | "DENY <id>"
// - Out: OK/ERR plus listing lines
// ======================================================================
std::vector<std::string> CommandDispatcher::cmd_trust(const std::string &arg)
{
    const auto [sub, rest] = split_word(arg);
    const auto [id_text, tail] = split_word(rest);
    const auto id              = app::parse_device_id(id_text);

    if (sub == "LIST")
    {
        std::vector<std::string> out = ok(std::to_string(trust_.size()) + " trusted");
        for (const auto &r : trust_.list())
            out.push_back(app::format_device_id(r.device_id) + "\t" +
                          (r.alias ? *r.alias : std::string("-")));
        return out;
    }
    if (sub == "CLEAR")
        return trust_.clear() ? ok() : err("could not save trust store");
    if (sub == "ALLOW-NEXT")
    {
        trust_.grant_next_unknown();
        return ok("next unknown device will be trusted");
    }
    if (sub == "PENDING")
    {
        const auto               ids = consent_.pending();
        std::vector<std::string> out = ok(std::to_string(ids.size()) + " pending");
        for (auto p : ids)
            out.push_back(app::format_device_id(p));
        return out;
    }

    if (sub != "ADD" && sub != "REMOVE" && sub != "ALIAS" && sub != "ALLOW" && sub != "DENY")
        return err("unknown TRUST command: " + sub);
    if (!id)
        return err("TRUST " + sub + " needs a device id (hex)");

    if (sub == "ADD")
    {
        auto alias = tail.empty() ? std::nullopt : std::optional<std::string>(tail);
        return trust_.add(*id, alias) ? ok() : err("could not save trust store");
    }
    if (sub == "REMOVE")
        return trust_.remove(*id) ? ok() : err("not trusted: " + app::format_device_id(*id));
    if (sub == "ALIAS")
        return trust_.set_alias(*id, tail) ? ok()
                                           : err("not trusted: " + app::format_device_id(*id));
    const bool allow = (sub == "ALLOW");
    if (!consent_.resolve(*id, allow))
        return err("nothing pending for " + app::format_device_id(*id));
    return ok(allow ? "allowed" : "denied");
}

}  // namespace ctl
