#include <atomic>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <future>
#include <memory>
#include <system_error>

#include "app/identity.hpp"
#include "app/trust_store.hpp"
#include "util/log.hpp"

namespace fs = std::filesystem;

namespace app
{

namespace
{

// Tabs and line breaks would corrupt the record format
std::string clean_alias(const std::string &alias)
{
    std::string out = alias;
    for (auto &c : out)
    {
        if (c == '\t' || c == '\n' || c == '\r')
            c = ' ';
    }
    const auto b = out.find_first_not_of(' ');
    if (b == std::string::npos)
        return std::string();
    const auto e = out.find_last_not_of(' ');
    return out.substr(b, e - b + 1);
}

}  // namespace

bool TrustStore::load()
{
    std::lock_guard<std::mutex> lk(mu_);
    records_.clear();

    std::error_code ec;
    if (!fs::exists(path_, ec))
    {
        LOG_DEBUG("No trust store at %s yet", path_.c_str());
        return true;
    }

    std::ifstream in(path_);
    if (!in.is_open())
    {
        LOG_ERROR("Cannot open trust store %s", path_.c_str());
        return false;
    }

    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty() || line[0] == '#')
            continue;

        const auto  tab     = line.find('\t');
        std::string id_text = line.substr(0, tab);
        auto        id      = id_text.size() == 16 ? parse_device_id(id_text) : std::nullopt;
        if (!id)
        {
            LOG_WARN("%s:%zu: skipping bad record", path_.c_str(), lineno);
            continue;
        }
        std::optional<std::string> alias;
        if (tab != std::string::npos)
        {
            std::string a = clean_alias(line.substr(tab + 1));
            if (!a.empty())
                alias = std::move(a);
        }
        records_[*id] = std::move(alias);
    }
    LOG_INFO("Loaded %zu trusted device(s) from %s", records_.size(), path_.c_str());
    return true;
}

bool TrustStore::save_locked() const
{
    const fs::path  p(path_);
    std::error_code ec;
    if (p.has_parent_path())
        fs::create_directories(p.parent_path(), ec);

    const std::string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open())
        {
            LOG_ERROR("Cannot write %s", tmp.c_str());
            return false;
        }
        for (const auto &[id, alias] : records_)
        {
            out << format_device_id(id);
            if (alias)
                out << '\t' << *alias;
            out << '\n';
        }
        out.close();
        if (!out)
        {
            LOG_ERROR("Short write to %s", tmp.c_str());
            return false;
        }
    }
    fs::rename(tmp, p, ec);
    if (ec)
    {
        LOG_ERROR("Cannot replace %s: %s", path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

bool TrustStore::is_trusted(std::uint64_t id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return records_.count(id) != 0;
}

bool TrustStore::add(std::uint64_t id, std::optional<std::string> alias)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (alias)
    {
        std::string a = clean_alias(*alias);
        alias         = a.empty() ? std::nullopt : std::optional<std::string>(std::move(a));
    }
    auto it = records_.find(id);
    if (it != records_.end())
    {
        // keep an existing alias unless a new one is given
        if (!alias)
            return true;
        it->second = std::move(alias);
    }
    else
    {
        records_.emplace(id, std::move(alias));
    }
    return save_locked();
}

bool TrustStore::remove(std::uint64_t id)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (records_.erase(id) == 0)
        return false;
    return save_locked();
}

bool TrustStore::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    records_.clear();
    grant_next_ = false;
    return save_locked();
}

bool TrustStore::set_alias(std::uint64_t id, const std::string &alias)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = records_.find(id);
    if (it == records_.end())
        return false;
    std::string a = clean_alias(alias);
    if (a.empty())
        it->second.reset();
    else
        it->second = std::move(a);
    return save_locked();
}

std::optional<std::string> TrustStore::get_alias(std::uint64_t id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = records_.find(id);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

std::string TrustStore::display_name(std::uint64_t id) const
{
    auto alias = get_alias(id);
    return alias ? *alias : format_device_id(id);
}

std::vector<TrustRecord> TrustStore::list() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<TrustRecord>    out;
    out.reserve(records_.size());
    for (const auto &[id, alias] : records_)
        out.push_back(TrustRecord{id, alias});
    return out;
}

std::size_t TrustStore::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return records_.size();
}

void TrustStore::grant_next_unknown()
{
    std::lock_guard<std::mutex> lk(mu_);
    grant_next_ = true;
}

bool TrustStore::grant_pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return grant_next_;
}

void TrustStore::set_consent(ConsentFn fn)
{
    std::lock_guard<std::mutex> lk(mu_);
    consent_ = std::move(fn);
}

// ======================================================================
// Function: ensure_trusted
// - In: sender id, completion callback
// - Out: done(true) when trusted (possibly after asking), done(false) otherwise
// - Note: the consent collaborator runs without the store lock held
// ======================================================================
void TrustStore::ensure_trusted(std::uint64_t id, Decision done)
{
    ConsentFn ask;
    bool      granted = false;
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (records_.count(id))
        {
            lk.unlock();
            done(true);
            return;
        }
        if (grant_next_)
        {
            grant_next_ = false;
            records_.emplace(id, std::nullopt);
            if (!save_locked())
                LOG_WARN("Trusted %s for this run only", format_device_id(id).c_str());
            granted = true;
        }
        else
        {
            ask = consent_;
        }
    }

    if (granted)
    {
        LOG_SYSTEM("[TRUST] %s trusted via one-shot grant", format_device_id(id).c_str());
        done(true);
        return;
    }
    if (!ask)
    {
        done(false);
        return;
    }

    auto fired = std::make_shared<std::atomic<bool>>(false);
    ask(id, [this, id, fired, done = std::move(done)](bool allow) {
        if (fired->exchange(true))
            return;
        if (allow && !add(id))
            LOG_WARN("Trusted %s for this run only", format_device_id(id).c_str());
        done(allow);
    });
}

bool TrustStore::ensure_trusted(std::uint64_t id)
{
    auto promise = std::make_shared<std::promise<bool>>();
    auto result  = promise->get_future();
    ensure_trusted(id, [promise](bool allow) { promise->set_value(allow); });
    return result.get();
}

}  // namespace app
