#include "app/consent.hpp"
#include "app/identity.hpp"
#include "util/log.hpp"

namespace app
{

TrustStore::ConsentFn PendingConsent::consent_fn()
{
    return [this](std::uint64_t id, TrustStore::Decision done) { request(id, std::move(done)); };
}

void PendingConsent::request(std::uint64_t id, TrustStore::Decision done)
{
    OnRequest notify;
    bool      first = false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                       &q = waiting_[id];
        first                         = q.empty();
        q.push_back(std::move(done));
        notify = on_request_;
    }
    if (first)
    {
        LOG_SYSTEM("[TRUST] unknown device %s wants to sync; answer with TRUST ALLOW|DENY %s",
                   format_device_id(id).c_str(), format_device_id(id).c_str());
        if (notify)
            notify(id);
    }
}

bool PendingConsent::resolve(std::uint64_t id, bool allow)
{
    std::vector<TrustStore::Decision> decisions;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = waiting_.find(id);
        if (it == waiting_.end())
            return false;
        decisions = std::move(it->second);
        waiting_.erase(it);
    }
    LOG_INFO("[TRUST] %s %s (%zu message(s) waiting)", format_device_id(id).c_str(),
             allow ? "allowed" : "denied", decisions.size());
    for (auto &d : decisions)
        d(allow);
    return true;
}

void PendingConsent::deny_all()
{
    std::map<std::uint64_t, std::vector<TrustStore::Decision>> all;
    {
        std::lock_guard<std::mutex> lk(mu_);
        all.swap(waiting_);
    }
    for (auto &[id, decisions] : all)
    {
        for (auto &d : decisions)
            d(false);
    }
}

std::vector<std::uint64_t> PendingConsent::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::uint64_t>  out;
    out.reserve(waiting_.size());
    for (const auto &kv : waiting_)
        out.push_back(kv.first);
    return out;
}

void PendingConsent::set_on_request(OnRequest cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_request_ = std::move(cb);
}

}  // namespace app
