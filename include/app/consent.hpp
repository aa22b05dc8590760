#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include "app/trust_store.hpp"

namespace app
{

// Parks trust questions until an operator answers them (TRUST ALLOW / TRUST DENY).
class PendingConsent
{
  public:
    using OnRequest = std::function<void(std::uint64_t device_id)>;

    // Install with trust.set_consent(pending.consent_fn()); must outlive the store's use of it
    TrustStore::ConsentFn consent_fn();

    void request(std::uint64_t id, TrustStore::Decision done);
    // false when nothing waits for id
    bool resolve(std::uint64_t id, bool allow);
    // Shutdown: every waiting question is answered "deny"
    void deny_all();

    std::vector<std::uint64_t> pending() const;
    void                       set_on_request(OnRequest cb);

  private:
    mutable std::mutex                                            mu_;
    std::map<std::uint64_t, std::vector<TrustStore::Decision>> waiting_;
    OnRequest                                                     on_request_;
};

}  // namespace app
