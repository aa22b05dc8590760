#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace app
{

struct TrustRecord
{
    std::uint64_t              device_id{0};
    std::optional<std::string> alias;
};

// Persisted allow-list of peer device ids.
// File format, one record per line, ordered by id:
//   <16 lowercase hex digits>[\t<alias>]
class TrustStore
{
  public:
    using Decision  = std::function<void(bool allow)>;
    using ConsentFn = std::function<void(std::uint64_t device_id, Decision done)>;

    explicit TrustStore(std::string path) : path_(std::move(path)) {}

    // Missing file == empty store. Unparsable lines are skipped.
    bool load();

    bool                       is_trusted(std::uint64_t id) const;
    bool                       add(std::uint64_t id, std::optional<std::string> alias = std::nullopt);
    bool                       remove(std::uint64_t id);
    bool                       clear();
    // Empty alias clears it. Only trusted ids carry an alias.
    bool                       set_alias(std::uint64_t id, const std::string &alias);
    std::optional<std::string> get_alias(std::uint64_t id) const;
    std::string                display_name(std::uint64_t id) const;
    std::vector<TrustRecord>   list() const;
    std::size_t                size() const;
    const std::string         &path() const { return path_; }

    // The next unknown sender is trusted without asking
    void grant_next_unknown();
    bool grant_pending() const;

    void set_consent(ConsentFn fn);

    // done(true) once id is (or becomes) trusted; may run on another thread, exactly once
    void ensure_trusted(std::uint64_t id, Decision done);
    // Blocks until the consent collaborator decides
    bool ensure_trusted(std::uint64_t id);

  private:
    bool save_locked() const;

    mutable std::mutex                                   mu_;
    std::string                                          path_;
    std::map<std::uint64_t, std::optional<std::string>> records_;
    bool                                                 grant_next_{false};
    ConsentFn                                            consent_;
};

}  // namespace app
