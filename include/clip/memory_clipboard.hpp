#pragma once
#include <cstddef>
#include <mutex>

#include "clip/iclipboard.hpp"

namespace clip
{

// In-process clipboard for tests and headless runs. Change callbacks fire synchronously on the
// calling thread.
class MemoryClipboard final : public IClipboard
{
  public:
    bool                          start() override { return true; }
    void                          stop() override {}
    std::optional<proto::Content> read_current() override;
    bool                          write(const proto::Content &content) override;
    void                          set_on_change(OnChange cb) override;
    std::string                   name() const override { return "memory"; }

    // A local copy by the user
    void        set_local(const proto::Content &content);
    std::size_t write_count() const;
    void        set_fail_writes(bool fail);

  private:
    void store_and_notify(const proto::Content &content);

    mutable std::mutex            mu_;
    std::optional<proto::Content> current_;
    OnChange                      on_change_;
    std::size_t                   writes_{0};
    bool                          fail_writes_{false};
};

}  // namespace clip
