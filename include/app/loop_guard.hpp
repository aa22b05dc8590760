#pragma once
#include <mutex>
#include <optional>

#include "proto/body.hpp"

namespace app
{

// Single-slot echo suppression. Applying received content to the clipboard triggers one local
// change notification; that one is swallowed, and content equal to the last received content is
// never sent back.
class LoopGuard
{
  public:
    bool should_skip_send(const proto::ContentHash &h) const;
    void mark_received(const proto::ContentHash &h);
    // Returns the ignore flag and clears it; call once per local change event
    bool consume_ignore_flag();
    void reset();

  private:
    mutable std::mutex                mu_;
    std::optional<proto::ContentHash> last_received_;
    bool                              ignore_next_{false};
};

}  // namespace app
