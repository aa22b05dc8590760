#include "app/loop_guard.hpp"

namespace app
{

bool LoopGuard::should_skip_send(const proto::ContentHash &h) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return last_received_ && *last_received_ == h;
}

void LoopGuard::mark_received(const proto::ContentHash &h)
{
    std::lock_guard<std::mutex> lk(mu_);
    last_received_ = h;
    ignore_next_   = true;
}

bool LoopGuard::consume_ignore_flag()
{
    std::lock_guard<std::mutex> lk(mu_);
    const bool                  was = ignore_next_;
    ignore_next_                    = false;
    return was;
}

void LoopGuard::reset()
{
    std::lock_guard<std::mutex> lk(mu_);
    last_received_.reset();
    ignore_next_ = false;
}

}  // namespace app
