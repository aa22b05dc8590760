#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{
// LoopbackTransport: a fake link to test the pipeline (clipboard -> service -> transport)
// without BLE.
bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_rx_     = std::move(on_rx);
    max_frame_ = s.max_frame;
    started_   = true;
    return true;
}

bool LoopbackTransport::send(const Frame &one_frame)
{
    LoopbackTransport *target = nullptr;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return false;
        if (max_frame_ != 0 && one_frame.size() > max_frame_)
        {
            LOG_WARN("loopback: frame of %zu bytes exceeds %zu", one_frame.size(), max_frame_);
            return false;
        }
        ++sent_;
        if (drop_ > 0)
        {
            --drop_;
            return true;
        }
        target = peer_ ? peer_ : this;
    }
    target->deliver(one_frame);
    return true;
}

void LoopbackTransport::deliver(const Frame &f)
{
    OnFrame cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!started_)
            return;
        cb = on_rx_;
    }
    if (cb)
        cb(f);
}

void LoopbackTransport::stop()
{
    std::lock_guard<std::mutex> lk(mu_);
    started_ = false;
    on_rx_   = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return started_;
}

void LoopbackTransport::link(LoopbackTransport &a, LoopbackTransport &b)
{
    {
        std::lock_guard<std::mutex> lk(a.mu_);
        a.peer_ = &b;
    }
    std::lock_guard<std::mutex> lk(b.mu_);
    b.peer_ = &a;
}

void LoopbackTransport::unlink()
{
    std::lock_guard<std::mutex> lk(mu_);
    peer_ = nullptr;
}

void LoopbackTransport::drop_next(std::size_t n)
{
    std::lock_guard<std::mutex> lk(mu_);
    drop_ = n;
}

std::size_t LoopbackTransport::frames_sent() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sent_;
}

}  // namespace transport
