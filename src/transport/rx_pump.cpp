#include "transport/rx_pump.hpp"
#include "util/log.hpp"

namespace transport
{

bool RxPump::start(OnFrame cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (running_)
        return true;
    if (!cb)
        return false;
    cb_      = std::move(cb);
    running_ = true;
    worker_  = std::thread([this] { run(); });
    return true;
}

void RxPump::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return;
        running_ = false;
        if (!frames_.empty())
            LOG_DEBUG("[RX] discarding %zu queued frame(s)", frames_.size());
        frames_.clear();
        cb_ = nullptr;
    }
    cv_.notify_all();
    if (!worker_.joinable())
        return;
    // stop() from inside the callback: the worker exits on its own once the callback returns
    if (worker_.get_id() == std::this_thread::get_id())
        worker_.detach();
    else
        worker_.join();
}

bool RxPump::push(const std::uint8_t *data, std::size_t len)
{
    if (!data || len == 0)
        return false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return false;
        if (frames_.size() >= capacity_)
        {
            if (overflows_++ == 0)
                LOG_WARN("[RX] receive queue full (%zu frames), dropping", capacity_);
            return false;
        }
        frames_.emplace_back(data, data + len);
    }
    cv_.notify_one();
    return true;
}

std::size_t RxPump::queued() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return frames_.size();
}

std::uint64_t RxPump::overflows() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return overflows_;
}

void RxPump::run()
{
    while (true)
    {
        Frame   f;
        OnFrame cb;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return !running_ || !frames_.empty(); });
            if (!running_)
                return;
            f = std::move(frames_.front());
            frames_.pop_front();
            cb = cb_;
        }
        cb(f);
    }
}

}  // namespace transport
