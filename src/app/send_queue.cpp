#include "app/send_queue.hpp"
#include "util/log.hpp"

namespace app
{

void SendQueue::start()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (running_)
        return;
    running_ = true;
    worker_  = std::thread([this] { run(); });
}

void SendQueue::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return;
        running_ = false;
        if (!jobs_.empty())
            LOG_INFO("dropping %zu queued send(s)", jobs_.size());
        jobs_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

bool SendQueue::push(Job job)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!running_)
            return false;
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return true;
}

std::size_t SendQueue::pending() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return jobs_.size();
}

void SendQueue::run()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this] { return !running_ || !jobs_.empty(); });
            if (!running_)
                return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }
        job();
    }
}

}  // namespace app
