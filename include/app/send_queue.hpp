#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>

namespace app
{

// Runs outbound sends one after another on a worker thread so the control socket stays
// responsive (a file can take minutes over BLE).
class SendQueue
{
  public:
    using Job = std::function<void()>;

    SendQueue() = default;
    ~SendQueue() { stop(); }
    SendQueue(const SendQueue &)            = delete;
    SendQueue &operator=(const SendQueue &) = delete;

    void        start();
    // Drops jobs not yet started, waits for the running one
    void        stop();
    bool        push(Job job);
    std::size_t pending() const;

  private:
    void run();

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Job>         jobs_;
    std::thread             worker_;
    bool                    running_{false};
};

}  // namespace app
