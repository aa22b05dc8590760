#pragma once
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

inline constexpr std::size_t RX_QUEUE_FRAMES = 4096;

// Hands received frames to the upper layer on a thread of its own, so the transport's event
// loop never runs the receive pipeline while holding its locks.
class RxPump
{
  public:
    explicit RxPump(std::size_t capacity = RX_QUEUE_FRAMES) : capacity_(capacity) {}
    ~RxPump() { stop(); }
    RxPump(const RxPump &)            = delete;
    RxPump &operator=(const RxPump &) = delete;

    bool start(OnFrame cb);
    // Frames not yet handed over are dropped; waits for the one in progress
    void stop();
    // Copies the frame; false when stopped or full
    bool push(const std::uint8_t *data, std::size_t len);

    std::size_t   queued() const;
    std::uint64_t overflows() const;

  private:
    void run();

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Frame>       frames_;
    std::size_t             capacity_;
    std::uint64_t           overflows_{0};
    OnFrame                 cb_;
    std::thread             worker_;
    bool                    running_{false};
};

}  // namespace transport
