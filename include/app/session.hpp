#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "app/loop_guard.hpp"
#include "proto/envelope.hpp"
#include "proto/frag.hpp"

namespace app
{

// Everything mutable about one peer link. The service holds no protocol state of its own.
class Session
{
  public:
    Session(std::uint64_t             local_id,
            envelope::Envelope        env,
            std::size_t               chunk_size,
            std::chrono::milliseconds reasm_timeout,
            frag::Reassembler::NowFn  now = {});

    std::uint64_t             local_id() const { return local_id_; }
    const envelope::Envelope &codec() const { return env_; }
    std::size_t               chunk_size() const { return chunk_size_; }

    frag::Reassembler &reassembler() { return rx_; }
    LoopGuard         &loop_guard() { return guard_; }
    std::mutex        &rx_mutex() { return rx_mu_; }

    // Link dropped: forget partial messages and echo state
    void reset();

  private:
    std::uint64_t      local_id_;
    envelope::Envelope env_;
    std::size_t        chunk_size_;
    frag::Reassembler  rx_;
    LoopGuard          guard_;
    std::mutex         rx_mu_;
};

}  // namespace app
