#include "app/session.hpp"

namespace app
{

Session::Session(std::uint64_t             local_id,
                 envelope::Envelope        env,
                 std::size_t               chunk_size,
                 std::chrono::milliseconds reasm_timeout,
                 frag::Reassembler::NowFn  now)
    : local_id_(local_id),
      env_(env),
      chunk_size_(chunk_size),
      rx_(now ? std::move(now)
              : frag::Reassembler::NowFn([] { return frag::Reassembler::Clock::now(); }))
{
    rx_.set_idle_timeout(reasm_timeout);
}

void Session::reset()
{
    std::lock_guard<std::mutex> lk(rx_mu_);
    rx_.reset();
    guard_.reset();
}

}  // namespace app
