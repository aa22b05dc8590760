#include "clip/memory_clipboard.hpp"

namespace clip
{

std::optional<proto::Content> MemoryClipboard::read_current()
{
    std::lock_guard<std::mutex> lk(mu_);
    return current_;
}

bool MemoryClipboard::write(const proto::Content &content)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (fail_writes_)
            return false;
        ++writes_;
    }
    store_and_notify(content);
    return true;
}

void MemoryClipboard::set_local(const proto::Content &content)
{
    store_and_notify(content);
}

void MemoryClipboard::store_and_notify(const proto::Content &content)
{
    OnChange cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        current_ = content;
        cb       = on_change_;
    }
    if (cb)
        cb();
}

void MemoryClipboard::set_on_change(OnChange cb)
{
    std::lock_guard<std::mutex> lk(mu_);
    on_change_ = std::move(cb);
}

std::size_t MemoryClipboard::write_count() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return writes_;
}

void MemoryClipboard::set_fail_writes(bool fail)
{
    std::lock_guard<std::mutex> lk(mu_);
    fail_writes_ = fail;
}

}  // namespace clip
