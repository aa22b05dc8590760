#pragma once
#include <functional>
#include <optional>
#include <string>

#include "proto/body.hpp"

namespace clip
{

using OnChange = std::function<void()>;

// System clipboard as seen by the sync service. Every change, including the ones caused by
// write(), is reported through the change callback.
struct IClipboard
{
    virtual bool                          start()                                = 0;
    virtual void                          stop()                                 = 0;
    virtual std::optional<proto::Content> read_current()                         = 0;
    virtual bool                          write(const proto::Content &content)   = 0;
    virtual void                          set_on_change(OnChange cb)             = 0;
    virtual std::string                   name() const { return ""; }
    virtual ~IClipboard() = default;
};

}  // namespace clip
