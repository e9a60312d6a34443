#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace transport
{

using Frame   = std::vector<std::uint8_t>;
using OnFrame = std::function<void(const Frame &)>;

struct Settings
{
    std::string role;                     // "sender" or "receiver"
    std::size_t max_frame = 8u << 20;  // larger frames are refused by send()
};

// Ordered, connected frame stream between the two endpoints once negotiation
// succeeded. send() blocks while the outbound side is saturated.
struct ITransport
{
    virtual bool        start(const Settings &s, OnFrame on_rx) = 0;
    virtual bool        send(const Frame &frame)                = 0;
    virtual void        stop()                                  = 0;
    virtual std::string name() const { return ""; }
    virtual bool        link_ready() const = 0;
    virtual ~ITransport() = default;
};

}  // namespace transport
