#pragma once
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include "transport/itransport.hpp"

namespace transport
{

// In-process link between two endpoints, used to drive the peer path without a
// network. Frames sent before the far end starts are held and flushed in order.
class LoopbackTransport final : public ITransport
{
  public:
    using Pair = std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>>;
    static Pair make_pair();

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &frame) override;
    void        stop() override;
    std::string name() const override { return "loopback"; }
    bool        link_ready() const override;

    // Simulate the link going down for both ends.
    void drop();

  private:
    struct Link
    {
        std::mutex mu;
        bool       up{true};
        struct End
        {
            std::mutex        deliver_mu;
            OnFrame           on_rx;
            std::size_t       max_frame{0};
            std::deque<Frame> held;
        } ends[2];
    };

    LoopbackTransport(std::shared_ptr<Link> link, int side) : link_(std::move(link)), side_(side) {}

    std::shared_ptr<Link> link_;
    int                   side_;
};

}  // namespace transport
