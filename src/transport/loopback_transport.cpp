#include "transport/loopback_transport.hpp"
#include "util/log.hpp"

namespace transport
{

LoopbackTransport::Pair LoopbackTransport::make_pair()
{
    auto link = std::make_shared<Link>();
    return Pair(std::unique_ptr<LoopbackTransport>(new LoopbackTransport(link, 0)),
                std::unique_ptr<LoopbackTransport>(new LoopbackTransport(link, 1)));
}

bool LoopbackTransport::start(const Settings &s, OnFrame on_rx)
{
    Link::End &me = link_->ends[side_];
    // hold deliver_mu while flushing so frames sent meanwhile queue up behind
    std::lock_guard<std::mutex> dl(me.deliver_mu);
    std::deque<Frame>           held;
    {
        std::lock_guard<std::mutex> lk(link_->mu);
        if (!link_->up)
            return false;
        me.on_rx     = std::move(on_rx);
        me.max_frame = s.max_frame;
        held.swap(me.held);
    }
    for (const auto &f : held)
        me.on_rx(f);
    return true;
}

bool LoopbackTransport::send(const Frame &frame)
{
    Link::End &peer = link_->ends[1 - side_];
    OnFrame    cb;
    {
        std::lock_guard<std::mutex> lk(link_->mu);
        if (!link_->up)
            return false;
        const std::size_t mine = link_->ends[side_].max_frame;
        if (mine != 0 && frame.size() > mine)
        {
            LOG_WARN("loopback: frame of %zu bytes exceeds max %zu", frame.size(), mine);
            return false;
        }
        if (!peer.on_rx)
        {
            peer.held.push_back(frame);
            return true;
        }
        cb = peer.on_rx;
    }
    std::lock_guard<std::mutex> dl(peer.deliver_mu);
    cb(frame);
    return true;
}

void LoopbackTransport::stop()
{
    // one side stopping takes the whole link down, like a closed socket
    drop();
    Link::End                  &me = link_->ends[side_];
    std::lock_guard<std::mutex> dl(me.deliver_mu);
    std::lock_guard<std::mutex> lk(link_->mu);
    me.on_rx = nullptr;
}

bool LoopbackTransport::link_ready() const
{
    std::lock_guard<std::mutex> lk(link_->mu);
    return link_->up;
}

void LoopbackTransport::drop()
{
    std::lock_guard<std::mutex> lk(link_->mu);
    link_->up = false;
}

}  // namespace transport
