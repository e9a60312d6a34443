#include "pairing/rendezvous.hpp"
#include "util/log.hpp"

namespace pairing
{
using ferry::Errc;

bool Mailbox::push(Message m)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_)
            return false;
        q_.push_back(std::move(m));
    }
    cv_.notify_one();
    return true;
}

bool Mailbox::pop(Message &out, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, timeout, [this] { return !q_.empty() || closed_; });
    if (q_.empty())
        return false;
    out = std::move(q_.front());
    q_.pop_front();
    return true;
}

void Mailbox::close()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool Mailbox::closed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

std::shared_ptr<Mailbox> Room::attach(Role r)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_)
        return nullptr;

    auto box = std::make_shared<Mailbox>();
    auto &q  = pending_[slot(r)];
    while (!q.empty())
    {
        box->push(std::move(q.front()));
        q.pop_front();
    }
    if (boxes_[slot(r)])
    {
        LOG_DEBUG("rendezvous: %s re-attached, closing previous connection", role_name(r));
        boxes_[slot(r)]->close();
    }
    boxes_[slot(r)] = box;

    if (boxes_[0] && boxes_[1])
    {
        boxes_[slot(Role::Sender)]->push(make_message(tag::PEER_CONNECTED, role_name(Role::Receiver)));
        boxes_[slot(Role::Receiver)]->push(make_message(tag::PEER_CONNECTED, role_name(Role::Sender)));
    }
    return box;
}

Errc Room::send(Role from, Message m)
{
    if (is_reserved(m.type))
        return Errc::protocol_error;

    std::lock_guard<std::mutex> lk(mu_);
    if (closed_)
        return Errc::peer_disconnected;
    if (!boxes_[slot(from)])
        return Errc::protocol_error;

    const Role to = peer_of(from);
    if (boxes_[slot(to)])
    {
        boxes_[slot(to)]->push(std::move(m));
        return Errc::ok;
    }
    auto &q = pending_[slot(to)];
    if (q.size() >= max_buffered_)
    {
        LOG_WARN("rendezvous: backlog for %s full, dropping '%s'", role_name(to), m.type.c_str());
        return Errc::backlog_full;
    }
    q.push_back(std::move(m));
    return Errc::ok;
}

void Room::detach(Role r, const Mailbox *which)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                       &box = boxes_[slot(r)];
    if (!box || box.get() != which)
        return;
    box->close();
    box.reset();
    auto &other = boxes_[slot(peer_of(r))];
    if (other)
        other->push(make_message(tag::PEER_DISCONNECTED, role_name(r)));
}

void Room::close()
{
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
    for (auto &b : boxes_)
    {
        if (b)
            b->close();
        b.reset();
    }
    for (auto &q : pending_)
        q.clear();
}

bool Room::present(Role r) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return boxes_[slot(r)] != nullptr;
}

bool Room::matched() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return boxes_[0] && boxes_[1];
}

}  // namespace pairing
