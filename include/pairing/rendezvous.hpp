#pragma once
#include <array>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

#include "pairing/message.hpp"
#include "util/errors.hpp"

namespace pairing
{

inline constexpr std::size_t MAX_BUFFERED = 32;

// Inbound queue of one attached role. The room pushes under its own lock, so
// messages from the other role arrive here in send order.
class Mailbox
{
  public:
    bool push(Message m);  // false once closed
    // Wait up to `timeout`. False on timeout, or when closed and drained.
    bool pop(Message &out, std::chrono::milliseconds timeout);
    void close();
    bool closed() const;

  private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Message>     q_;
    bool                    closed_{false};
};

// Duplex relay between the two roles of one pair code.
class Room
{
  public:
    explicit Room(std::size_t max_buffered = MAX_BUFFERED) : max_buffered_(max_buffered) {}

    // Re-attaching a role supersedes (and closes) its previous mailbox.
    std::shared_ptr<Mailbox> attach(Role r);
    ferry::Errc              send(Role from, Message m);
    // No-op when `which` was already superseded by a newer attach.
    void detach(Role r, const Mailbox *which);
    void close();

    bool present(Role r) const;
    bool matched() const;

  private:
    static std::size_t slot(Role r) { return static_cast<std::size_t>(r); }

    mutable std::mutex                      mu_;
    std::array<std::shared_ptr<Mailbox>, 2> boxes_;
    std::array<std::deque<Message>, 2>      pending_;  // addressed to a role not attached yet
    std::size_t                             max_buffered_;
    bool                                    closed_{false};
};

}  // namespace pairing
