#include "crypto/digest.hpp"
#include "pairing/registry.hpp"
#include "util/log.hpp"

namespace pairing
{
using ferry::Errc;

namespace
{

constexpr int CODE_ATTEMPTS = 1000;

// In-process channel: sends go straight into the room, receives pop the mailbox.
class LocalChannel final : public IChannel
{
  public:
    LocalChannel(std::shared_ptr<Room> room, std::shared_ptr<Mailbox> box, Role role)
        : room_(std::move(room)), box_(std::move(box)), role_(role)
    {
    }
    ~LocalChannel() override { close(); }

    Errc send(const Message &m) override
    {
        if (box_->closed())
            return Errc::peer_disconnected;
        return room_->send(role_, m);
    }
    bool recv(Message &out, std::chrono::milliseconds timeout) override
    {
        return box_->pop(out, timeout);
    }
    bool closed() const override { return box_->closed(); }
    void close() override { room_->detach(role_, box_.get()); }

  private:
    std::shared_ptr<Room>    room_;
    std::shared_ptr<Mailbox> box_;
    Role                     role_;
};

}  // namespace

PairingRegistry::PairingRegistry(const ferry::Clock &clock, std::chrono::seconds ttl, unsigned digits)
    : clock_(clock), ttl_(ttl), digits_(digits), code_space_(1)
{
    for (unsigned i = 0; i < digits_; ++i)
        code_space_ *= 10;
}

PairingRegistry::Session *PairingRegistry::find_live_locked(const std::string &code,
                                                            ferry::TimePoint   now)
{
    auto it = sessions_.find(code);
    if (it == sessions_.end())
        return nullptr;
    if (now >= it->second.expires_at)
    {
        LOG_DEBUG("pair %s expired, evicting", code.c_str());
        it->second.room->close();
        sessions_.erase(it);
        return nullptr;
    }
    return &it->second;
}

Errc PairingRegistry::generate_code_locked(std::string &out) const
{
    // keep well clear of the code space so random probing stays cheap
    if (sessions_.size() >= code_space_ - code_space_ / 10)
        return Errc::code_space_exhausted;

    for (int attempt = 0; attempt < CODE_ATTEMPTS; ++attempt)
    {
        std::string code;
        code.reserve(digits_);
        for (unsigned i = 0; i < digits_; ++i)
            code.push_back(static_cast<char>('0' + digest::random_below(10)));
        if (sessions_.find(code) == sessions_.end())
        {
            out = std::move(code);
            return Errc::ok;
        }
    }
    return Errc::code_space_exhausted;
}

Errc PairingRegistry::create(const model::Manifest &m, const std::string &transfer_id, PairInfo &out)
{
    if (!model::validate(m))
        return Errc::protocol_error;

    const ferry::TimePoint      now = clock_.now();
    std::lock_guard<std::mutex> lk(mu_);

    std::string code;
    Errc        rc = generate_code_locked(code);
    if (rc != Errc::ok)
    {
        LOG_ERROR("pair create: no free code among %zu active sessions", sessions_.size());
        return rc;
    }

    Session s;
    s.code        = code;
    s.transfer_id = transfer_id.empty() ? digest::random_hex(16) : transfer_id;
    s.manifest    = m;
    s.created_at  = now;
    s.expires_at  = now + ttl_;
    s.room        = std::make_shared<Room>();

    out.code        = s.code;
    out.transfer_id = s.transfer_id;
    out.manifest    = s.manifest;
    out.matched     = false;
    out.expires_in  = ttl_;

    LOG_INFO("pair %s created for transfer %s (ttl %llds)", code.c_str(), s.transfer_id.c_str(),
             (long long)ttl_.count());
    sessions_.emplace(code, std::move(s));
    return Errc::ok;
}

Errc PairingRegistry::lookup(const std::string &code, PairInfo &out)
{
    const ferry::TimePoint      now = clock_.now();
    std::lock_guard<std::mutex> lk(mu_);
    Session                    *s = find_live_locked(code, now);
    if (!s)
        return Errc::pair_not_found;

    out.code        = s->code;
    out.transfer_id = s->transfer_id;
    out.manifest    = s->manifest;
    out.matched     = s->room->matched();
    const auto left = std::chrono::duration_cast<std::chrono::seconds>(s->expires_at - now);
    out.expires_in  = left.count() > 0 ? left : std::chrono::seconds(0);
    return Errc::ok;
}

Errc PairingRegistry::join(const std::string        &code,
                           Role                      role,
                           std::shared_ptr<Room>    &room,
                           std::shared_ptr<Mailbox> &box)
{
    const ferry::TimePoint now = clock_.now();
    {
        std::lock_guard<std::mutex> lk(mu_);
        Session                    *s = find_live_locked(code, now);
        if (!s)
            return Errc::pair_not_found;
        room = s->room;
    }
    box = room->attach(role);
    if (!box)
        return Errc::pair_not_found;  // closed between lookup and attach
    LOG_INFO("pair %s: %s attached", code.c_str(), role_name(role));
    return Errc::ok;
}

Errc PairingRegistry::attach(const std::string &code, Role role, std::unique_ptr<IChannel> &out)
{
    std::shared_ptr<Room>    room;
    std::shared_ptr<Mailbox> box;
    Errc                     rc = join(code, role, room, box);
    if (rc != Errc::ok)
        return rc;
    out = std::make_unique<LocalChannel>(std::move(room), std::move(box), role);
    return Errc::ok;
}

Errc PairingRegistry::close(const std::string &code)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = sessions_.find(code);
    if (it == sessions_.end())
        return Errc::pair_not_found;
    it->second.room->close();
    sessions_.erase(it);
    LOG_INFO("pair %s closed", code.c_str());
    return Errc::ok;
}

std::size_t PairingRegistry::sweep()
{
    const ferry::TimePoint      now = clock_.now();
    std::size_t                 n   = 0;
    std::lock_guard<std::mutex> lk(mu_);
    for (auto it = sessions_.begin(); it != sessions_.end();)
    {
        if (now >= it->second.expires_at)
        {
            it->second.room->close();
            it = sessions_.erase(it);
            ++n;
        }
        else
        {
            ++it;
        }
    }
    if (n)
        LOG_INFO("pair sweep: %zu expired", n);
    return n;
}

std::size_t PairingRegistry::active() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

}  // namespace pairing
