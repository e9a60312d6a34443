#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "pairing/rendezvous.hpp"
#include "pairing/service.hpp"
#include "util/clock.hpp"

namespace pairing
{

inline constexpr std::chrono::seconds DEFAULT_TTL{3600};
inline constexpr unsigned             CODE_DIGITS = 6;

// Owns every active pair session. Expiry is enforced on each access; sweep()
// only reclaims memory, so its timing never makes a stale code look valid.
class PairingRegistry final : public IPairingService
{
  public:
    explicit PairingRegistry(const ferry::Clock  &clock,
                             std::chrono::seconds ttl    = DEFAULT_TTL,
                             unsigned             digits = CODE_DIGITS);

    ferry::Errc create(const model::Manifest &m,
                       const std::string     &transfer_id,
                       PairInfo              &out) override;
    ferry::Errc lookup(const std::string &code, PairInfo &out) override;
    ferry::Errc attach(const std::string         &code,
                       Role                       role,
                       std::unique_ptr<IChannel> &out) override;

    // Raw attach used by the socket server, which pumps the mailbox itself.
    ferry::Errc join(const std::string        &code,
                     Role                      role,
                     std::shared_ptr<Room>    &room,
                     std::shared_ptr<Mailbox> &box);

    ferry::Errc close(const std::string &code);
    std::size_t sweep();
    std::size_t active() const;

  private:
    struct Session
    {
        std::string           code;
        std::string           transfer_id;
        model::Manifest       manifest;
        ferry::TimePoint      created_at;
        ferry::TimePoint      expires_at;
        std::shared_ptr<Room> room;
    };

    // Looks up `code`, evicting it if expired. Caller holds mu_.
    Session    *find_live_locked(const std::string &code, ferry::TimePoint now);
    ferry::Errc generate_code_locked(std::string &out) const;

    const ferry::Clock  &clock_;
    std::chrono::seconds ttl_;
    unsigned             digits_;
    std::uint64_t        code_space_;

    mutable std::mutex                       mu_;
    std::unordered_map<std::string, Session> sessions_;
};

}  // namespace pairing
