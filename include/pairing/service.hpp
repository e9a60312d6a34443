#pragma once
#include <chrono>
#include <memory>
#include <string>

#include "model/manifest.hpp"
#include "pairing/message.hpp"
#include "util/errors.hpp"

namespace pairing
{

struct PairInfo
{
    std::string          code;
    std::string          transfer_id;
    model::Manifest      manifest;
    bool                 matched{false};
    std::chrono::seconds expires_in{0};
};

// One role's end of the rendezvous duplex.
class IChannel
{
  public:
    virtual ~IChannel() = default;

    virtual ferry::Errc send(const Message &m) = 0;
    // False on timeout, or once the channel is closed and drained (see closed()).
    virtual bool recv(Message &out, std::chrono::milliseconds timeout) = 0;
    virtual bool closed() const                                        = 0;
    virtual void close()                                               = 0;
};

// Pairing operations as seen by an endpoint. Implemented in-process by
// PairingRegistry and over a socket by net::RemotePairing.
class IPairingService
{
  public:
    virtual ~IPairingService() = default;

    // Empty transfer_id => the service allocates one.
    virtual ferry::Errc create(const model::Manifest &m,
                               const std::string     &transfer_id,
                               PairInfo              &out)                       = 0;
    virtual ferry::Errc lookup(const std::string &code, PairInfo &out)        = 0;
    virtual ferry::Errc attach(const std::string         &code,
                               Role                       role,
                               std::unique_ptr<IChannel> &out)                = 0;
};

}  // namespace pairing
