#pragma once
#include <functional>
#include <memory>

#include "pairing/message.hpp"
#include "transport/itransport.hpp"
#include "util/errors.hpp"

namespace transport
{

using Emit        = std::function<ferry::Errc(const pairing::Message &)>;
using OnConnected = std::function<void(std::unique_ptr<ITransport>)>;
using OnFailed    = std::function<void(ferry::Errc)>;

// Negotiates a direct link between the endpoints. Negotiation messages
// (offer/answer/candidate) leave through `emit` and come back via on_signal();
// their content is opaque to everyone else. At most one of on_connected or
// on_failed fires per begin(), possibly from a connector-owned thread. After
// cancel() returns no callback fires any more; do not call cancel() from
// inside a callback.
class IPeerConnector
{
  public:
    virtual ~IPeerConnector() = default;

    virtual void begin(pairing::Role role, Emit emit, OnConnected on_connected, OnFailed on_failed) = 0;
    virtual void on_signal(const pairing::Message &m) = 0;
    virtual void cancel()                             = 0;
};

}  // namespace transport
