#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "crypto/digest.hpp"
#include "transport/peer_connector.hpp"

namespace transport
{

struct TcpConnectorOptions
{
    std::string               bind_host{"0.0.0.0"};
    std::string               advertise;  // empty: every local IPv4 address plus loopback
    std::chrono::milliseconds dial_timeout{2000};
};

// Direct TCP link. The sender listens on an ephemeral port and offers
// "<token-hex> <host:port>..."; the receiver dials each candidate in turn and
// proves itself by writing the token first.
class TcpPeerConnector final : public IPeerConnector
{
  public:
    explicit TcpPeerConnector(TcpConnectorOptions opt = {});
    ~TcpPeerConnector() override;

    void begin(pairing::Role role, Emit emit, OnConnected on_connected, OnFailed on_failed) override;
    void on_signal(const pairing::Message &m) override;
    void cancel() override;

  private:
    void accept_loop(int lfd);
    void dial(std::string offer);
    bool claim();  // true for the single caller allowed to report a result

    TcpConnectorOptions opt_;
    pairing::Role       role_{pairing::Role::Sender};
    Emit                emit_;
    OnConnected         on_connected_;
    OnFailed            on_failed_;
    digest::Token       token_{};

    std::mutex        mu_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> reported_{false};
    bool              dialing_{false};
    int               listen_fd_{-1};
    std::thread       worker_;
};

}  // namespace transport
