#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <vector>

#include "net/socket.hpp"
#include "net/wire.hpp"
#include "pairing/service.hpp"
#include "relay/chunk_store.hpp"

namespace net
{

inline constexpr std::chrono::milliseconds CONNECT_TIMEOUT{2000};
inline constexpr std::chrono::milliseconds SIGNAL_ACK_TIMEOUT{10000};

// Request/response client for ferryd. Idle connections are kept for reuse, so
// parallel relay workers each hold their own socket.
class Client
{
  public:
    explicit Client(Endpoint ep, std::size_t max_idle = 8);
    ~Client();
    Client(const Client &)            = delete;
    Client &operator=(const Client &) = delete;

    // One round trip. unreachable when no connection could be made, io_error
    // when the connection broke mid-request; otherwise the server's code.
    ferry::Errc call(Op op, const std::vector<std::uint8_t> &req, std::vector<std::uint8_t> &resp);

    // Fresh connection outside the pool (rendezvous duplex). -1 on failure.
    int open_dedicated();

    const Endpoint &endpoint() const { return ep_; }

  private:
    int  acquire(bool &reused);
    void release(int fd);

    Endpoint    ep_;
    std::size_t max_idle_;
    std::mutex  mu_;
    std::vector<int> idle_;
};

class RemoteRelayStore final : public relay::IRelayStore
{
  public:
    explicit RemoteRelayStore(std::shared_ptr<Client> client) : client_(std::move(client)) {}

    ferry::Errc create_transfer(const std::string &id, const model::Manifest &m) override;
    ferry::Errc put_chunk(const std::string               &id,
                          std::uint32_t                    index,
                          const std::vector<std::uint8_t> &bytes) override;
    ferry::Errc get_chunk(const std::string &id, std::uint32_t index, relay::Fetched &out) override;
    ferry::Errc status(const std::string &id, relay::Status &out) override;
    ferry::Errc get_manifest(const std::string &id, model::Manifest &out) override;
    ferry::Errc delete_transfer(const std::string &id) override;
    ferry::Errc cleanup(std::size_t &purged) override;

  private:
    std::shared_ptr<Client> client_;
};

class RemotePairing final : public pairing::IPairingService
{
  public:
    explicit RemotePairing(std::shared_ptr<Client>   client,
                           std::chrono::milliseconds ack_timeout = SIGNAL_ACK_TIMEOUT)
        : client_(std::move(client)), ack_timeout_(ack_timeout)
    {
    }

    ferry::Errc create(const model::Manifest &m,
                       const std::string     &transfer_id,
                       pairing::PairInfo     &out) override;
    ferry::Errc lookup(const std::string &code, pairing::PairInfo &out) override;
    ferry::Errc attach(const std::string                  &code,
                       pairing::Role                       role,
                       std::unique_ptr<pairing::IChannel> &out) override;

  private:
    std::shared_ptr<Client>   client_;
    std::chrono::milliseconds ack_timeout_;
};

}  // namespace net
