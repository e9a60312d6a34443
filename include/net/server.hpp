#pragma once
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "net/socket.hpp"
#include "pairing/registry.hpp"
#include "relay/chunk_store.hpp"

namespace net
{

// Serves the pairing registry, the rendezvous duplex and the relay store on
// one stream socket, a thread per connection.
class RelayServer
{
  public:
    RelayServer(pairing::PairingRegistry &registry, relay::IRelayStore &store);
    ~RelayServer();
    RelayServer(const RelayServer &)            = delete;
    RelayServer &operator=(const RelayServer &) = delete;

    bool start(const Endpoint &ep);
    void stop();

    // Bound endpoint; for tcp with port 0 this carries the real port.
    Endpoint endpoint() const { return bound_; }

  private:
    struct Conn
    {
        int               fd{-1};
        std::thread       th;
        std::atomic<bool> done{false};
    };

    void accept_loop();
    void serve(Conn &c);
    void reap_locked();  // joins finished connections
    // Rendezvous mode after a successful attach; returns when the client leaves.
    void serve_attached(int fd, pairing::Role role, const std::string &code,
                        std::shared_ptr<pairing::Room> room, std::shared_ptr<pairing::Mailbox> box);

    pairing::PairingRegistry &registry_;
    relay::IRelayStore       &store_;
    Endpoint                  bound_;
    int                       listen_fd_{-1};
    std::atomic<bool>         stopping_{false};
    std::thread               accept_thread_;

    std::mutex                         conns_mu_;
    std::list<std::shared_ptr<Conn>>   conns_;
};

}  // namespace net
