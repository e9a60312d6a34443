#pragma once
#include <atomic>
#include <mutex>
#include <thread>

#include "transport/itransport.hpp"

namespace transport
{

// Frame stream over a connected stream socket. Owns the fd; a reader thread
// delivers inbound frames to on_rx until EOF or stop().
class SocketTransport final : public ITransport
{
  public:
    explicit SocketTransport(int fd);
    ~SocketTransport() override;

    bool        start(const Settings &s, OnFrame on_rx) override;
    bool        send(const Frame &frame) override;
    void        stop() override;
    std::string name() const override { return "tcp"; }
    bool        link_ready() const override { return up_.load(); }

  private:
    void reader_loop();

    int               fd_;
    Settings          settings_;
    OnFrame           on_rx_;
    std::mutex        tx_mu_;
    std::mutex        stop_mu_;
    std::atomic<bool> up_{false};
    std::atomic<bool> stopping_{false};
    std::thread       reader_;
};

}  // namespace transport
