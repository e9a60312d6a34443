#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "engine/mode.hpp"
#include "engine/options.hpp"
#include "engine/storage.hpp"
#include "pairing/service.hpp"
#include "relay/chunk_store.hpp"
#include "transport/peer_connector.hpp"

/*
One endpoint of a transfer:

  run()
    attach to the pair code ──▶ pump thread (rendezvous messages)
    arm fallback deadline         peer_connected ─▶ connector.begin()
                                  offer/answer   ─▶ connector.on_signal()
    main loop (cv)                peer_disconnected ─▶ peer path failed
      transport ready  ─▶ latch.commit(peer)  ─▶ peer worker
      deadline / peer failure ─▶ latch.commit(relay) ─▶ relay worker
      committed peer fails ─▶ latch.fallback_to_relay() ─▶ relay worker
      worker done ─▶ latch.finish()

A path that loses the commit keeps running until its own result arrives,
which is then ignored; a late peer link is stopped on arrival.
*/

namespace engine
{

using ConnectorFactory = std::function<std::unique_ptr<transport::IPeerConnector>()>;

struct PathReport
{
    std::string path;  // "peer" or "relay"
    bool        attempted{false};
    ferry::Errc error{ferry::Errc::ok};
};

struct Outcome
{
    Mode                    mode{Mode::failed};
    ferry::Errc             code{ferry::Errc::ok};
    std::string             pair_code;
    std::string             transfer_id;
    std::vector<PathReport> paths;

    bool        ok() const { return mode == Mode::complete; }
    // "peer: negotiation_timeout; relay: chunk_unavailable"
    std::string summary() const;
};

// State shared by both roles: the latch, the rendezvous pump and the worker
// bookkeeping. Role-specific work is in SendSession / ReceiveSession.
class Session
{
  public:
    virtual ~Session();
    Session(const Session &)            = delete;
    Session &operator=(const Session &) = delete;

    // Abort from any thread; the other endpoint is told over the rendezvous.
    void cancel();
    Mode mode() const { return latch_.get(); }

  protected:
    Session(pairing::Role          role,
            pairing::IPairingService &pairing,
            relay::IRelayStore       &relay,
            EngineOptions             opt,
            ConnectorFactory          connectors);

    Outcome drive(const std::string &code, const std::string &transfer_id, const model::Manifest &m);

    // Run on a worker thread; the transport is stopped by the caller.
    virtual ferry::Errc run_peer(transport::ITransport &t, ferry::CancelToken &stop) = 0;
    virtual ferry::Errc run_relay(ferry::CancelToken &stop)                          = 0;
    // After the active path succeeded, before the latch completes.
    virtual void on_path_done(Mode path) = 0;
    virtual void on_abort() {}

    ferry::Errc emit(const pairing::Message &m);
    bool        wait_remote_done(std::chrono::milliseconds d);
    // Joins every thread; derived destructors call it before their members go.
    void shutdown();

    pairing::Role             role_;
    pairing::IPairingService &pairing_;
    relay::IRelayStore       &relay_;
    EngineOptions             opt_;
    std::string               transfer_id_;
    model::Manifest           manifest_;
    ModeLatch                 latch_;

  private:
    enum class PeerState
    {
        idle,
        negotiating,
        transferring,
        done,
        failed
    };

    void pump();
    void start_negotiation();
    void on_transport(std::unique_ptr<transport::ITransport> t);
    void on_negotiation_failed(ferry::Errc e);
    void start_relay_locked();
    void start_peer_locked(std::unique_ptr<transport::ITransport> t);
    void commit_relay_locked(const char *why);
    void send_relay_hint();

    ConnectorFactory                           connectors_;
    std::unique_ptr<pairing::IChannel>         channel_;
    std::unique_ptr<transport::IPeerConnector> connector_;
    std::thread                                pump_thread_;
    std::thread                                peer_thread_;
    std::thread                                relay_thread_;
    ferry::CancelToken                         peer_stop_;
    ferry::CancelToken                         relay_stop_;
    std::atomic<bool>                          pump_stop_{false};

    std::mutex                             mu_;
    std::condition_variable                cv_;
    std::unique_ptr<transport::ITransport> pending_;  // link awaiting commit
    PeerState                              peer_state_{PeerState::idle};
    ferry::Errc                            peer_error_{ferry::Errc::ok};
    bool                                   peer_reported_{false};
    bool                                   relay_started_{false};
    bool                                   relay_finished_{false};
    ferry::Errc                            relay_error_{ferry::Errc::ok};
    bool                                   other_present_{false};
    bool                                   remote_done_{false};
    bool                                   remote_cancel_{false};
    bool                                   local_cancel_{false};
    bool                                   relay_hint_{false};
    bool                                   hint_due_{false};
};

class SendSession final : public Session
{
  public:
    SendSession(pairing::IPairingService &pairing,
                relay::IRelayStore       &relay,
                EngineOptions             opt,
                ConnectorFactory          connectors = nullptr);
    ~SendSession() override;

    // Register the relay transfer and the pair code. The code in `out` is what
    // the user hands to the receiver.
    ferry::Errc publish(const model::Manifest &m, ISource &src, pairing::PairInfo &out);
    // Blocks until the transfer completes, fails or is cancelled.
    Outcome run();

  protected:
    ferry::Errc run_peer(transport::ITransport &t, ferry::CancelToken &stop) override;
    ferry::Errc run_relay(ferry::CancelToken &stop) override;
    void        on_path_done(Mode path) override;

  private:
    ISource    *src_{nullptr};
    std::string code_;
};

class ReceiveSession final : public Session
{
  public:
    ReceiveSession(pairing::IPairingService &pairing,
                   relay::IRelayStore       &relay,
                   EngineOptions             opt,
                   ConnectorFactory          connectors = nullptr);
    ~ReceiveSession() override;

    // Look the code up; `out` describes what would be received.
    ferry::Errc join(const std::string &code, pairing::PairInfo &out);
    Outcome     run(ISink &sink);

  protected:
    ferry::Errc run_peer(transport::ITransport &t, ferry::CancelToken &stop) override;
    ferry::Errc run_relay(ferry::CancelToken &stop) override;
    void        on_path_done(Mode path) override;
    void        on_abort() override;

  private:
    ISink      *sink_{nullptr};
    std::string code_;
};

}  // namespace engine
