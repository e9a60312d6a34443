#include <algorithm>

#include "crypto/digest.hpp"
#include "engine/peer_path.hpp"
#include "engine/relay_path.hpp"
#include "engine/session.hpp"
#include "util/log.hpp"

namespace engine
{
using ferry::Errc;
using pairing::Message;
using pairing::Role;
namespace tag = pairing::tag;

namespace
{
constexpr std::chrono::milliseconds PUMP_SLICE{100};
constexpr std::chrono::milliseconds LOOP_SLICE{100};
}  // namespace

std::string Outcome::summary() const
{
    std::string s;
    for (const auto &p : paths)
    {
        if (!p.attempted)
            continue;
        if (!s.empty())
            s += "; ";
        s += p.path + ": " + ferry::errc_name(p.error);
    }
    if (s.empty())
        s = ferry::errc_name(code);
    return s;
}

// ---------------- Session ----------------

Session::Session(Role role, pairing::IPairingService &pairing, relay::IRelayStore &relay, EngineOptions opt,
                 ConnectorFactory connectors)
    : role_(role), pairing_(pairing), relay_(relay), opt_(std::move(opt)), connectors_(std::move(connectors))
{
}

Session::~Session()
{
    shutdown();
}

void Session::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        local_cancel_ = true;
    }
    peer_stop_.cancel();
    relay_stop_.cancel();
    cv_.notify_all();
}

Errc Session::emit(const Message &m)
{
    if (!channel_)
        return Errc::peer_disconnected;
    return channel_->send(m);
}

bool Session::wait_remote_done(std::chrono::milliseconds d)
{
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait_for(lk, d, [this] { return remote_done_ || local_cancel_ || remote_cancel_; });
    return remote_done_;
}

void Session::start_negotiation()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!connectors_ || peer_state_ != PeerState::idle || latch_.get() != Mode::probing)
            return;
        peer_state_ = PeerState::negotiating;
    }
    connector_ = connectors_();
    if (!connector_)
    {
        on_negotiation_failed(Errc::unreachable);
        return;
    }
    LOG_INFO("negotiating a direct link as %s", pairing::role_name(role_));
    connector_->begin(
        role_, [this](const Message &m) { return emit(m); },
        [this](std::unique_ptr<transport::ITransport> t) { on_transport(std::move(t)); },
        [this](Errc e) { on_negotiation_failed(e); });
}

void Session::on_transport(std::unique_ptr<transport::ITransport> t)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (peer_state_ == PeerState::negotiating && !pending_)
        {
            pending_ = std::move(t);
            cv_.notify_all();
            return;
        }
    }
    LOG_INFO("peer link arrived after the path was decided; dropping it");
    t->stop();
}

void Session::on_negotiation_failed(Errc e)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (peer_state_ != PeerState::negotiating)
        return;
    LOG_INFO("direct link negotiation failed: %s", ferry::errc_name(e));
    peer_state_ = PeerState::failed;
    peer_error_ = e;
    cv_.notify_all();
}

void Session::pump()
{
    Message m;
    while (!pump_stop_.load())
    {
        if (!channel_->recv(m, PUMP_SLICE))
        {
            if (!channel_->closed())
                continue;
            std::lock_guard<std::mutex> lk(mu_);
            if (!is_terminal(latch_.get()))
                LOG_WARN("rendezvous channel closed");
            other_present_ = false;
            if (peer_state_ == PeerState::negotiating)
            {
                peer_state_ = PeerState::failed;
                peer_error_ = Errc::peer_disconnected;
            }
            cv_.notify_all();
            return;
        }

        if (m.type == tag::PEER_CONNECTED)
        {
            bool negotiate = false;
            bool hint      = false;
            {
                std::lock_guard<std::mutex> lk(mu_);
                other_present_  = true;
                const Mode mode = latch_.get();
                hint            = role_ == Role::Sender && mode == Mode::relay;
                negotiate       = mode == Mode::probing && peer_state_ == PeerState::idle;
            }
            LOG_INFO("%s attached", pairing::role_name(pairing::peer_of(role_)));
            if (hint)
                send_relay_hint();
            if (negotiate)
                start_negotiation();
        }
        else if (m.type == tag::PEER_DISCONNECTED)
        {
            std::lock_guard<std::mutex> lk(mu_);
            other_present_ = false;
            LOG_INFO("%s left the rendezvous", pairing::role_name(pairing::peer_of(role_)));
            if (peer_state_ == PeerState::negotiating)
            {
                peer_state_ = PeerState::failed;
                peer_error_ = Errc::peer_disconnected;
            }
            cv_.notify_all();
        }
        else if (m.type == tag::OFFER || m.type == tag::ANSWER || m.type == tag::CANDIDATE)
        {
            if (connector_)
                connector_->on_signal(m);
            else
                LOG_DEBUG("no negotiation in progress, ignoring %s", m.type.c_str());
        }
        else if (m.type == tag::RELAY)
        {
            std::lock_guard<std::mutex> lk(mu_);
            relay_hint_ = true;
            cv_.notify_all();
        }
        else if (m.type == tag::DONE)
        {
            std::lock_guard<std::mutex> lk(mu_);
            remote_done_ = true;
            cv_.notify_all();
        }
        else if (m.type == tag::CANCEL)
        {
            LOG_SYSTEM("the other side cancelled the transfer");
            std::lock_guard<std::mutex> lk(mu_);
            remote_cancel_ = true;
            peer_stop_.cancel();
            relay_stop_.cancel();
            cv_.notify_all();
        }
        else
            LOG_DEBUG("ignoring rendezvous message '%s'", m.type.c_str());
    }
}

void Session::start_peer_locked(std::unique_ptr<transport::ITransport> t)
{
    peer_state_  = PeerState::transferring;
    peer_thread_ = std::thread([this, t = std::move(t)]() {
        const Errc rc = run_peer(*t, peer_stop_);
        t->stop();
        std::lock_guard<std::mutex> lk(mu_);
        peer_error_ = rc;
        peer_state_ = rc == Errc::ok ? PeerState::done : PeerState::failed;
        cv_.notify_all();
    });
}

void Session::start_relay_locked()
{
    if (relay_started_)
        return;
    relay_started_ = true;
    relay_thread_  = std::thread([this]() {
        const Errc                  rc = run_relay(relay_stop_);
        std::lock_guard<std::mutex> lk(mu_);
        relay_error_    = rc;
        relay_finished_ = true;
        cv_.notify_all();
    });
}

void Session::commit_relay_locked(const char *why)
{
    if (!latch_.commit(Mode::relay))
        return;
    LOG_SYSTEM("using the relay: %s", why);
    if (connectors_ && peer_error_ == Errc::ok &&
        (peer_state_ == PeerState::idle || peer_state_ == PeerState::negotiating))
        peer_error_ = Errc::negotiation_timeout;
    start_relay_locked();
    // sent by the drive loop once mu_ is released
    hint_due_ = role_ == Role::Sender && other_present_;
}

void Session::send_relay_hint()
{
    const Errc rc = emit(pairing::make_message(tag::RELAY));
    if (rc != Errc::ok)
        LOG_DEBUG("relay hint not delivered: %s", ferry::errc_name(rc));
}

Outcome Session::drive(const std::string &code, const std::string &transfer_id, const model::Manifest &m)
{
    transfer_id_ = transfer_id;
    manifest_    = m;

    Outcome out;
    out.pair_code   = code;
    out.transfer_id = transfer_id;

    Errc rc = pairing_.attach(code, role_, channel_);
    if (rc != Errc::ok)
    {
        LOG_ERROR("cannot attach to %s: %s", code.c_str(), ferry::errc_name(rc));
        latch_.fail();
        out.mode = latch_.get();
        out.code = rc;
        return out;
    }
    pump_thread_ = std::thread([this] { pump(); });

    const auto deadline = std::chrono::steady_clock::now() + opt_.fallback;
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (!connectors_)
            commit_relay_locked("no direct transport configured");

        for (;;)
        {
            if (local_cancel_ || remote_cancel_)
            {
                if (latch_.cancel())
                    LOG_SYSTEM("transfer cancelled");
                break;
            }
            if (hint_due_)
            {
                hint_due_ = false;
                lk.unlock();
                send_relay_hint();
                lk.lock();
                continue;
            }
            const Mode mode = latch_.get();
            if (is_terminal(mode))
                break;

            if (pending_)
            {
                auto t = std::move(pending_);
                if (mode == Mode::probing && latch_.commit(Mode::peer))
                {
                    LOG_SYSTEM("direct link up via %s, sending peer-to-peer", t->name().c_str());
                    start_peer_locked(std::move(t));
                }
                else
                {
                    peer_state_ = PeerState::failed;
                    peer_reported_ = true;
                    lk.unlock();
                    LOG_INFO("late peer link ignored, already using %s", mode_name(mode));
                    t->stop();
                    lk.lock();
                }
                continue;
            }

            if (peer_state_ == PeerState::failed && !peer_reported_)
            {
                peer_reported_ = true;
                if (mode == Mode::probing)
                    commit_relay_locked(ferry::errc_name(peer_error_));
                else if (mode == Mode::peer && latch_.fallback_to_relay())
                {
                    LOG_SYSTEM("peer path failed (%s), falling back to the relay", ferry::errc_name(peer_error_));
                    start_relay_locked();
                }
                continue;
            }

            if (mode == Mode::probing && relay_hint_)
            {
                commit_relay_locked("the sender is already on the relay");
                continue;
            }
            if (mode == Mode::probing && std::chrono::steady_clock::now() >= deadline)
            {
                commit_relay_locked("no direct link before the fallback deadline");
                continue;
            }

            if (mode == Mode::peer && peer_state_ == PeerState::done)
            {
                lk.unlock();
                on_path_done(Mode::peer);
                lk.lock();
                latch_.finish(Mode::peer, true);
                continue;
            }
            if (mode == Mode::relay && relay_finished_)
            {
                const bool ok = relay_error_ == Errc::ok;
                if (ok)
                {
                    lk.unlock();
                    on_path_done(Mode::relay);
                    lk.lock();
                }
                latch_.finish(Mode::relay, ok);
                continue;
            }

            auto wake = std::chrono::steady_clock::now() + LOOP_SLICE;
            if (mode == Mode::probing)
                wake = std::min(wake, deadline);
            cv_.wait_until(lk, wake);
        }
    }

    const bool remote_cancel = [this] {
        std::lock_guard<std::mutex> lk(mu_);
        return remote_cancel_;
    }();
    out.mode = latch_.get();
    if (out.mode != Mode::complete && !remote_cancel)
    {
        // let the other side stop retrying
        const Errc c = emit(pairing::make_message(tag::CANCEL, mode_name(out.mode)));
        if (c != Errc::ok)
            LOG_DEBUG("cancel not delivered: %s", ferry::errc_name(c));
    }
    shutdown();
    if (out.mode != Mode::complete)
        on_abort();

    std::lock_guard<std::mutex> lk(mu_);
    if (connectors_)
        out.paths.push_back({"peer", true, peer_error_});
    out.paths.push_back({"relay", relay_started_, relay_error_});
    if (out.mode == Mode::complete)
        out.code = Errc::ok;
    else if (out.mode == Mode::cancelled)
        out.code = Errc::cancelled;
    else if (relay_started_ && relay_error_ != Errc::ok)
        out.code = relay_error_;
    else
        out.code = peer_error_ != Errc::ok ? peer_error_ : Errc::unreachable;

    if (out.ok())
        LOG_SYSTEM("transfer complete (%s)", out.summary().c_str());
    else
        LOG_SYSTEM("transfer %s: %s", mode_name(out.mode), out.summary().c_str());
    return out;
}

void Session::shutdown()
{
    pump_stop_.store(true);
    if (pump_thread_.joinable())
        pump_thread_.join();
    if (connector_)
        connector_->cancel();
    peer_stop_.cancel();
    relay_stop_.cancel();
    if (peer_thread_.joinable())
        peer_thread_.join();
    if (relay_thread_.joinable())
        relay_thread_.join();

    std::unique_ptr<transport::ITransport> left;
    {
        std::lock_guard<std::mutex> lk(mu_);
        left.swap(pending_);
    }
    if (left)
        left->stop();
    if (channel_)
        channel_->close();
}

// ---------------- SendSession ----------------

SendSession::SendSession(pairing::IPairingService &pairing, relay::IRelayStore &relay, EngineOptions opt,
                         ConnectorFactory connectors)
    : Session(Role::Sender, pairing, relay, std::move(opt), std::move(connectors))
{
}

SendSession::~SendSession()
{
    shutdown();
}

Errc SendSession::publish(const model::Manifest &m, ISource &src, pairing::PairInfo &out)
{
    if (!model::validate(m))
    {
        LOG_ERROR("refusing to publish an inconsistent manifest");
        return Errc::protocol_error;
    }
    manifest_    = m;
    src_         = &src;
    transfer_id_ = digest::random_hex(16);

    // the relay registration exists before anyone can learn the code
    Errc rc = relay_.create_transfer(transfer_id_, m);
    if (rc != Errc::ok)
    {
        LOG_ERROR("relay registration failed: %s", ferry::errc_name(rc));
        return rc;
    }
    rc = pairing_.create(m, transfer_id_, out);
    if (rc != Errc::ok)
    {
        LOG_ERROR("pair code allocation failed: %s", ferry::errc_name(rc));
        const Errc d = relay_.delete_transfer(transfer_id_);
        if (d != Errc::ok)
            LOG_DEBUG("relay cleanup failed: %s", ferry::errc_name(d));
        return rc;
    }
    code_ = out.code;
    LOG_SYSTEM("code %s: %s, %zu file(s), %s, expires in %llds", code_.c_str(), manifest_.label.c_str(),
               manifest_.entry_count(), model::format_size(manifest_.total_size).c_str(),
               static_cast<long long>(out.expires_in.count()));
    return Errc::ok;
}

Outcome SendSession::run()
{
    if (code_.empty() || !src_)
    {
        Outcome o;
        o.code = Errc::protocol_error;
        LOG_ERROR("run() before publish()");
        return o;
    }
    return drive(code_, transfer_id_, manifest_);
}

Errc SendSession::run_peer(transport::ITransport &t, ferry::CancelToken &stop)
{
    return peer_send(t, manifest_, *src_, opt_, stop);
}

Errc SendSession::run_relay(ferry::CancelToken &stop)
{
    return relay_upload(relay_, transfer_id_, manifest_, *src_, opt_, stop);
}

void SendSession::on_path_done(Mode path)
{
    if (path == Mode::relay)
    {
        LOG_SYSTEM("relay upload complete, waiting for the receiver");
        if (!wait_remote_done(opt_.linger))
        {
            LOG_INFO("no confirmation yet; the relay keeps transfer %s until it expires", transfer_id_.c_str());
            return;
        }
    }
    // peer: the registration never received any data
    const Errc rc = relay_.delete_transfer(transfer_id_);
    if (rc == Errc::ok)
        LOG_DEBUG("relay transfer %s deleted", transfer_id_.c_str());
    else
        LOG_DEBUG("relay transfer %s not deleted: %s", transfer_id_.c_str(), ferry::errc_name(rc));
}

// ---------------- ReceiveSession ----------------

ReceiveSession::ReceiveSession(pairing::IPairingService &pairing, relay::IRelayStore &relay, EngineOptions opt,
                               ConnectorFactory connectors)
    : Session(Role::Receiver, pairing, relay, std::move(opt), std::move(connectors))
{
}

ReceiveSession::~ReceiveSession()
{
    shutdown();
}

Errc ReceiveSession::join(const std::string &code, pairing::PairInfo &out)
{
    Errc rc = pairing_.lookup(code, out);
    if (rc != Errc::ok)
        return rc;
    code_        = out.code;
    transfer_id_ = out.transfer_id;
    manifest_    = out.manifest;
    return Errc::ok;
}

Outcome ReceiveSession::run(ISink &sink)
{
    if (code_.empty())
    {
        Outcome o;
        o.code = Errc::protocol_error;
        LOG_ERROR("run() before join()");
        return o;
    }
    sink_ = &sink;
    return drive(code_, transfer_id_, manifest_);
}

Errc ReceiveSession::run_peer(transport::ITransport &t, ferry::CancelToken &stop)
{
    return peer_receive(t, manifest_, *sink_, opt_, stop);
}

Errc ReceiveSession::run_relay(ferry::CancelToken &stop)
{
    return relay_download(relay_, transfer_id_, manifest_, *sink_, opt_, stop);
}

void ReceiveSession::on_path_done(Mode path)
{
    LOG_SYSTEM("received %s via %s", model::format_size(manifest_.total_size).c_str(), mode_name(path));
    const Errc rc = emit(pairing::make_message(tag::DONE));
    if (rc != Errc::ok)
        LOG_DEBUG("done not delivered: %s", ferry::errc_name(rc));
}

void ReceiveSession::on_abort()
{
    if (sink_)
        sink_->abort();
}

}  // namespace engine
