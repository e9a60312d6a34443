#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <thread>

#include "net/remote.hpp"
#include "pairing/rendezvous.hpp"
#include "util/log.hpp"

namespace net
{
using ferry::Errc;

namespace
{

// Rendezvous duplex over a dedicated connection. A reader thread splits the
// stream into pushed messages (to the inbox) and acks for send(). The server
// acks in order, so an ack that arrives after its send() timed out is dropped.
class RemoteChannel final : public pairing::IChannel
{
  public:
    RemoteChannel(int fd, std::chrono::milliseconds ack_timeout) : fd_(fd), ack_timeout_(ack_timeout)
    {
        reader_ = std::thread([this] { read_loop(); });
    }
    ~RemoteChannel() override { close(); }

    Errc send(const pairing::Message &m) override
    {
        std::lock_guard<std::mutex> slk(send_mu_);
        if (fd_ < 0 || closing_.load())
            return Errc::peer_disconnected;

        ferry::ByteWriter w;
        put_message(w, m);
        if (!write_frame(fd_, static_cast<std::uint8_t>(Op::signal), w.bytes()))
            return Errc::io_error;

        std::unique_lock<std::mutex> lk(ack_mu_);
        if (!ack_cv_.wait_for(lk, ack_timeout_, [&] { return !acks_.empty() || reader_done_; }))
        {
            LOG_WARN("rendezvous: no ack for '%s' within %lld ms", m.type.c_str(),
                     static_cast<long long>(ack_timeout_.count()));
            ++stale_acks_;
            return Errc::io_error;
        }
        if (acks_.empty())
            return Errc::peer_disconnected;
        Errc rc = acks_.front();
        acks_.pop_front();
        return rc;
    }

    bool recv(pairing::Message &out, std::chrono::milliseconds timeout) override
    {
        return inbox_.pop(out, timeout);
    }

    bool closed() const override { return inbox_.closed(); }

    void close() override
    {
        std::lock_guard<std::mutex> clk(close_mu_);
        if (closing_.exchange(true))
            return;
        ::shutdown(fd_, SHUT_RDWR);
        if (reader_.joinable())
            reader_.join();
        {
            std::lock_guard<std::mutex> slk(send_mu_);
            ::close(fd_);
            fd_ = -1;
        }
        inbox_.close();
    }

  private:
    void read_loop()
    {
        for (;;)
        {
            std::uint8_t              tag = 0;
            std::vector<std::uint8_t> payload;
            if (!read_frame(fd_, tag, payload))
                break;
            if (tag == TAG_PUSH)
            {
                ferry::ByteReader r(payload);
                pairing::Message  m;
                if (!get_message(r, m) || !r.done())
                {
                    LOG_WARN("rendezvous: malformed push, closing");
                    break;
                }
                (void)inbox_.push(std::move(m));
            }
            else if (tag == TAG_SIGNAL_ACK && payload.size() == 1)
            {
                std::lock_guard<std::mutex> lk(ack_mu_);
                if (stale_acks_ > 0)
                {
                    --stale_acks_;
                    LOG_DEBUG("rendezvous: dropping late ack");
                    continue;
                }
                acks_.push_back(ferry::errc_from_byte(payload[0]));
                ack_cv_.notify_all();
            }
            else
            {
                LOG_WARN("rendezvous: unexpected frame 0x%02x, closing", tag);
                break;
            }
        }
        inbox_.close();
        std::lock_guard<std::mutex> lk(ack_mu_);
        reader_done_ = true;
        ack_cv_.notify_all();
    }

    int                       fd_;
    std::chrono::milliseconds ack_timeout_;
    std::thread               reader_;
    std::atomic<bool> closing_{false};
    std::mutex        close_mu_;
    std::mutex        send_mu_;

    pairing::Mailbox inbox_;

    std::mutex              ack_mu_;
    std::condition_variable ack_cv_;
    std::deque<Errc>        acks_;
    std::size_t             stale_acks_{0};  // sends that gave up waiting
    bool                    reader_done_{false};
};

}  // namespace

Client::Client(Endpoint ep, std::size_t max_idle) : ep_(std::move(ep)), max_idle_(max_idle) {}

Client::~Client()
{
    std::lock_guard<std::mutex> lk(mu_);
    for (int fd : idle_)
        ::close(fd);
    idle_.clear();
}

int Client::open_dedicated()
{
    return connect_to(ep_, CONNECT_TIMEOUT);
}

int Client::acquire(bool &reused)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!idle_.empty())
        {
            int fd = idle_.back();
            idle_.pop_back();
            reused = true;
            return fd;
        }
    }
    reused = false;
    return connect_to(ep_, CONNECT_TIMEOUT);
}

void Client::release(int fd)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (idle_.size() < max_idle_)
        idle_.push_back(fd);
    else
        ::close(fd);
}

Errc Client::call(Op op, const std::vector<std::uint8_t> &req, std::vector<std::uint8_t> &resp)
{
    // A pooled socket may have been closed by a restarted server; such a
    // failure earns one more try on a fresh connection. Once the request went
    // out the server may have acted on it, so only idempotent ops are resent.
    for (int attempt = 0; attempt < 2; ++attempt)
    {
        bool reused = false;
        int  fd     = acquire(reused);
        if (fd < 0)
            return Errc::unreachable;

        std::uint8_t tag  = 0;
        const bool   sent = write_frame(fd, static_cast<std::uint8_t>(op), req);
        if (sent && read_frame(fd, tag, resp))
        {
            release(fd);
            return ferry::errc_from_byte(tag);
        }
        ::close(fd);
        if (!reused)
            break;
        if (sent && !is_idempotent(op))
        {
            LOG_WARN("%s: connection lost after the request was sent, not resending", op_name(op));
            break;
        }
        LOG_DEBUG("%s: stale pooled connection, reconnecting", op_name(op));
    }
    return Errc::io_error;
}

// ---- relay store --------------------------------------------------------

Errc RemoteRelayStore::create_transfer(const std::string &id, const model::Manifest &m)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(id);
    put_manifest(w, m);
    return client_->call(Op::create_transfer, w.bytes(), resp);
}

Errc RemoteRelayStore::put_chunk(const std::string &id, std::uint32_t index, const std::vector<std::uint8_t> &bytes)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(id);
    w.put_u32(index);
    w.put_blob(bytes);
    return client_->call(Op::put_chunk, w.bytes(), resp);
}

Errc RemoteRelayStore::get_chunk(const std::string &id, std::uint32_t index, relay::Fetched &out)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(id);
    w.put_u32(index);
    Errc rc = client_->call(Op::get_chunk, w.bytes(), resp);
    if (rc != Errc::ok)
        return rc;
    ferry::ByteReader r(resp);
    if (!r.get_blob(out.bytes) || !r.get_raw(out.hash.data(), out.hash.size()) || !r.done())
        return Errc::protocol_error;
    return Errc::ok;
}

Errc RemoteRelayStore::status(const std::string &id, relay::Status &out)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(id);
    Errc rc = client_->call(Op::status, w.bytes(), resp);
    if (rc != Errc::ok)
        return rc;
    ferry::ByteReader r(resp);
    return get_status(r, out) && r.done() ? Errc::ok : Errc::protocol_error;
}

Errc RemoteRelayStore::get_manifest(const std::string &id, model::Manifest &out)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(id);
    Errc rc = client_->call(Op::get_manifest, w.bytes(), resp);
    if (rc != Errc::ok)
        return rc;
    ferry::ByteReader r(resp);
    return net::get_manifest(r, out) && r.done() ? Errc::ok : Errc::protocol_error;
}

Errc RemoteRelayStore::delete_transfer(const std::string &id)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(id);
    return client_->call(Op::delete_transfer, w.bytes(), resp);
}

Errc RemoteRelayStore::cleanup(std::size_t &purged)
{
    std::vector<std::uint8_t> resp;
    Errc                      rc = client_->call(Op::cleanup, {}, resp);
    if (rc != Errc::ok)
        return rc;
    ferry::ByteReader r(resp);
    std::uint64_t     n = 0;
    if (!r.get_u64(n) || !r.done())
        return Errc::protocol_error;
    purged = static_cast<std::size_t>(n);
    return Errc::ok;
}

// ---- pairing ------------------------------------------------------------

Errc RemotePairing::create(const model::Manifest &m, const std::string &transfer_id, pairing::PairInfo &out)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(transfer_id);
    put_manifest(w, m);
    Errc rc = client_->call(Op::pair_create, w.bytes(), resp);
    if (rc != Errc::ok)
        return rc;
    ferry::ByteReader r(resp);
    return get_pair_info(r, out) && r.done() ? Errc::ok : Errc::protocol_error;
}

Errc RemotePairing::lookup(const std::string &code, pairing::PairInfo &out)
{
    ferry::ByteWriter         w;
    std::vector<std::uint8_t> resp;
    w.put_str(code);
    Errc rc = client_->call(Op::pair_lookup, w.bytes(), resp);
    if (rc != Errc::ok)
        return rc;
    ferry::ByteReader r(resp);
    return get_pair_info(r, out) && r.done() ? Errc::ok : Errc::protocol_error;
}

Errc RemotePairing::attach(const std::string &code, pairing::Role role, std::unique_ptr<pairing::IChannel> &out)
{
    int fd = client_->open_dedicated();
    if (fd < 0)
        return Errc::unreachable;

    ferry::ByteWriter w;
    w.put_str(code);
    w.put_u8(static_cast<std::uint8_t>(role));
    std::uint8_t              tag = 0;
    std::vector<std::uint8_t> resp;
    if (!write_frame(fd, static_cast<std::uint8_t>(Op::pair_attach), w.bytes()) || !read_frame(fd, tag, resp))
    {
        ::close(fd);
        return Errc::io_error;
    }
    Errc rc = ferry::errc_from_byte(tag);
    if (rc != Errc::ok)
    {
        ::close(fd);
        return rc;
    }
    out = std::make_unique<RemoteChannel>(fd, ack_timeout_);
    return Errc::ok;
}

}  // namespace net
