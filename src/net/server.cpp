#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "net/server.hpp"
#include "net/wire.hpp"
#include "util/log.hpp"

namespace net
{
using ferry::Errc;

namespace
{
constexpr int                       ACCEPT_POLL_MS = 200;
constexpr std::chrono::milliseconds PUSH_SLICE{200};
constexpr std::size_t               ID_MAX = 256;
}  // namespace

RelayServer::RelayServer(pairing::PairingRegistry &registry, relay::IRelayStore &store)
    : registry_(registry), store_(store)
{
}

RelayServer::~RelayServer()
{
    stop();
}

bool RelayServer::start(const Endpoint &ep)
{
    if (listen_fd_ >= 0)
        return false;
    listen_fd_ = listen_on(ep, 64);
    if (listen_fd_ < 0)
        return false;
    bound_ = ep;
    if (ep.kind == Endpoint::Kind::Tcp)
        bound_.port = local_port(listen_fd_);
    stopping_.store(false);
    accept_thread_ = std::thread([this] { accept_loop(); });
    LOG_INFO("serving on %s", to_string(bound_).c_str());
    return true;
}

void RelayServer::stop()
{
    stopping_.store(true);
    if (accept_thread_.joinable())
        accept_thread_.join();
    if (listen_fd_ >= 0)
    {
        ::close(listen_fd_);
        listen_fd_ = -1;
        if (bound_.kind == Endpoint::Kind::Unix)
            (void)::unlink(bound_.path.c_str());
    }
    // connection threads take conns_mu_ on their way out; join them unlocked
    std::list<std::shared_ptr<Conn>> conns;
    {
        std::lock_guard<std::mutex> lk(conns_mu_);
        for (auto &c : conns_)
        {
            if (c->fd >= 0)
                ::shutdown(c->fd, SHUT_RDWR);
        }
        conns.swap(conns_);
    }
    for (auto &c : conns)
    {
        if (c->th.joinable())
            c->th.join();
    }
}

void RelayServer::reap_locked()
{
    for (auto it = conns_.begin(); it != conns_.end();)
    {
        auto &c = *it;
        if (c->done.load())
        {
            if (c->th.joinable())
                c->th.join();
            it = conns_.erase(it);
        }
        else
            ++it;
    }
}

void RelayServer::accept_loop()
{
    while (!stopping_.load())
    {
        pollfd pfd{listen_fd_, POLLIN, 0};
        int    pr = poll(&pfd, 1, ACCEPT_POLL_MS);
        if (pr <= 0)
            continue;
        int fd = ::accept(listen_fd_, nullptr, nullptr);
        if (fd == -1)
        {
            if (errno != EINTR)
                LOG_WARN("accept() failed: %s", std::strerror(errno));
            continue;
        }
        set_cloexec(fd);

        auto c = std::make_shared<Conn>();
        c->fd  = fd;
        std::lock_guard<std::mutex> lk(conns_mu_);
        reap_locked();
        conns_.push_back(c);
        c->th = std::thread([this, c] {
            serve(*c);
            c->done.store(true);
        });
    }
}

void RelayServer::serve(Conn &c)
{
    const int fd = c.fd;
    for (;;)
    {
        std::uint8_t              tag = 0;
        std::vector<std::uint8_t> payload;
        if (!read_frame(fd, tag, payload))
            break;

        ferry::ByteReader r(payload);
        ferry::ByteWriter w;
        Errc              rc = Errc::protocol_error;
        std::string       id;
        const Op          op       = static_cast<Op>(tag);
        bool              attached = false;

        switch (op)
        {
            case Op::create_transfer:
            {
                model::Manifest m;
                if (r.get_str(id, ID_MAX) && get_manifest(r, m) && r.done())
                    rc = store_.create_transfer(id, m);
                break;
            }
            case Op::put_chunk:
            {
                std::uint32_t             index = 0;
                std::vector<std::uint8_t> bytes;
                if (r.get_str(id, ID_MAX) && r.get_u32(index) && r.get_blob(bytes) && r.done())
                    rc = store_.put_chunk(id, index, bytes);
                break;
            }
            case Op::get_chunk:
            {
                std::uint32_t  index = 0;
                relay::Fetched f;
                if (r.get_str(id, ID_MAX) && r.get_u32(index) && r.done())
                {
                    rc = store_.get_chunk(id, index, f);
                    if (rc == Errc::ok)
                    {
                        w.put_blob(f.bytes);
                        w.put_raw(f.hash.data(), f.hash.size());
                    }
                }
                break;
            }
            case Op::status:
            {
                relay::Status st;
                if (r.get_str(id, ID_MAX) && r.done())
                {
                    rc = store_.status(id, st);
                    if (rc == Errc::ok)
                        put_status(w, st);
                }
                break;
            }
            case Op::get_manifest:
            {
                model::Manifest m;
                if (r.get_str(id, ID_MAX) && r.done())
                {
                    rc = store_.get_manifest(id, m);
                    if (rc == Errc::ok)
                        put_manifest(w, m);
                }
                break;
            }
            case Op::delete_transfer:
                if (r.get_str(id, ID_MAX) && r.done())
                    rc = store_.delete_transfer(id);
                break;
            case Op::cleanup:
            {
                std::size_t purged = 0;
                if (r.done())
                {
                    rc = store_.cleanup(purged);
                    if (rc == Errc::ok)
                        w.put_u64(purged);
                }
                break;
            }
            case Op::pair_create:
            {
                model::Manifest   m;
                pairing::PairInfo info;
                if (r.get_str(id, ID_MAX) && get_manifest(r, m) && r.done())
                {
                    rc = registry_.create(m, id, info);
                    if (rc == Errc::ok)
                        put_pair_info(w, info);
                }
                break;
            }
            case Op::pair_lookup:
            {
                pairing::PairInfo info;
                if (r.get_str(id, 64) && r.done())
                {
                    rc = registry_.lookup(id, info);
                    if (rc == Errc::ok)
                        put_pair_info(w, info);
                }
                break;
            }
            case Op::pair_attach:
            {
                std::uint8_t                     role_byte = 0;
                std::shared_ptr<pairing::Room>    room;
                std::shared_ptr<pairing::Mailbox> box;
                if (r.get_str(id, 64) && r.get_u8(role_byte) && r.done() && role_byte <= 1)
                {
                    const auto role = static_cast<pairing::Role>(role_byte);
                    rc              = registry_.join(id, role, room, box);
                    if (!write_frame(fd, static_cast<std::uint8_t>(rc), {}))
                        rc = Errc::io_error;
                    if (rc == Errc::ok)
                        serve_attached(fd, role, id, std::move(room), std::move(box));
                    else if (box)
                        room->detach(role, box.get());
                    attached = true;
                }
                break;
            }
            case Op::signal:
                LOG_WARN("signal on a connection that is not attached");
                break;
            default:
                LOG_WARN("unknown op 0x%02x", tag);
                break;
        }
        if (attached)
            break;

        if (rc == Errc::protocol_error)
            LOG_DEBUG("%s: protocol_error", op_name(op));
        if (!write_frame(fd, static_cast<std::uint8_t>(rc), rc == Errc::ok ? w.bytes() : std::vector<std::uint8_t>{}))
            break;
    }

    std::lock_guard<std::mutex> lk(conns_mu_);
    ::close(c.fd);
    c.fd = -1;
}

void RelayServer::serve_attached(int                               fd,
                                 pairing::Role                     role,
                                 const std::string                &code,
                                 std::shared_ptr<pairing::Room>    room,
                                 std::shared_ptr<pairing::Mailbox> box)
{
    std::mutex        wmu;
    std::atomic<bool> leaving{false};

    std::thread writer([&] {
        pairing::Message m;
        while (!leaving.load())
        {
            if (!box->pop(m, PUSH_SLICE))
            {
                if (box->closed())
                    break;
                continue;
            }
            ferry::ByteWriter w;
            put_message(w, m);
            std::lock_guard<std::mutex> lk(wmu);
            if (!write_frame(fd, TAG_PUSH, w.bytes()))
                break;
        }
        // superseded, expired or broken: make the reader below return too
        if (!leaving.load())
            ::shutdown(fd, SHUT_RDWR);
    });

    for (;;)
    {
        std::uint8_t              tag = 0;
        std::vector<std::uint8_t> payload;
        if (!read_frame(fd, tag, payload))
            break;
        Errc rc = Errc::protocol_error;
        if (static_cast<Op>(tag) == Op::signal)
        {
            ferry::ByteReader r(payload);
            pairing::Message  m;
            if (get_message(r, m) && r.done())
                rc = room->send(role, std::move(m));
        }
        std::lock_guard<std::mutex> lk(wmu);
        if (!write_frame(fd, TAG_SIGNAL_ACK, {static_cast<std::uint8_t>(rc)}))
            break;
    }

    leaving.store(true);
    room->detach(role, box.get());
    box->close();
    writer.join();
    LOG_INFO("pair %s: %s detached", code.c_str(), pairing::role_name(role));
}

}  // namespace net
