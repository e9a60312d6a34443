#include <algorithm>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "engine/peer_path.hpp"
#include "proto/stream.hpp"
#include "util/log.hpp"

namespace engine
{
using ferry::Errc;
using Clock = std::chrono::steady_clock;

namespace
{

constexpr std::chrono::milliseconds WAKE_SLICE{50};
constexpr std::size_t               PEER_MAX_FRAME = 72u << 20;
constexpr std::size_t               INBOX_LIMIT    = 64;

// Frames handed over by the transport's receive callback. Shared with the
// callback so a late delivery after the path returned is harmless.
struct Inbox
{
    std::mutex                          mu;
    std::condition_variable             cv;
    std::deque<transport::Frame>        q;
    bool                                closed{false};

    void push(const transport::Frame &f)
    {
        std::unique_lock<std::mutex> lk(mu);
        // blocking here pushes back on the transport's reader
        cv.wait(lk, [&] { return closed || q.size() < INBOX_LIMIT; });
        if (closed)
            return;
        q.push_back(f);
        cv.notify_all();
    }

    bool pop(transport::Frame &out, std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lk(mu);
        if (!cv.wait_for(lk, timeout, [&] { return closed || !q.empty(); }) || q.empty())
            return false;
        out = std::move(q.front());
        q.pop_front();
        cv.notify_all();
        return true;
    }

    void close()
    {
        std::lock_guard<std::mutex> lk(mu);
        closed = true;
        q.clear();
        cv.notify_all();
    }
};

// Closes the inbox on every return path.
struct InboxGuard
{
    std::shared_ptr<Inbox> in;
    ~InboxGuard() { in->close(); }
};

// Hashes an entry's bytes as they arrive and holds them against the published
// chunk hashes and whole-file hash. The sender's per-piece hash only covers
// transport damage.
class EntryVerifier
{
  public:
    explicit EntryVerifier(const model::Manifest &m) : m_(m), idx_(m) {}

    void begin(std::size_t entry)
    {
        entry_ = entry;
        local_ = 0;
        fill_  = 0;
        whole_.emplace();
        chunk_.emplace();
    }

    // False once a completed chunk disagrees with the manifest.
    bool feed(const std::uint8_t *p, std::size_t n)
    {
        whole_->update(p, n);
        if (!m_.has_chunk_hashes())
            return true;
        const std::uint64_t size = m_.entries[entry_].size;
        const std::uint64_t cs   = m_.chunk_size;
        while (n > 0)
        {
            const std::uint64_t len  = std::min<std::uint64_t>(cs, size - local_ * cs);
            const std::size_t   take = static_cast<std::size_t>(std::min<std::uint64_t>(n, len - fill_));
            chunk_->update(p, take);
            fill_ += take;
            p += take;
            n -= take;
            if (fill_ < len)
                continue;
            auto g = idx_.global(entry_, local_);
            if (!g || chunk_->finish() != m_.chunk_hashes[*g])
            {
                LOG_WARN("entry %zu chunk %u differs from the manifest", entry_, local_);
                return false;
            }
            ++local_;
            fill_ = 0;
            chunk_.emplace();
        }
        return true;
    }

    bool finish()
    {
        const model::Entry &e = m_.entries[entry_];
        if (!e.has_file_hash)
            return true;
        return whole_->finish() == e.file_hash;
    }

  private:
    const model::Manifest              &m_;
    model::ChunkIndex                   idx_;
    std::size_t                         entry_{0};
    std::uint32_t                       local_{0};
    std::uint64_t                       fill_{0};
    std::optional<digest::Sha256Stream> whole_;
    std::optional<digest::Sha256Stream> chunk_;
};

transport::Settings settings_for(const char *role)
{
    transport::Settings s;
    s.role      = role;
    s.max_frame = PEER_MAX_FRAME;
    return s;
}

}  // namespace

Errc peer_send(transport::ITransport &t,
               const model::Manifest &m,
               ISource               &src,
               const EngineOptions   &opt,
               ferry::CancelToken    &stop)
{
    auto       inbox = std::make_shared<Inbox>();
    InboxGuard guard{inbox};
    if (!t.start(settings_for("sender"), [inbox](const transport::Frame &f) { inbox->push(f); }))
        return Errc::peer_disconnected;

    bool        peer_cancelled = false;
    std::string cancel_reason;
    // Drain control frames from the receiver. Returns true once READY was seen.
    auto drain = [&](std::chrono::milliseconds wait) {
        transport::Frame raw;
        bool             ready = false;
        while (inbox->pop(raw, wait))
        {
            wait   = std::chrono::milliseconds(0);
            auto f = proto::parse(raw);
            if (!f)
                continue;
            if (f->type == proto::FrameType::Ready)
                ready = true;
            else if (f->type == proto::FrameType::Cancel)
            {
                peer_cancelled = true;
                cancel_reason  = f->reason;
            }
        }
        return ready;
    };

    if (!t.send(proto::encode_manifest(m)))
        return Errc::peer_disconnected;

    const auto ack_deadline = Clock::now() + opt.ack_timeout;
    for (;;)
    {
        if (drain(WAKE_SLICE))
            break;
        if (stop.cancelled())
            return Errc::cancelled;
        if (peer_cancelled)
        {
            LOG_WARN("receiver declined the stream: %s", cancel_reason.c_str());
            return Errc::peer_disconnected;
        }
        if (!t.link_ready())
            return Errc::peer_disconnected;
        if (Clock::now() >= ack_deadline)
        {
            LOG_WARN("no READY within %lld ms", static_cast<long long>(opt.ack_timeout.count()));
            return Errc::handshake_timeout;
        }
    }
    LOG_DEBUG("receiver ready, streaming %zu entries", m.entries.size());

    ProgressMeter             meter("peer send", m.total_size);
    std::vector<std::uint8_t> buf;
    const std::size_t         piece = opt.piece_size ? opt.piece_size : (64u << 10);
    for (std::size_t e = 0; e < m.entries.size(); ++e)
    {
        const model::Entry &ent = m.entries[e];
        if (!t.send(proto::encode_file_start(static_cast<std::uint32_t>(e), ent.relative_path, ent.size)))
            return Errc::peer_disconnected;

        for (std::uint64_t off = 0; off < ent.size; off += piece)
        {
            if (stop.cancelled())
            {
                (void)t.send(proto::encode_cancel("cancelled"));
                return Errc::cancelled;
            }
            drain(std::chrono::milliseconds(0));
            if (peer_cancelled)
            {
                LOG_WARN("receiver aborted the stream: %s", cancel_reason.c_str());
                return Errc::peer_disconnected;
            }
            const std::size_t n  = static_cast<std::size_t>(std::min<std::uint64_t>(piece, ent.size - off));
            Errc              rc = src.read(e, off, n, buf);
            if (rc != Errc::ok)
            {
                (void)t.send(proto::encode_cancel("source read failed"));
                return rc;
            }
            if (!t.send(proto::encode_data(static_cast<std::uint32_t>(e), off, buf.data(), n)))
                return Errc::peer_disconnected;
            meter.add(n);
        }
        if (!t.send(proto::encode_file_end(static_cast<std::uint32_t>(e))))
            return Errc::peer_disconnected;
    }
    if (!t.send(proto::encode_complete()))
        return Errc::peer_disconnected;

    // the receiver hangs up once everything is on disk
    const auto linger_deadline = Clock::now() + opt.linger;
    while (t.link_ready() && Clock::now() < linger_deadline && !stop.cancelled())
    {
        drain(WAKE_SLICE);
        if (peer_cancelled)
        {
            LOG_WARN("receiver failed after COMPLETE: %s", cancel_reason.c_str());
            return Errc::peer_disconnected;
        }
    }
    // a CANCEL may have landed just before the link went down
    drain(std::chrono::milliseconds(0));
    if (peer_cancelled)
    {
        LOG_WARN("receiver failed after COMPLETE: %s", cancel_reason.c_str());
        return Errc::peer_disconnected;
    }
    return Errc::ok;
}

Errc peer_receive(transport::ITransport &t,
                  const model::Manifest &expected,
                  ISink                 &sink,
                  const EngineOptions   &opt,
                  ferry::CancelToken    &stop)
{
    auto       inbox = std::make_shared<Inbox>();
    InboxGuard guard{inbox};
    if (!t.start(settings_for("receiver"), [inbox](const transport::Frame &f) { inbox->push(f); }))
        return Errc::peer_disconnected;

    auto abort_with = [&](Errc e, const char *why) {
        LOG_WARN("peer stream aborted: %s (%s)", why, ferry::errc_name(e));
        (void)t.send(proto::encode_cancel(why));
        return e;
    };

    ProgressMeter    meter("peer receive", expected.total_size);
    EntryVerifier    verify(expected);
    bool             have_manifest = false;
    std::size_t      next_entry    = 0;
    bool             in_entry      = false;
    std::uint64_t    offset        = 0;
    auto             idle_deadline = Clock::now() + opt.ack_timeout;
    transport::Frame raw;

    for (;;)
    {
        if (stop.cancelled())
        {
            (void)t.send(proto::encode_cancel("cancelled"));
            return Errc::cancelled;
        }
        if (!inbox->pop(raw, WAKE_SLICE))
        {
            if (!t.link_ready())
                return Errc::peer_disconnected;
            if (Clock::now() >= idle_deadline)
                return abort_with(have_manifest ? Errc::peer_disconnected : Errc::handshake_timeout, "stream stalled");
            continue;
        }
        idle_deadline = Clock::now() + opt.ack_timeout;

        auto f = proto::parse(raw);
        if (!f)
            return abort_with(Errc::protocol_error, "malformed frame");

        switch (f->type)
        {
            case proto::FrameType::Manifest:
            {
                if (have_manifest)
                    return abort_with(Errc::protocol_error, "duplicate manifest");
                if (f->manifest != expected)
                    return abort_with(Errc::protocol_error, "manifest differs from the published one");
                Errc rc = sink.prepare(expected);
                if (rc != Errc::ok)
                    return abort_with(rc, "destination not writable");
                have_manifest = true;
                if (!t.send(proto::encode_ready()))
                    return Errc::peer_disconnected;
                break;
            }
            case proto::FrameType::FileStart:
            {
                if (!have_manifest || in_entry || f->entry != next_entry || next_entry >= expected.entries.size())
                    return abort_with(Errc::protocol_error, "unexpected FILE_START");
                const model::Entry &ent = expected.entries[next_entry];
                if (f->path != ent.relative_path || f->size != ent.size)
                    return abort_with(Errc::protocol_error, "FILE_START disagrees with manifest");
                in_entry = true;
                offset   = 0;
                verify.begin(next_entry);
                break;
            }
            case proto::FrameType::Data:
            {
                if (!in_entry || f->entry != next_entry || f->offset != offset)
                    return abort_with(Errc::protocol_error, "out-of-order DATA");
                if (f->offset + f->data.size() > expected.entries[next_entry].size)
                    return abort_with(Errc::protocol_error, "DATA past end of entry");
                if (digest::sha256(f->data) != f->hash)
                    return abort_with(Errc::integrity_mismatch, "piece hash mismatch");
                if (!verify.feed(f->data.data(), f->data.size()))
                    return abort_with(Errc::integrity_mismatch, "bytes differ from the published manifest");
                Errc rc = sink.write(next_entry, f->offset, f->data.data(), f->data.size());
                if (rc != Errc::ok)
                    return abort_with(rc, "write failed");
                offset += f->data.size();
                meter.add(f->data.size());
                break;
            }
            case proto::FrameType::FileEnd:
            {
                if (!in_entry || f->entry != next_entry || offset != expected.entries[next_entry].size)
                    return abort_with(Errc::protocol_error, "unexpected FILE_END");
                if (!verify.finish())
                    return abort_with(Errc::integrity_mismatch, "file hash differs from the manifest");
                Errc rc = sink.finish_entry(next_entry);
                if (rc != Errc::ok)
                    return abort_with(rc, "finish failed");
                in_entry = false;
                ++next_entry;
                break;
            }
            case proto::FrameType::Complete:
                if (!have_manifest || in_entry || next_entry != expected.entries.size())
                    return abort_with(Errc::protocol_error, "premature COMPLETE");
                return Errc::ok;
            case proto::FrameType::Cancel:
                LOG_WARN("sender aborted the stream: %s", f->reason.c_str());
                return Errc::peer_disconnected;
            case proto::FrameType::Ready:
                return abort_with(Errc::protocol_error, "unexpected READY");
        }
    }
}

}  // namespace engine
