#include <algorithm>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

#include "engine/relay_path.hpp"
#include "util/log.hpp"

namespace engine
{
using ferry::Errc;

namespace
{

constexpr std::chrono::milliseconds WAKE_SLICE{100};

// Leading chunks of `entry` the sink already holds from an earlier attempt.
// Without manifest hashes nothing is trusted.
std::uint32_t resumable_chunks(ISink &sink, const model::Manifest &m, const model::ChunkIndex &idx, std::size_t entry)
{
    if (!m.has_chunk_hashes())
        return 0;
    const std::uint64_t have = sink.durable_bytes(entry);
    if (have == 0)
        return 0;

    const std::uint32_t first = idx.first_of(entry);
    const std::uint32_t n     = idx.count_of(entry);
    std::uint32_t       k     = 0;
    for (; k < n; ++k)
    {
        auto ref = idx.locate(first + k);
        if (!ref || ref->offset + ref->length > have)
            break;
        std::vector<std::uint8_t> buf;
        if (!sink.read_back(entry, ref->offset, ref->length, buf) || digest::sha256(buf) != m.chunk_hashes[first + k])
            break;
    }
    return k;
}

Errc fetch_chunk(relay::IRelayStore          &store,
                 const std::string           &id,
                 const model::Manifest       &m,
                 const model::ChunkIndex     &idx,
                 std::uint32_t                g,
                 const EngineOptions         &opt,
                 ferry::CancelToken          &stop,
                 std::vector<std::uint8_t>   &out)
{
    auto ref = idx.locate(g);
    if (!ref)
        return Errc::chunk_index_out_of_range;

    int  mismatches = 0;
    Errc rc         = ferry::retry_with_backoff(opt.retry, &stop, [&]() {
        relay::Fetched f;
        Errc           r = store.get_chunk(id, g, f);
        if (r != Errc::ok)
        {
            if (r == Errc::chunk_not_ready)
                LOG_DEBUG("chunk %u not ready yet", g);
            return r;
        }
        const digest::Sha256  h    = digest::sha256(f.bytes);
        const digest::Sha256 &want = m.has_chunk_hashes() ? m.chunk_hashes[g] : f.hash;
        if (f.bytes.size() != ref->length || h != want)
        {
            ++mismatches;
            LOG_WARN("chunk %u failed verification (%d/%d)", g, mismatches, opt.max_integrity_failures);
            return mismatches >= opt.max_integrity_failures ? Errc::chunk_unavailable : Errc::integrity_mismatch;
        }
        out = std::move(f.bytes);
        return Errc::ok;
    });
    if (rc == Errc::chunk_not_ready || rc == Errc::integrity_mismatch)
        rc = Errc::chunk_unavailable;
    return rc;
}

}  // namespace

Errc relay_upload(relay::IRelayStore    &store,
                  const std::string     &transfer_id,
                  const model::Manifest &m,
                  ISource               &src,
                  const EngineOptions   &opt,
                  ferry::CancelToken    &stop)
{
    model::ChunkIndex idx(m);
    ProgressMeter     meter("relay upload", m.total_size);

    for (std::uint32_t g = 0; g < idx.total(); ++g)
    {
        if (stop.cancelled())
            return Errc::cancelled;
        auto ref = idx.locate(g);
        if (!ref)
            return Errc::chunk_index_out_of_range;

        std::vector<std::uint8_t> buf;
        int                       attempts = 0;
        Errc                      rc       = ferry::retry_with_backoff(
            opt.retry, &stop,
            [&]() {
                Errc r = src.read(ref->entry, ref->offset, ref->length, buf);
                if (r != Errc::ok)
                    return r;
                return store.put_chunk(transfer_id, g, buf);
            },
            &attempts);
        if (rc != Errc::ok)
        {
            LOG_ERROR("upload of chunk %u failed after %d attempt(s): %s", g, attempts, ferry::errc_name(rc));
            return rc;
        }
        if (attempts > 1)
            LOG_DEBUG("chunk %u uploaded after %d attempts", g, attempts);
        meter.add(ref->length);
    }

    relay::Status st;
    Errc          rc = store.status(transfer_id, st);
    if (rc != Errc::ok)
        return rc;
    if (!st.complete)
    {
        LOG_ERROR("relay reports %u/%u chunks after upload", st.uploaded_chunks, st.total_chunks);
        return Errc::protocol_error;
    }
    return Errc::ok;
}

Errc relay_download(relay::IRelayStore    &store,
                    const std::string     &transfer_id,
                    const model::Manifest &m,
                    ISink                 &sink,
                    const EngineOptions   &opt,
                    ferry::CancelToken    &stop)
{
    Errc rc = sink.prepare(m);
    if (rc != Errc::ok)
        return rc;

    model::ChunkIndex          idx(m);
    ProgressMeter              meter("relay download", m.total_size);
    std::vector<std::uint32_t> skip(idx.entries(), 0);
    std::vector<std::uint32_t> plan;  // global indices still to fetch, in write order
    std::uint64_t              resumed = 0;
    for (std::size_t e = 0; e < idx.entries(); ++e)
    {
        skip[e] = resumable_chunks(sink, m, idx, e);
        for (std::uint32_t k = 0; k < idx.count_of(e); ++k)
        {
            if (k < skip[e])
                resumed += idx.locate(idx.first_of(e) + k)->length;
            else
                plan.push_back(idx.first_of(e) + k);
        }
    }
    if (resumed > 0)
    {
        LOG_SYSTEM("resuming: %s already present", model::format_size(resumed).c_str());
        meter.add(resumed);
    }

    if (!plan.empty())
    {
        // don't race ahead of a sender that has not started uploading
        rc = ferry::retry_with_backoff(opt.retry, &stop, [&]() {
            relay::Status st;
            Errc          r = store.status(transfer_id, st);
            if (r != Errc::ok)
                return r;
            return st.uploaded_chunks > 0 || st.complete ? Errc::ok : Errc::chunk_not_ready;
        });
        if (rc == Errc::chunk_not_ready)
            rc = Errc::chunk_unavailable;
        if (rc != Errc::ok)
        {
            LOG_WARN("relay transfer %s never started: %s", transfer_id.c_str(), ferry::errc_name(rc));
            return rc;
        }
    }

    std::mutex                                          mu;
    std::condition_variable                             cv;
    std::map<std::size_t, std::vector<std::uint8_t>>    ready;  // plan position -> verified bytes
    std::size_t                                         next_claim = 0;
    std::size_t                                         consumed   = 0;
    Errc                                                fatal      = Errc::ok;
    const std::size_t window = std::max<std::size_t>(1, opt.max_parallel) * 2;

    auto worker = [&]() {
        for (;;)
        {
            std::size_t pos = 0;
            {
                std::unique_lock<std::mutex> lk(mu);
                while (fatal == Errc::ok && !stop.cancelled() && next_claim < plan.size() &&
                       next_claim >= consumed + window)
                    cv.wait_for(lk, WAKE_SLICE);
                if (fatal != Errc::ok || stop.cancelled() || next_claim >= plan.size())
                    return;
                pos = next_claim++;
            }
            std::vector<std::uint8_t> bytes;
            Errc r = fetch_chunk(store, transfer_id, m, idx, plan[pos], opt, stop, bytes);
            {
                std::lock_guard<std::mutex> lk(mu);
                if (r == Errc::ok)
                    ready.emplace(pos, std::move(bytes));
                else if (fatal == Errc::ok)
                    fatal = r;
            }
            if (r != Errc::ok)
            {
                LOG_WARN("chunk %u: %s", plan[pos], ferry::errc_name(r));
                stop.cancel();
            }
            cv.notify_all();
        }
    };

    std::vector<std::thread> workers;
    const unsigned           nworkers = std::max(1u, std::min<unsigned>(opt.max_parallel, plan.size()));
    if (!plan.empty())
    {
        for (unsigned i = 0; i < nworkers; ++i)
            workers.emplace_back(worker);
    }

    auto fail = [&](Errc e) {
        {
            std::lock_guard<std::mutex> lk(mu);
            if (fatal == Errc::ok)
                fatal = e;
        }
        stop.cancel();
        cv.notify_all();
    };

    auto halted = [&]() {
        std::lock_guard<std::mutex> lk(mu);
        return fatal != Errc::ok || stop.cancelled();
    };

    std::size_t pos = 0;
    for (std::size_t e = 0; e < idx.entries() && !halted(); ++e)
    {
        for (std::uint32_t k = skip[e]; k < idx.count_of(e); ++k, ++pos)
        {
            std::vector<std::uint8_t> bytes;
            {
                std::unique_lock<std::mutex> lk(mu);
                while (fatal == Errc::ok && !stop.cancelled() && ready.find(pos) == ready.end())
                    cv.wait_for(lk, WAKE_SLICE);
                auto it = ready.find(pos);
                if (it == ready.end())
                    break;
                bytes = std::move(it->second);
                ready.erase(it);
                ++consumed;
            }
            cv.notify_all();

            auto ref = idx.locate(plan[pos]);
            Errc w   = sink.write(e, ref->offset, bytes.data(), bytes.size());
            if (w != Errc::ok)
            {
                fail(w);
                break;
            }
            meter.add(bytes.size());
        }
        if (halted())
            break;
        Errc f = sink.finish_entry(e);
        if (f != Errc::ok)
            fail(f);
    }

    for (auto &t : workers)
        t.join();

    if (fatal != Errc::ok)
        return fatal;
    if (stop.cancelled())
        return Errc::cancelled;
    return Errc::ok;
}

}  // namespace engine
