#include <cerrno>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "relay/disk_store.hpp"
#include "util/log.hpp"

namespace relay
{
namespace fs = std::filesystem;
using ferry::Errc;

namespace
{

constexpr const char *MANIFEST_FILE = "manifest.bin";
constexpr const char *CHUNK_DIR     = "chunks";

// Written to <path>.part and renamed into place.
bool write_file(const fs::path &path, const std::uint8_t *p, std::size_t n)
{
    const std::string tmp = path.string() + ".part";
    int               fd  = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        LOG_ERROR("open(%s) failed: %s", tmp.c_str(), std::strerror(errno));
        return false;
    }
    bool        ok   = true;
    std::size_t done = 0;
    while (done < n)
    {
        ssize_t w = ::write(fd, p + done, n - done);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("write(%s) failed: %s", tmp.c_str(), std::strerror(errno));
            ok = false;
            break;
        }
        done += static_cast<std::size_t>(w);
    }
    if (ok && ::fsync(fd) != 0)
    {
        LOG_ERROR("fsync(%s) failed: %s", tmp.c_str(), std::strerror(errno));
        ok = false;
    }
    ::close(fd);
    if (ok && ::rename(tmp.c_str(), path.c_str()) != 0)
    {
        LOG_ERROR("rename(%s) failed: %s", tmp.c_str(), std::strerror(errno));
        ok = false;
    }
    if (!ok)
        ::unlink(tmp.c_str());
    return ok;
}

bool read_file(const fs::path &path, std::vector<std::uint8_t> &out)
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
        return false;
    }
    struct stat st{};
    if (::fstat(fd, &st) != 0)
    {
        LOG_ERROR("fstat(%s) failed: %s", path.c_str(), std::strerror(errno));
        ::close(fd);
        return false;
    }
    out.resize(static_cast<std::size_t>(st.st_size));
    std::size_t got = 0;
    while (got < out.size())
    {
        ssize_t r = ::read(fd, out.data() + got, out.size() - got);
        if (r < 0 && errno == EINTR)
            continue;
        if (r <= 0)
        {
            LOG_ERROR("read(%s) failed: %s", path.c_str(), r == 0 ? "short file" : std::strerror(errno));
            ::close(fd);
            return false;
        }
        got += static_cast<std::size_t>(r);
    }
    ::close(fd);
    return true;
}

}  // namespace

DiskRelayStore::DiskRelayStore(fs::path root, const ferry::Clock &clock, std::chrono::seconds retention)
    : root_(std::move(root)), clock_(clock), retention_(retention)
{
}

fs::path DiskRelayStore::chunk_path(const Transfer &t, std::uint32_t index)
{
    char name[32];
    std::snprintf(name, sizeof(name), "chunk_%06" PRIu32, index);
    return t.dir / CHUNK_DIR / name;
}

bool DiskRelayStore::open()
{
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec)
    {
        LOG_ERROR("cannot create relay directory %s: %s", root_.c_str(), ec.message().c_str());
        return false;
    }

    std::unordered_map<std::string, std::shared_ptr<Transfer>> found;
    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec))
    {
        if (!it->is_directory(ec))
            continue;
        const std::string id = it->path().filename().string();
        if (!valid_transfer_id(id))
        {
            LOG_DEBUG("ignoring %s in the relay directory", it->path().c_str());
            continue;
        }
        if (auto t = load(id, it->path()))
            found.emplace(id, std::move(t));
    }
    if (ec)
    {
        LOG_ERROR("cannot list relay directory %s: %s", root_.c_str(), ec.message().c_str());
        return false;
    }

    std::lock_guard<std::mutex> lk(mu_);
    transfers_ = std::move(found);
    LOG_INFO("relay store at %s: %zu transfers", root_.c_str(), transfers_.size());
    return true;
}

std::shared_ptr<DiskRelayStore::Transfer> DiskRelayStore::load(const std::string &id, const fs::path &dir)
{
    std::vector<std::uint8_t> raw;
    const fs::path            mpath = dir / MANIFEST_FILE;
    if (!read_file(mpath, raw))
    {
        LOG_WARN("transfer %s: unreadable manifest, skipped", id.c_str());
        return nullptr;
    }
    auto m = model::decode(raw);
    if (!m || !model::validate(*m))
    {
        LOG_WARN("transfer %s: malformed manifest, skipped", id.c_str());
        return nullptr;
    }

    // age from the manifest mtime, rebased on the injected clock
    ferry::TimePoint created = clock_.now();
    std::error_code  ec;
    const auto       mtime = fs::last_write_time(mpath, ec);
    if (!ec)
    {
        auto age = fs::file_time_type::clock::now() - mtime;
        if (age > decltype(age)::zero())
            created -= std::chrono::duration_cast<ferry::SteadyClock::duration>(age);
    }

    auto t = std::make_shared<Transfer>(*m, dir, created);
    for (std::uint32_t i = 0; i < t->slots.size(); ++i)
    {
        const fs::path p    = chunk_path(*t, i);
        const auto     size = fs::file_size(p, ec);
        if (ec)
            continue;
        if (size != t->index.locate(i)->length)
        {
            LOG_WARN("transfer %s: chunk %u has %ju bytes, dropped", id.c_str(), i, static_cast<uintmax_t>(size));
            fs::remove(p, ec);
            continue;
        }
        t->slots[i].present = true;
        t->uploaded.fetch_add(1, std::memory_order_relaxed);
    }
    LOG_DEBUG("transfer %s loaded: %u/%u chunks", id.c_str(), t->uploaded.load(), m->total_chunks());
    return t;
}

std::shared_ptr<DiskRelayStore::Transfer> DiskRelayStore::find(const std::string &id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = transfers_.find(id);
    return it == transfers_.end() ? nullptr : it->second;
}

void DiskRelayStore::remove_dir(const fs::path &dir)
{
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG_WARN("cannot remove %s: %s", dir.c_str(), ec.message().c_str());
}

Errc DiskRelayStore::create_transfer(const std::string &id, const model::Manifest &m)
{
    if (!valid_transfer_id(id) || !model::validate(m))
    {
        LOG_WARN("create_transfer: rejected invalid manifest for '%s'", id.c_str());
        return Errc::protocol_error;
    }

    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = transfers_.find(id);
    if (it != transfers_.end())
    {
        if (it->second->manifest == m)
            return Errc::ok;
        LOG_WARN("create_transfer: '%s' already exists with a different manifest", id.c_str());
        return Errc::transfer_already_exists;
    }

    const fs::path  dir = root_ / id;
    std::error_code ec;
    fs::remove_all(dir, ec);  // leftovers of a transfer that failed to load
    fs::create_directories(dir / CHUNK_DIR, ec);
    if (ec)
    {
        LOG_ERROR("create_transfer %s: %s", id.c_str(), ec.message().c_str());
        return Errc::io_error;
    }
    const std::vector<std::uint8_t> raw = model::encode(m);
    if (!write_file(dir / MANIFEST_FILE, raw.data(), raw.size()))
    {
        remove_dir(dir);
        return Errc::io_error;
    }
    transfers_.emplace(id, std::make_shared<Transfer>(m, dir, clock_.now()));
    LOG_INFO("transfer %s created: %u chunks, %s", id.c_str(), m.total_chunks(),
             model::format_size(m.total_size).c_str());
    return Errc::ok;
}

Errc DiskRelayStore::put_chunk(const std::string &id, std::uint32_t index, const std::vector<std::uint8_t> &bytes)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;
    digest::Sha256 h{};
    if (Errc rc = check_chunk(id, t->manifest, t->index, index, bytes, h); rc != Errc::ok)
        return rc;

    Slot                       &s = t->slots[index];
    std::lock_guard<std::mutex> lk(s.mu);
    if (!write_file(chunk_path(*t, index), bytes.data(), bytes.size()))
        return Errc::io_error;
    if (!s.present)
    {
        s.present = true;
        t->uploaded.fetch_add(1, std::memory_order_acq_rel);
    }
    LOG_DEBUG("put_chunk %s#%u (%zu bytes)", id.c_str(), index, bytes.size());
    return Errc::ok;
}

Errc DiskRelayStore::get_chunk(const std::string &id, std::uint32_t index, Fetched &out)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;
    if (index >= t->slots.size())
        return Errc::chunk_index_out_of_range;

    Slot                       &s = t->slots[index];
    std::lock_guard<std::mutex> lk(s.mu);
    if (!s.present)
        return Errc::chunk_not_ready;
    if (!read_file(chunk_path(*t, index), out.bytes))
        return Errc::io_error;
    out.hash = digest::sha256(out.bytes);
    if (t->manifest.has_chunk_hashes() && t->manifest.chunk_hashes[index] != out.hash)
    {
        LOG_ERROR("get_chunk %s#%u: stored bytes no longer match the manifest", id.c_str(), index);
        return Errc::integrity_mismatch;
    }
    return Errc::ok;
}

Errc DiskRelayStore::status(const std::string &id, Status &out)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;

    out.transfer_id  = id;
    out.total_chunks = static_cast<std::uint32_t>(t->slots.size());
    out.available.clear();
    for (std::uint32_t i = 0; i < t->slots.size(); ++i)
    {
        std::lock_guard<std::mutex> lk(t->slots[i].mu);
        if (t->slots[i].present)
            out.available.push_back(i);
    }
    out.uploaded_chunks = t->uploaded.load(std::memory_order_acquire);
    out.complete        = out.uploaded_chunks == out.total_chunks;
    return Errc::ok;
}

Errc DiskRelayStore::get_manifest(const std::string &id, model::Manifest &out)
{
    auto t = find(id);
    if (!t)
        return Errc::transfer_not_found;
    out = t->manifest;
    return Errc::ok;
}

Errc DiskRelayStore::delete_transfer(const std::string &id)
{
    std::shared_ptr<Transfer> t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = transfers_.find(id);
        if (it == transfers_.end())
            return Errc::transfer_not_found;
        t = std::move(it->second);
        transfers_.erase(it);
    }
    remove_dir(t->dir);
    LOG_INFO("transfer %s deleted", id.c_str());
    return Errc::ok;
}

Errc DiskRelayStore::cleanup(std::size_t &purged)
{
    purged = sweep();
    return Errc::ok;
}

std::size_t DiskRelayStore::sweep()
{
    const ferry::TimePoint                 now = clock_.now();
    std::vector<std::shared_ptr<Transfer>> expired;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto it = transfers_.begin(); it != transfers_.end();)
        {
            if (now - it->second->created_at >= retention_)
            {
                LOG_INFO("transfer %s expired after retention window", it->first.c_str());
                expired.push_back(std::move(it->second));
                it = transfers_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }
    for (const auto &t : expired)
        remove_dir(t->dir);
    return expired.size();
}

std::size_t DiskRelayStore::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return transfers_.size();
}

}  // namespace relay
