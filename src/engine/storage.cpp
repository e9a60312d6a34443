#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

#include "engine/storage.hpp"
#include "util/log.hpp"

namespace engine
{
namespace fs = std::filesystem;
using ferry::Errc;

// ---------------- FileSource ----------------

FileSource::FileSource(std::vector<std::string> paths) : paths_(std::move(paths)), fds_(paths_.size(), -1) {}

FileSource::~FileSource()
{
    for (int fd : fds_)
        if (fd >= 0)
            ::close(fd);
}

Errc FileSource::read(std::size_t entry, std::uint64_t offset, std::size_t len, std::vector<std::uint8_t> &out)
{
    if (entry >= paths_.size())
        return Errc::protocol_error;
    if (fds_[entry] < 0)
    {
        fds_[entry] = ::open(paths_[entry].c_str(), O_RDONLY | O_CLOEXEC);
        if (fds_[entry] < 0)
        {
            LOG_ERROR("open(%s) failed: %s", paths_[entry].c_str(), std::strerror(errno));
            return Errc::io_error;
        }
    }
    out.resize(len);
    std::size_t got = 0;
    while (got < len)
    {
        ssize_t r = ::pread(fds_[entry], out.data() + got, len - got, static_cast<off_t>(offset + got));
        if (r < 0 && errno == EINTR)
            continue;
        if (r <= 0)
        {
            LOG_ERROR("read %s @%llu failed: %s", paths_[entry].c_str(),
                      static_cast<unsigned long long>(offset + got), r == 0 ? "short file" : std::strerror(errno));
            return Errc::io_error;
        }
        got += static_cast<std::size_t>(r);
    }
    return Errc::ok;
}

// ---------------- FileSink ----------------

FileSink::FileSink(std::string dest) : dest_(std::move(dest)) {}

FileSink::~FileSink()
{
    close_all();
}

bool FileSink::safe_relative(const std::string &rel)
{
    if (rel.empty())
        return false;
    fs::path p(rel);
    if (p.is_absolute() || p.has_root_name() || p.has_root_directory())
        return false;
    for (const auto &part : p)
    {
        if (part == "..")
            return false;
    }
    return true;
}

std::string FileSink::path_of(std::size_t entry) const
{
    return (fs::path(dest_) / rel_[entry]).string();
}

Errc FileSink::prepare(const model::Manifest &m)
{
    for (const auto &e : m.entries)
    {
        if (!safe_relative(e.relative_path))
        {
            LOG_ERROR("refusing unsafe path '%s'", e.relative_path.c_str());
            return Errc::protocol_error;
        }
    }
    if (!rel_.empty())
        return Errc::ok;  // already prepared by an earlier path

    rel_.clear();
    sizes_.clear();
    for (const auto &e : m.entries)
    {
        rel_.push_back(e.relative_path);
        sizes_.push_back(e.size);
    }
    fds_.assign(rel_.size(), -1);

    std::error_code ec;
    fs::create_directories(dest_, ec);
    if (ec)
    {
        LOG_ERROR("create_directories(%s) failed: %s", dest_.c_str(), ec.message().c_str());
        return Errc::io_error;
    }
    LOG_DEBUG("sink ready: %zu entries under %s", rel_.size(), dest_.c_str());
    return Errc::ok;
}

int FileSink::open_entry(std::size_t entry)
{
    if (fds_[entry] >= 0)
        return fds_[entry];
    const std::string path = path_of(entry);
    std::error_code   ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec)
    {
        LOG_ERROR("create_directories for %s failed: %s", path.c_str(), ec.message().c_str());
        return -1;
    }
    // no O_TRUNC: bytes from an earlier attempt are reused by resume
    fds_[entry] = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fds_[entry] < 0)
        LOG_ERROR("open(%s) failed: %s", path.c_str(), std::strerror(errno));
    return fds_[entry];
}

Errc FileSink::write(std::size_t entry, std::uint64_t offset, const std::uint8_t *data, std::size_t len)
{
    if (entry >= rel_.size())
        return Errc::protocol_error;
    if (offset + len > sizes_[entry])
    {
        LOG_WARN("write past end of %s", rel_[entry].c_str());
        return Errc::protocol_error;
    }
    int fd = open_entry(entry);
    if (fd < 0)
        return Errc::io_error;
    std::size_t done = 0;
    while (done < len)
    {
        ssize_t w = ::pwrite(fd, data + done, len - done, static_cast<off_t>(offset + done));
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("pwrite(%s) failed: %s", rel_[entry].c_str(), std::strerror(errno));
            return Errc::io_error;
        }
        done += static_cast<std::size_t>(w);
    }
    return Errc::ok;
}

Errc FileSink::finish_entry(std::size_t entry)
{
    if (entry >= rel_.size())
        return Errc::protocol_error;
    int fd = open_entry(entry);  // creates zero-length entries too
    if (fd < 0)
        return Errc::io_error;
    if (::ftruncate(fd, static_cast<off_t>(sizes_[entry])) != 0)
    {
        LOG_ERROR("ftruncate(%s) failed: %s", rel_[entry].c_str(), std::strerror(errno));
        return Errc::io_error;
    }
    ::close(fd);
    fds_[entry] = -1;
    LOG_DEBUG("wrote %s (%s)", rel_[entry].c_str(), model::format_size(sizes_[entry]).c_str());
    return Errc::ok;
}

void FileSink::close_all()
{
    for (int &fd : fds_)
    {
        if (fd >= 0)
            ::close(fd);
        fd = -1;
    }
}

void FileSink::abort()
{
    close_all();
}

std::uint64_t FileSink::durable_bytes(std::size_t entry)
{
    if (entry >= rel_.size())
        return 0;
    struct stat st{};
    if (::stat(path_of(entry).c_str(), &st) != 0 || !S_ISREG(st.st_mode))
        return 0;
    return static_cast<std::uint64_t>(st.st_size);
}

bool FileSink::read_back(std::size_t entry, std::uint64_t offset, std::size_t len, std::vector<std::uint8_t> &out)
{
    if (entry >= rel_.size())
        return false;
    FileSource src({path_of(entry)});
    return src.read(0, offset, len, out) == Errc::ok;
}

}  // namespace engine
