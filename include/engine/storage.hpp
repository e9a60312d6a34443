#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "model/manifest.hpp"
#include "util/errors.hpp"

namespace engine
{

// Where the sender's bytes come from, addressed by manifest entry.
class ISource
{
  public:
    virtual ~ISource() = default;
    virtual ferry::Errc read(std::size_t                entry,
                             std::uint64_t              offset,
                             std::size_t                len,
                             std::vector<std::uint8_t> &out) = 0;
};

// Local-storage collaborator on the receiver. Writes arrive in offset order per
// entry, and entries in manifest order. prepare() may be called again by the
// relay path after a peer path gave up; it must keep what was written.
class ISink
{
  public:
    virtual ~ISink() = default;

    virtual ferry::Errc prepare(const model::Manifest &m) = 0;
    virtual ferry::Errc write(std::size_t         entry,
                              std::uint64_t       offset,
                              const std::uint8_t *data,
                              std::size_t         len)   = 0;
    virtual ferry::Errc finish_entry(std::size_t entry)  = 0;
    // Release open handles and buffers; partial output stays for a later resume.
    virtual void abort() = 0;

    // Bytes already present for `entry` from an earlier attempt, and a way to
    // read them back for verification. Sinks without resume report 0.
    virtual std::uint64_t durable_bytes(std::size_t /*entry*/) { return 0; }
    virtual bool          read_back(std::size_t /*entry*/,
                                    std::uint64_t /*offset*/,
                                    std::size_t /*len*/,
                                    std::vector<std::uint8_t> & /*out*/)
    {
        return false;
    }
};

// Reads entries from the source paths recorded by build_manifest().
class FileSource final : public ISource
{
  public:
    explicit FileSource(std::vector<std::string> paths);
    ~FileSource() override;

    ferry::Errc read(std::size_t                entry,
                     std::uint64_t              offset,
                     std::size_t                len,
                     std::vector<std::uint8_t> &out) override;

  private:
    std::vector<std::string> paths_;
    std::vector<int>         fds_;
};

// Writes each entry to <dest>/<relative_path>.
class FileSink final : public ISink
{
  public:
    explicit FileSink(std::string dest);
    ~FileSink() override;

    ferry::Errc prepare(const model::Manifest &m) override;
    ferry::Errc write(std::size_t entry, std::uint64_t offset, const std::uint8_t *data, std::size_t len) override;
    ferry::Errc finish_entry(std::size_t entry) override;
    void        abort() override;

    std::uint64_t durable_bytes(std::size_t entry) override;
    bool          read_back(std::size_t                entry,
                            std::uint64_t              offset,
                            std::size_t                len,
                            std::vector<std::uint8_t> &out) override;

    // Rejects empty, absolute and parent-escaping paths.
    static bool safe_relative(const std::string &rel);

  private:
    int         open_entry(std::size_t entry);
    void        close_all();
    std::string path_of(std::size_t entry) const;

    std::string                dest_;
    std::vector<std::string>   rel_;
    std::vector<std::uint64_t> sizes_;
    std::vector<int>           fds_;
};

}  // namespace engine
