#pragma once
#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "relay/chunk_store.hpp"

namespace relay
{

/*
On-disk layout under the root directory, one directory per transfer:

  <root>/<transfer id>/manifest.bin          model::encode of the manifest
  <root>/<transfer id>/chunks/chunk_000042   raw bytes of global chunk 42

A chunk file appears by rename once fully written, so a present file is a
verified chunk. The manifest's modification time is the creation time used
for retention, which lets transfers survive a daemon restart.
*/
class DiskRelayStore final : public IRelayStore
{
  public:
    DiskRelayStore(std::filesystem::path root,
                   const ferry::Clock   &clock,
                   std::chrono::seconds  retention = DEFAULT_RETENTION);

    // Create the root and load the transfers already in it. False when the
    // root is unusable (already logged).
    bool open();

    ferry::Errc create_transfer(const std::string &id, const model::Manifest &m) override;
    ferry::Errc put_chunk(const std::string               &id,
                          std::uint32_t                    index,
                          const std::vector<std::uint8_t> &bytes) override;
    ferry::Errc get_chunk(const std::string &id, std::uint32_t index, Fetched &out) override;
    ferry::Errc status(const std::string &id, Status &out) override;
    ferry::Errc get_manifest(const std::string &id, model::Manifest &out) override;
    ferry::Errc delete_transfer(const std::string &id) override;
    ferry::Errc cleanup(std::size_t &purged) override;

    std::size_t sweep();
    std::size_t size() const;

    const std::filesystem::path &root() const { return root_; }

  private:
    struct Slot
    {
        std::mutex mu;
        bool       present{false};
    };

    struct Transfer
    {
        Transfer(const model::Manifest &m, std::filesystem::path d, ferry::TimePoint t)
            : manifest(m), index(m), dir(std::move(d)), created_at(t), slots(m.total_chunks())
        {
        }
        model::Manifest            manifest;
        model::ChunkIndex          index;
        std::filesystem::path      dir;
        ferry::TimePoint           created_at;
        std::vector<Slot>          slots;
        std::atomic<std::uint32_t> uploaded{0};
    };

    std::shared_ptr<Transfer> find(const std::string &id) const;
    std::shared_ptr<Transfer> load(const std::string &id, const std::filesystem::path &dir);
    void                      remove_dir(const std::filesystem::path &dir);

    static std::filesystem::path chunk_path(const Transfer &t, std::uint32_t index);

    std::filesystem::path root_;
    const ferry::Clock   &clock_;
    std::chrono::seconds  retention_;

    mutable std::mutex                                         mu_;
    std::unordered_map<std::string, std::shared_ptr<Transfer>> transfers_;
};

}  // namespace relay
