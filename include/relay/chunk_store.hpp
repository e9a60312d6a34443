#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "crypto/digest.hpp"
#include "model/manifest.hpp"
#include "util/clock.hpp"
#include "util/errors.hpp"

namespace relay
{

inline constexpr std::chrono::hours DEFAULT_RETENTION{24};

struct Status
{
    std::string                transfer_id;
    std::uint32_t              uploaded_chunks{0};
    std::uint32_t              total_chunks{0};
    bool                       complete{false};
    std::vector<std::uint32_t> available;  // ascending indices present

    double progress() const
    {
        return total_chunks ? 100.0 * uploaded_chunks / total_chunks : 100.0;
    }
};

struct Fetched
{
    std::vector<std::uint8_t> bytes;
    digest::Sha256            hash{};
};

// Relay operations as seen by an endpoint. Implemented in-process by RelayStore
// and over a socket by net::RemoteRelayStore.
class IRelayStore
{
  public:
    virtual ~IRelayStore() = default;

    virtual ferry::Errc create_transfer(const std::string &id, const model::Manifest &m) = 0;
    virtual ferry::Errc put_chunk(const std::string               &id,
                                  std::uint32_t                    index,
                                  const std::vector<std::uint8_t> &bytes)                = 0;
    virtual ferry::Errc get_chunk(const std::string &id, std::uint32_t index, Fetched &out) = 0;
    virtual ferry::Errc status(const std::string &id, Status &out)                        = 0;
    virtual ferry::Errc get_manifest(const std::string &id, model::Manifest &out)         = 0;
    virtual ferry::Errc delete_transfer(const std::string &id)                            = 0;
    virtual ferry::Errc cleanup(std::size_t &purged)                                      = 0;
};

// Size and hash of an uploaded chunk against the manifest. On ok `hash` holds
// the digest of `bytes`.
ferry::Errc check_chunk(const std::string               &id,
                        const model::Manifest           &m,
                        const model::ChunkIndex         &index,
                        std::uint32_t                    i,
                        const std::vector<std::uint8_t> &bytes,
                        digest::Sha256                  &hash);

// Valid ids are also used as directory names by DiskRelayStore.
bool valid_transfer_id(const std::string &id);

class RelayStore final : public IRelayStore
{
  public:
    explicit RelayStore(const ferry::Clock &clock,
                        std::chrono::seconds retention = DEFAULT_RETENTION);

    ferry::Errc create_transfer(const std::string &id, const model::Manifest &m) override;
    ferry::Errc put_chunk(const std::string               &id,
                          std::uint32_t                    index,
                          const std::vector<std::uint8_t> &bytes) override;
    ferry::Errc get_chunk(const std::string &id, std::uint32_t index, Fetched &out) override;
    ferry::Errc status(const std::string &id, Status &out) override;
    ferry::Errc get_manifest(const std::string &id, model::Manifest &out) override;
    ferry::Errc delete_transfer(const std::string &id) override;
    ferry::Errc cleanup(std::size_t &purged) override;

    // Drop every transfer older than the retention window, complete or not.
    std::size_t sweep();
    std::size_t size() const;

  private:
    // One lock per index: writers of the same index serialize, different
    // indices of the same transfer proceed independently.
    struct Slot
    {
        std::mutex                mu;
        bool                      present{false};
        std::vector<std::uint8_t> bytes;
        digest::Sha256            hash{};
    };

    struct Transfer
    {
        Transfer(const model::Manifest &m, ferry::TimePoint t)
            : manifest(m), index(m), created_at(t), slots(m.total_chunks())
        {
        }
        model::Manifest   manifest;
        model::ChunkIndex index;
        ferry::TimePoint  created_at;
        std::vector<Slot> slots;
        std::atomic<std::uint32_t> uploaded{0};
    };

    std::shared_ptr<Transfer> find(const std::string &id) const;

    const ferry::Clock  &clock_;
    std::chrono::seconds retention_;

    mutable std::mutex                                         mu_;
    std::unordered_map<std::string, std::shared_ptr<Transfer>> transfers_;
};

}  // namespace relay
