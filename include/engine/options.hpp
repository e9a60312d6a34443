#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "util/retry.hpp"

namespace engine
{

struct EngineOptions
{
    std::chrono::milliseconds fallback{5000};     // probing -> relay deadline
    std::chrono::milliseconds ack_timeout{60000};  // MANIFEST -> READY, and idle peer stream
    std::chrono::milliseconds linger{10000};       // relay sender waits this long for "done"
    std::size_t               piece_size = 64u << 10;
    unsigned                  max_parallel = 5;
    int                       max_integrity_failures = 3;
    ferry::RetryPolicy        retry;
};

// Logs a status line each time another tenth of the bytes has moved.
class ProgressMeter
{
  public:
    ProgressMeter(std::string what, std::uint64_t total) : what_(std::move(what)), total_(total) {}

    void add(std::uint64_t n);
    std::uint64_t done() const { return done_.load(); }

  private:
    std::string                what_;
    std::uint64_t              total_;
    std::atomic<std::uint64_t> done_{0};
    std::atomic<int>           decile_{0};
};

}  // namespace engine
