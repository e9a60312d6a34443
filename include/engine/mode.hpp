#pragma once
#include <atomic>
#include <cstdint>

namespace engine
{

enum class Mode : std::uint8_t
{
    probing,
    direct,  // local-network transport; no connector of that kind ships yet
    peer,
    relay,
    complete,
    failed,
    cancelled,
};

const char *mode_name(Mode m);
bool        is_terminal(Mode m);

// Commit-once latch shared by the negotiation, fallback and transfer threads
// of one endpoint. Every transition is a compare-and-set, so exactly one of
// two racing paths can win the commit.
class ModeLatch
{
  public:
    Mode get() const { return mode_.load(std::memory_order_acquire); }

    // probing -> direct|peer|relay. False if another path already committed.
    bool commit(Mode path);
    // peer -> relay, the single permitted re-commit.
    bool fallback_to_relay();
    // Active path -> complete|failed. False if `from` is no longer the mode.
    bool finish(Mode from, bool ok);
    // Any non-terminal -> cancelled / failed.
    bool cancel() { return end_as(Mode::cancelled); }
    bool fail() { return end_as(Mode::failed); }

  private:
    bool transition(Mode from, Mode to);
    bool end_as(Mode to);

    std::atomic<Mode> mode_{Mode::probing};
};

}  // namespace engine
