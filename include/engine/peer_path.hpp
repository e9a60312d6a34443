#pragma once
#include "engine/options.hpp"
#include "engine/storage.hpp"
#include "model/manifest.hpp"
#include "transport/itransport.hpp"
#include "util/retry.hpp"

namespace engine
{

// Both run on a connected transport they start themselves; the caller stops
// it afterwards. Any error is fatal for the peer path (there is no piece
// re-send), so the caller falls back to the relay.

// MANIFEST, wait for READY, then each entry as FILE_START, DATA pieces of
// opt.piece_size, FILE_END, and finally COMPLETE. Waits up to opt.linger for
// the receiver to hang up after COMPLETE.
ferry::Errc peer_send(transport::ITransport &t,
                      const model::Manifest &m,
                      ISource               &src,
                      const EngineOptions   &opt,
                      ferry::CancelToken    &stop);

// Accepts the stream only for the manifest that was published under the pair
// code, prepares the sink, answers READY, then verifies and writes every
// piece in order until COMPLETE.
ferry::Errc peer_receive(transport::ITransport &t,
                         const model::Manifest &expected,
                         ISink                 &sink,
                         const EngineOptions   &opt,
                         ferry::CancelToken    &stop);

}  // namespace engine
