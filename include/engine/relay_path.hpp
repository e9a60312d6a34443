#pragma once
#include <string>

#include "engine/options.hpp"
#include "engine/storage.hpp"
#include "model/manifest.hpp"
#include "relay/chunk_store.hpp"
#include "util/retry.hpp"

namespace engine
{

// Upload every chunk in index order, one at a time. A chunk rejected by the
// store is re-read and re-sent within the retry budget. Returns ok once the
// store reports the transfer complete.
ferry::Errc relay_upload(relay::IRelayStore    &store,
                         const std::string     &transfer_id,
                         const model::Manifest &m,
                         ISource               &src,
                         const EngineOptions   &opt,
                         ferry::CancelToken    &stop);

// Download into `sink` with up to opt.max_parallel requests in flight, writing
// each entry strictly in index order. Leading chunks already present in the
// sink (and matching the manifest hashes when it has them) are skipped.
// Not-ready chunks are retried with backoff; exhausting the budget, or
// repeated integrity failures, yields chunk_unavailable. On a fatal error
// `stop` is cancelled so every worker winds down.
ferry::Errc relay_download(relay::IRelayStore    &store,
                           const std::string     &transfer_id,
                           const model::Manifest &m,
                           ISink                 &sink,
                           const EngineOptions   &opt,
                           ferry::CancelToken    &stop);

}  // namespace engine
