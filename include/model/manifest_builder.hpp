#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/manifest.hpp"

namespace model
{

struct BuiltManifest
{
    Manifest                 manifest;
    std::vector<std::string> sources;  // local path of entry i
};

// One plain file => single-file; anything else => collection. Folders are walked
// recursively and their entries keep the folder name as the first path segment.
// With hash_chunks the builder reads every file once to fill chunk and file hashes.
std::optional<BuiltManifest> build_manifest(const std::vector<std::string> &paths,
                                            std::uint32_t                   chunk_size,
                                            bool                            hash_chunks = true);

}  // namespace model
