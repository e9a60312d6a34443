#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>

#include "model/manifest_builder.hpp"
#include "util/log.hpp"

namespace model
{
namespace fs = std::filesystem;

namespace
{

struct Pending
{
    std::string rel;
    fs::path    path;
};

bool collect(const fs::path &root, std::vector<Pending> &out)
{
    std::error_code ec;
    if (fs::is_regular_file(root, ec))
    {
        out.push_back({root.filename().string(), root});
        return true;
    }
    if (!fs::is_directory(root, ec))
    {
        LOG_ERROR("not a file or folder: %s", root.string().c_str());
        return false;
    }

    std::vector<Pending> found;
    const fs::path       base = root.filename().empty() ? root.parent_path().filename()
                                                        : root.filename();
    for (fs::recursive_directory_iterator it(root, ec), end; it != end; it.increment(ec))
    {
        if (ec)
        {
            LOG_ERROR("walk %s failed: %s", root.string().c_str(), ec.message().c_str());
            return false;
        }
        if (!it->is_regular_file(ec))
            continue;
        fs::path rel = base / fs::relative(it->path(), root, ec);
        found.push_back({rel.generic_string(), it->path()});
    }
    // directory iteration order is unspecified; the chunk index space must not be
    std::sort(found.begin(), found.end(),
              [](const Pending &a, const Pending &b) { return a.rel < b.rel; });
    out.insert(out.end(), found.begin(), found.end());
    return true;
}

bool hash_file(const fs::path &p,
               std::uint64_t   expect_size,
               std::uint32_t   chunk_size,
               Entry          &e,
               Manifest       &m)
{
    std::ifstream in(p, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("open %s failed", p.string().c_str());
        return false;
    }
    std::vector<std::uint8_t> buf(chunk_size);
    digest::Sha256Stream      whole;
    std::uint64_t             seen = 0;
    while (in)
    {
        in.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(buf.size()));
        const std::size_t got = static_cast<std::size_t>(in.gcount());
        if (got == 0)
            break;
        m.chunk_hashes.push_back(digest::sha256(buf.data(), got));
        whole.update(buf.data(), got);
        seen += got;
    }
    if (seen != expect_size)
    {
        LOG_ERROR("%s changed while hashing (%llu != %llu)", p.string().c_str(),
                  (unsigned long long)seen, (unsigned long long)expect_size);
        return false;
    }
    e.file_hash     = whole.finish();
    e.has_file_hash = true;
    return true;
}

}  // namespace

std::optional<BuiltManifest> build_manifest(const std::vector<std::string> &paths,
                                            std::uint32_t                   chunk_size,
                                            bool                            hash_chunks)
{
    if (paths.empty() || chunk_size == 0)
        return std::nullopt;

    std::vector<Pending> files;
    for (const auto &p : paths)
    {
        if (!collect(fs::path(p), files))
            return std::nullopt;
    }

    std::set<std::string> seen;
    for (const auto &f : files)
    {
        if (!seen.insert(f.rel).second)
        {
            LOG_ERROR("duplicate relative path in selection: %s", f.rel.c_str());
            return std::nullopt;
        }
    }

    std::error_code ec;
    const bool      single = paths.size() == 1 && fs::is_regular_file(paths[0], ec);

    std::vector<FileSpec> specs;
    specs.reserve(files.size());
    for (const auto &f : files)
    {
        const std::uintmax_t sz = fs::file_size(f.path, ec);
        if (ec)
        {
            LOG_ERROR("stat %s failed: %s", f.path.string().c_str(), ec.message().c_str());
            return std::nullopt;
        }
        specs.push_back({f.path.filename().string(), f.rel, static_cast<std::uint64_t>(sz)});
    }

    std::string label;
    if (paths.size() == 1)
    {
        fs::path p(paths[0]);
        label = p.filename().empty() ? p.parent_path().filename().string()
                                     : p.filename().string();
    }
    else
    {
        label = "download";
    }

    BuiltManifest out;
    out.manifest = make_manifest(single ? Kind::SingleFile : Kind::Collection, std::move(label),
                                 chunk_size, specs);
    for (const auto &f : files)
        out.sources.push_back(f.path.string());

    if (hash_chunks)
    {
        for (std::size_t i = 0; i < files.size(); ++i)
        {
            if (!hash_file(files[i].path, specs[i].size, chunk_size, out.manifest.entries[i],
                           out.manifest))
                return std::nullopt;
        }
    }

    if (!validate(out.manifest))
    {
        LOG_ERROR("built manifest failed validation");
        return std::nullopt;
    }
    LOG_INFO("manifest: %s '%s' entries=%zu chunks=%u size=%s", kind_name(out.manifest.kind),
             out.manifest.label.c_str(), out.manifest.entry_count(),
             out.manifest.total_chunks(), format_size(out.manifest.total_size).c_str());
    return out;
}

}  // namespace model
