#include "proto/stream.hpp"
#include "util/bytes.hpp"
#include "util/log.hpp"

namespace proto
{

const char *frame_type_name(FrameType t)
{
    switch (t)
    {
        case FrameType::Manifest:
            return "MANIFEST";
        case FrameType::Ready:
            return "READY";
        case FrameType::FileStart:
            return "FILE_START";
        case FrameType::Data:
            return "DATA";
        case FrameType::FileEnd:
            return "FILE_END";
        case FrameType::Complete:
            return "COMPLETE";
        case FrameType::Cancel:
            return "CANCEL";
    }
    return "?";
}

static ferry::ByteWriter begin(FrameType t)
{
    ferry::ByteWriter w;
    w.put_u8(static_cast<std::uint8_t>(t));
    return w;
}

std::vector<std::uint8_t> encode_manifest(const model::Manifest &m)
{
    auto w = begin(FrameType::Manifest);
    w.put_blob(model::encode(m));
    return w.take();
}

std::vector<std::uint8_t> encode_ready()
{
    return begin(FrameType::Ready).take();
}

std::vector<std::uint8_t> encode_file_start(std::uint32_t entry, const std::string &path, std::uint64_t size)
{
    auto w = begin(FrameType::FileStart);
    w.put_u32(entry);
    w.put_str(path);
    w.put_u64(size);
    return w.take();
}

std::vector<std::uint8_t> encode_data(std::uint32_t entry, std::uint64_t offset, const std::uint8_t *p, std::size_t n)
{
    auto w = begin(FrameType::Data);
    w.put_u32(entry);
    w.put_u64(offset);
    const digest::Sha256 h = digest::sha256(p, n);
    w.put_raw(h.data(), h.size());
    w.put_u32(static_cast<std::uint32_t>(n));
    w.put_raw(p, n);
    return w.take();
}

std::vector<std::uint8_t> encode_file_end(std::uint32_t entry)
{
    auto w = begin(FrameType::FileEnd);
    w.put_u32(entry);
    return w.take();
}

std::vector<std::uint8_t> encode_complete()
{
    return begin(FrameType::Complete).take();
}

std::vector<std::uint8_t> encode_cancel(const std::string &reason)
{
    auto w = begin(FrameType::Cancel);
    w.put_str(reason);
    return w.take();
}

std::optional<StreamFrame> parse(const std::vector<std::uint8_t> &frame)
{
    ferry::ByteReader r(frame);
    std::uint8_t      t = 0;
    if (!r.get_u8(t))
        return std::nullopt;

    StreamFrame f;
    f.type  = static_cast<FrameType>(t);
    bool ok = true;
    switch (f.type)
    {
        case FrameType::Manifest:
        {
            std::vector<std::uint8_t> blob;
            ok = r.get_blob(blob);
            if (ok)
            {
                auto m = model::decode(blob);
                ok     = m.has_value();
                if (ok)
                    f.manifest = std::move(*m);
            }
            break;
        }
        case FrameType::Ready:
        case FrameType::Complete:
            break;
        case FrameType::FileStart:
            ok = r.get_u32(f.entry) && r.get_str(f.path, 4096) && r.get_u64(f.size);
            break;
        case FrameType::Data:
        {
            std::uint32_t n = 0;
            ok = r.get_u32(f.entry) && r.get_u64(f.offset) && r.get_raw(f.hash.data(), f.hash.size()) &&
                 r.get_u32(n) && n <= r.remaining();
            if (ok)
            {
                f.data.resize(n);
                ok = r.get_raw(f.data.data(), n);
            }
            break;
        }
        case FrameType::FileEnd:
            ok = r.get_u32(f.entry);
            break;
        case FrameType::Cancel:
            ok = r.get_str(f.reason, 1024);
            break;
        default:
            LOG_DEBUG("unknown stream frame type 0x%02x", t);
            return std::nullopt;
    }
    if (!ok || !r.done())
    {
        LOG_DEBUG("malformed %s frame (%zu bytes)", frame_type_name(f.type), frame.size());
        return std::nullopt;
    }
    return f;
}

}  // namespace proto
