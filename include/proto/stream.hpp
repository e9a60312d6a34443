#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/digest.hpp"
#include "model/manifest.hpp"

/*
Direct (peer) stream, one frame per ITransport::send():

  sender                               receiver
  ------                               --------
  MANIFEST {encoded manifest}    ──▶   check against the published manifest
                                 ◀──   READY
  FILE_START {entry, path, size} ──▶   open entry
  DATA {entry, offset, sha256, bytes}  verify + write (offsets strictly in order)
  ...
  FILE_END {entry}               ──▶   finish entry
  ... next entry ...
  COMPLETE                       ──▶   all entries finished
  CANCEL {reason}                ◀─▶   either side aborts the direct path

Frames are [u8 type][payload], integers big-endian.
*/

namespace proto
{

enum class FrameType : std::uint8_t
{
    Manifest  = 0x01,
    Ready     = 0x02,
    FileStart = 0x03,
    Data      = 0x04,
    FileEnd   = 0x05,
    Complete  = 0x06,
    Cancel    = 0x07,
};

const char *frame_type_name(FrameType t);

struct StreamFrame
{
    FrameType                 type{FrameType::Ready};
    model::Manifest           manifest;  // Manifest
    std::uint32_t             entry{0};  // FileStart, Data, FileEnd
    std::string               path;      // FileStart
    std::uint64_t             size{0};   // FileStart
    std::uint64_t             offset{0};  // Data
    digest::Sha256            hash{};     // Data
    std::vector<std::uint8_t> data;       // Data
    std::string               reason;     // Cancel
};

std::vector<std::uint8_t> encode_manifest(const model::Manifest &m);
std::vector<std::uint8_t> encode_ready();
std::vector<std::uint8_t> encode_file_start(std::uint32_t entry, const std::string &path, std::uint64_t size);
std::vector<std::uint8_t> encode_data(std::uint32_t entry, std::uint64_t offset, const std::uint8_t *p, std::size_t n);
std::vector<std::uint8_t> encode_file_end(std::uint32_t entry);
std::vector<std::uint8_t> encode_complete();
std::vector<std::uint8_t> encode_cancel(const std::string &reason);

// Structural parse only; DATA hashes are checked by the receiver.
std::optional<StreamFrame> parse(const std::vector<std::uint8_t> &frame);

}  // namespace proto
