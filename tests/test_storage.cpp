#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <iterator>
#include <unistd.h>

#include "engine/storage.hpp"
#include "memory_storage.hpp"

namespace fs = std::filesystem;
using engine::FileSink;
using engine::FileSource;
using ferry::Errc;

namespace
{

struct TempDir
{
    fs::path path;
    TempDir()
    {
        path = fs::temp_directory_path() / ("ferry-storage-" + std::to_string(::getpid()));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

Bytes slurp(const fs::path &p)
{
    std::ifstream in(p, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

}  // namespace

TEST(FileSource, ReadsRangesAndReportsShortFiles)
{
    TempDir d;
    Bytes   data = pattern(100, 7);
    {
        std::ofstream out(d.path / "src.bin", std::ios::binary);
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }
    FileSource src({(d.path / "src.bin").string(), (d.path / "missing").string()});

    Bytes out;
    ASSERT_EQ(src.read(0, 10, 20, out), Errc::ok);
    EXPECT_EQ(out, Bytes(data.begin() + 10, data.begin() + 30));
    EXPECT_EQ(src.read(0, 90, 20, out), Errc::io_error);
    EXPECT_EQ(src.read(1, 0, 1, out), Errc::io_error);
    EXPECT_EQ(src.read(2, 0, 1, out), Errc::protocol_error);
}

TEST(FileSink, WritesEntriesUnderDestination)
{
    TempDir         d;
    Bytes           a = pattern(10, 1);
    model::Manifest m = manifest_for({a, Bytes{}}, 4);  // set/f0.bin, set/f1.bin

    FileSink sink(d.path.string());
    ASSERT_EQ(sink.prepare(m), Errc::ok);
    ASSERT_EQ(sink.write(0, 0, a.data(), 4), Errc::ok);
    ASSERT_EQ(sink.write(0, 4, a.data() + 4, 6), Errc::ok);
    ASSERT_EQ(sink.finish_entry(0), Errc::ok);
    ASSERT_EQ(sink.finish_entry(1), Errc::ok);

    EXPECT_EQ(slurp(d.path / "set" / "f0.bin"), a);
    EXPECT_TRUE(fs::exists(d.path / "set" / "f1.bin"));
    EXPECT_EQ(fs::file_size(d.path / "set" / "f1.bin"), 0u);
}

TEST(FileSink, RejectsWritesPastEntryEnd)
{
    TempDir         d;
    Bytes           a = pattern(10, 1);
    model::Manifest m = manifest_for({a}, 4);
    FileSink        sink(d.path.string());
    ASSERT_EQ(sink.prepare(m), Errc::ok);
    EXPECT_EQ(sink.write(0, 8, a.data(), 4), Errc::protocol_error);
    EXPECT_EQ(sink.write(3, 0, a.data(), 1), Errc::protocol_error);
}

TEST(FileSink, PartialOutputSurvivesAbortForResume)
{
    TempDir         d;
    Bytes           a = pattern(12, 3);
    model::Manifest m = manifest_for({a}, 4);
    {
        FileSink first(d.path.string());
        ASSERT_EQ(first.prepare(m), Errc::ok);
        ASSERT_EQ(first.write(0, 0, a.data(), 8), Errc::ok);
        first.abort();
    }

    FileSink again(d.path.string());
    ASSERT_EQ(again.prepare(m), Errc::ok);
    EXPECT_EQ(again.durable_bytes(0), 8u);
    Bytes back;
    ASSERT_TRUE(again.read_back(0, 4, 4, back));
    EXPECT_EQ(back, Bytes(a.begin() + 4, a.begin() + 8));

    ASSERT_EQ(again.write(0, 8, a.data() + 8, 4), Errc::ok);
    ASSERT_EQ(again.finish_entry(0), Errc::ok);
    EXPECT_EQ(slurp(d.path / "f0.bin"), a);
}

TEST(FileSink, RefusesEscapingPaths)
{
    EXPECT_TRUE(FileSink::safe_relative("album/a.txt"));
    EXPECT_FALSE(FileSink::safe_relative(""));
    EXPECT_FALSE(FileSink::safe_relative("/etc/passwd"));
    EXPECT_FALSE(FileSink::safe_relative("album/../../x"));

    TempDir         d;
    model::Manifest m = manifest_for({pattern(4, 1)}, 4);
    m.entries[0].relative_path = "../outside.bin";
    FileSink sink(d.path.string());
    EXPECT_EQ(sink.prepare(m), Errc::protocol_error);
}
