// tests/splitter_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "chunk.hpp"
#include "digest_utility.hpp"
#include "gzip_codec.hpp"
#include "split_errors.hpp"
#include "splitter.hpp"
#include "test_support.hpp"

using namespace FileSplitter;
using Engine::SplitOptions;
using Engine::Splitter;
using Metadata::SplitManifest;

namespace fs = std::filesystem;

namespace
{
    // Records every report() call
    class RecordingReporter : public Progress::ProgressReporter
    {
    public:
        std::vector<std::pair<uint64_t, uint64_t>> calls;

        void report(uint64_t processed, uint64_t total) override
        {
            calls.emplace_back(processed, total);
        }
    };

    ErrorKind splitError(Splitter &splitter, const fs::path &source, uint64_t limit, const fs::path &out)
    {
        Progress::NullProgressReporter progress;
        try
        {
            splitter.split(source, limit, out, false, progress);
        }
        catch (const SplitError &e)
        {
            return e.kind();
        }
        ADD_FAILURE() << "expected SplitError";
        return ErrorKind::IoError;
    }
} // namespace

TEST(SplitterTest, TwoFiftyBytesByHundred)
{
    Testing::TempDir dir;
    std::vector<char> data = Testing::patternBytes(250);
    Testing::writeFile(dir / "data.bin", data);

    Splitter splitter;
    RecordingReporter progress;
    SplitManifest m = splitter.split(dir / "data.bin", 100, dir / "out", false, progress);

    EXPECT_EQ(m.original_filename, "data.bin");
    EXPECT_EQ(m.original_file_size, 250u);
    EXPECT_EQ(m.size_limit, 100u);
    EXPECT_FALSE(m.is_compressed);
    EXPECT_EQ(m.original_checksum, Digest::DigestUtility::sha256Hex(data));
    ASSERT_EQ(m.chunks.size(), 3u);

    const uint64_t sizes[] = {100, 100, 50};
    const char *names[] = {"data.bin-001", "data.bin-002", "data.bin-003"};
    uint64_t offset = 0;
    for (uint64_t i = 0; i < 3; ++i)
    {
        const auto &c = m.chunks[i];
        EXPECT_EQ(c.index, i);
        EXPECT_EQ(c.original_size, sizes[i]);
        EXPECT_EQ(c.stored_size, sizes[i]);
        EXPECT_EQ(c.chunk_path, std::string("data.bin_parts/") + names[i]);

        std::vector<char> expected(data.begin() + offset, data.begin() + offset + sizes[i]);
        std::vector<char> on_disk = Testing::readFile(dir.path() / "out" / "data.bin_parts" / names[i]);
        EXPECT_EQ(on_disk, expected);
        EXPECT_EQ(c.checksum, Digest::DigestUtility::sha256Hex(expected));
        offset += sizes[i];
    }

    EXPECT_TRUE(fs::is_regular_file(dir.path() / "out" / "data.bin_parts" / "data.bin.json"));
    EXPECT_NO_THROW(Metadata::ManifestCodec::validate(m));

    std::vector<std::pair<uint64_t, uint64_t>> expected_calls{{100, 250}, {200, 250}, {250, 250}};
    EXPECT_EQ(progress.calls, expected_calls);
}

TEST(SplitterTest, ChunkCountIsCeilingOfSizeOverLimit)
{
    Testing::TempDir dir;
    Testing::writeFile(dir / "even.bin", Testing::patternBytes(300));
    Testing::writeFile(dir / "one.bin", Testing::patternBytes(1));

    Splitter splitter;
    Progress::NullProgressReporter progress;
    EXPECT_EQ(splitter.split(dir / "even.bin", 100, dir.path(), false, progress).chunks.size(), 3u);
    EXPECT_EQ(splitter.split(dir / "even.bin", 1, dir / "bytes", false, progress).chunks.size(), 300u);
    EXPECT_EQ(splitter.split(dir / "one.bin", 100, dir.path(), false, progress).chunks.size(), 1u);
}

TEST(SplitterTest, EmptyFileProducesEmptyManifest)
{
    Testing::TempDir dir;
    Testing::writeFile(dir / "empty.bin", {});

    Splitter splitter;
    RecordingReporter progress;
    SplitManifest m = splitter.split(dir / "empty.bin", 100, dir.path(), false, progress);

    EXPECT_EQ(m.original_file_size, 0u);
    EXPECT_TRUE(m.chunks.empty());
    EXPECT_EQ(m.original_checksum, Digest::DigestUtility::sha256Hex(std::vector<char>{}));
    std::vector<std::pair<uint64_t, uint64_t>> expected_calls{{0, 0}};
    EXPECT_EQ(progress.calls, expected_calls);
    EXPECT_TRUE(fs::is_regular_file(dir.path() / "empty.bin_parts" / "empty.bin.json"));
}

TEST(SplitterTest, LimitLargerThanFileGivesOneChunk)
{
    Testing::TempDir dir;
    std::vector<char> data = Testing::patternBytes(64);
    Testing::writeFile(dir / "small.bin", data);

    Splitter splitter;
    Progress::NullProgressReporter progress;
    SplitManifest m = splitter.split(dir / "small.bin", 1 << 20, dir.path(), false, progress);
    ASSERT_EQ(m.chunks.size(), 1u);
    EXPECT_EQ(m.chunks[0].original_size, 64u);
    EXPECT_EQ(Testing::readFile(dir.path() / "small.bin_parts" / "small.bin-001"), data);
}

TEST(SplitterTest, CompressedChunksInflateToSourceWindows)
{
    Testing::TempDir dir;
    std::vector<char> data(5000, 'z');
    Testing::writeFile(dir / "text.txt", data);

    Splitter splitter;
    Progress::NullProgressReporter progress;
    SplitManifest m = splitter.split(dir / "text.txt", 2000, dir.path(), true, progress);

    EXPECT_TRUE(m.is_compressed);
    ASSERT_EQ(m.chunks.size(), 3u);
    for (const auto &c : m.chunks)
    {
        std::vector<char> stored = Testing::readFile(dir.path() / c.chunk_path);
        EXPECT_EQ(stored.size(), c.stored_size);
        EXPECT_LT(c.stored_size, c.original_size);
        EXPECT_EQ(c.checksum, Digest::DigestUtility::sha256Hex(stored));

        std::vector<char> window = Compression::GzipCodec::decompress(stored, c.original_size);
        EXPECT_EQ(window, std::vector<char>(c.original_size, 'z'));
        EXPECT_EQ(c.original_checksum, Digest::DigestUtility::sha256Hex(window));
    }
    EXPECT_EQ(m.original_checksum, Digest::DigestUtility::sha256Hex(data));
}

TEST(SplitterTest, InvalidArgumentsFailBeforeAnyOutput)
{
    Testing::TempDir dir;
    Testing::writeFile(dir / "data.bin", Testing::patternBytes(10));
    Splitter splitter;

    EXPECT_EQ(splitError(splitter, dir / "data.bin", 0, dir / "out"), ErrorKind::InvalidConfig);
    EXPECT_EQ(splitError(splitter, dir / "absent.bin", 10, dir / "out"), ErrorKind::InvalidConfig);
    EXPECT_EQ(splitError(splitter, dir.path(), 10, dir / "out"), ErrorKind::InvalidConfig);
    EXPECT_EQ(splitError(splitter, fs::path(), 10, dir / "out"), ErrorKind::InvalidConfig);
    EXPECT_EQ(splitError(splitter, dir / "data.bin", 10, fs::path()), ErrorKind::InvalidConfig);
    EXPECT_FALSE(fs::exists(dir / "out"));

    Splitter bad_level(SplitOptions{12, 1});
    Progress::NullProgressReporter progress;
    try
    {
        bad_level.split(dir / "data.bin", 10, dir / "out", true, progress);
        FAIL() << "expected SplitError";
    }
    catch (const SplitError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidConfig);
    }
    EXPECT_FALSE(fs::exists(dir / "out"));

    EXPECT_THROW(Splitter(SplitOptions{-1, 0}), SplitError);
}

TEST(SplitterTest, WorkerPoolKeepsSequenceOrder)
{
    Testing::TempDir dir;
    std::vector<char> data = Testing::patternBytes(10000, 11);
    Testing::writeFile(dir / "data.bin", data);

    Splitter sequential;
    Splitter pooled(SplitOptions{-1, 4});
    Progress::NullProgressReporter progress;

    for (bool compress : {false, true})
    {
        SplitManifest a = sequential.split(dir / "data.bin", 333, dir / "seq", compress, progress);
        RecordingReporter pooled_progress;
        SplitManifest b = pooled.split(dir / "data.bin", 333, dir / "pool", compress, pooled_progress);

        ASSERT_EQ(a.chunks.size(), 31u);
        ASSERT_EQ(b.chunks.size(), a.chunks.size());
        for (size_t i = 0; i < a.chunks.size(); ++i)
        {
            EXPECT_EQ(b.chunks[i].index, i);
            EXPECT_EQ(b.chunks[i].checksum, a.chunks[i].checksum);
            EXPECT_EQ(b.chunks[i].chunk_path, a.chunks[i].chunk_path);
        }
        EXPECT_EQ(b.original_checksum, a.original_checksum);
        ASSERT_FALSE(pooled_progress.calls.empty());
        EXPECT_EQ(pooled_progress.calls.back(), std::make_pair(uint64_t(10000), uint64_t(10000)));
    }
}

TEST(SplitterTest, CancelledBeforeFirstWindow)
{
    Testing::TempDir dir;
    Testing::writeFile(dir / "data.bin", Testing::patternBytes(500));

    Splitter splitter;
    Progress::NullProgressReporter progress;
    Progress::CancellationToken cancel;
    cancel.cancel();
    try
    {
        splitter.split(dir / "data.bin", 100, dir.path(), false, progress, &cancel);
        FAIL() << "expected SplitError";
    }
    catch (const SplitError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::Cancelled);
    }
    EXPECT_FALSE(fs::exists(dir.path() / "data.bin_parts" / "data.bin.json"));
}

TEST(SplitterTest, StoredSizesShrinkOnlyWhenCompressing)
{
    Testing::TempDir dir;
    std::string text;
    while (text.size() < 20000)
    {
        text += "the quick brown fox jumps over the lazy dog\n";
    }
    Testing::writeFile(dir / "fox.txt", std::vector<char>(text.begin(), text.end()));

    Splitter splitter;
    Progress::NullProgressReporter progress;
    SplitManifest raw = splitter.split(dir / "fox.txt", 4096, dir / "raw", false, progress);
    SplitManifest packed = splitter.split(dir / "fox.txt", 4096, dir / "packed", true, progress);

    EXPECT_EQ(raw.totalStoredSize(), text.size());
    EXPECT_LT(packed.totalStoredSize(), text.size());
    EXPECT_EQ(packed.chunks.size(), raw.chunks.size());
    EXPECT_EQ(packed.original_checksum, raw.original_checksum);
}

TEST(SplitterTest, NonUtf8FileNameRejectedBeforeOutput)
{
    Testing::TempDir dir;
    const std::string name = "caf\xe9.bin";
    Testing::writeFile(dir / name, Testing::patternBytes(250));

    Splitter splitter;
    EXPECT_EQ(splitError(splitter, dir / name, 100, dir / "out"), ErrorKind::InvalidConfig);
    EXPECT_FALSE(fs::exists(dir / "out"));
}

TEST(ChunkTest, CompressionFailureIsIoErrorNamingChunk)
{
    std::vector<char> window(32, 'w');
    try
    {
        Chunks::Chunk chunk(4, window, true, 12);
        FAIL() << "expected SplitError";
    }
    catch (const SplitError &e)
    {
        EXPECT_EQ(e.kind(), ErrorKind::IoError);
        EXPECT_EQ(e.chunkIndex(), std::optional<uint64_t>(4));
    }
}
