// tests/batch_runner_test.cpp
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "batch_runner.hpp"
#include "split_config.hpp"
#include "test_support.hpp"

using namespace FileSplitter;
using Batch::BatchRunner;
using Batch::FileOutcome;
using Config::SplitConfig;

namespace fs = std::filesystem;

namespace
{
    SplitConfig smallConfig()
    {
        SplitConfig config;
        config.file_workers = 3;
        config.chunk_workers = 2;
        return config;
    }
} // namespace

TEST(BatchRunnerTest, MixedSplitOutcomesInInputOrder)
{
    Testing::TempDir dir;
    Testing::writeFile(dir / "a.bin", Testing::patternBytes(300, 1));
    Testing::writeFile(dir / "c.bin", Testing::patternBytes(50, 3));

    BatchRunner runner(smallConfig());
    std::vector<fs::path> sources{dir / "a.bin", dir / "missing.bin", dir / "c.bin"};
    std::vector<FileOutcome> outcomes = runner.splitAll(sources, 100, dir / "out", false);

    ASSERT_EQ(outcomes.size(), 3u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_EQ(outcomes[0].input, sources[0]);
    EXPECT_EQ(outcomes[0].output, SplitConfig::manifestPathFor(dir / "out", "a.bin"));
    EXPECT_TRUE(fs::is_regular_file(outcomes[0].output));

    EXPECT_FALSE(outcomes[1].success);
    ASSERT_TRUE(outcomes[1].error_kind.has_value());
    EXPECT_EQ(*outcomes[1].error_kind, ErrorKind::InvalidConfig);
    EXPECT_FALSE(outcomes[1].message.empty());

    EXPECT_TRUE(outcomes[2].success);
    EXPECT_FALSE(BatchRunner::allSucceeded(outcomes));
}

TEST(BatchRunnerTest, SplitThenRestoreEveryFile)
{
    Testing::TempDir dir;
    std::vector<fs::path> sources;
    for (int i = 0; i < 5; ++i)
    {
        fs::path p = dir / ("file" + std::to_string(i) + ".bin");
        Testing::writeFile(p, Testing::patternBytes(100 * i + 7, i + 1));
        sources.push_back(p);
    }

    BatchRunner runner(smallConfig());
    std::atomic<int> reporters_made{0};
    Batch::ReporterFactory factory = [&reporters_made](const fs::path &)
    {
        ++reporters_made;
        return std::make_unique<Progress::NullProgressReporter>();
    };

    auto split = runner.splitAll(sources, 64, dir / "parts", true, factory);
    ASSERT_TRUE(BatchRunner::allSucceeded(split));
    EXPECT_EQ(reporters_made.load(), 5);

    std::vector<fs::path> manifests;
    for (const auto &outcome : split)
    {
        manifests.push_back(outcome.output);
    }
    auto restored = runner.restoreAll(manifests, dir / "parts", dir / "restored", factory);
    ASSERT_TRUE(BatchRunner::allSucceeded(restored));
    for (size_t i = 0; i < sources.size(); ++i)
    {
        EXPECT_EQ(restored[i].output, dir.path() / "restored" / sources[i].filename());
        EXPECT_EQ(Testing::readFile(restored[i].output), Testing::readFile(sources[i]));
    }
}

TEST(BatchRunnerTest, DuplicateNamesAreRejected)
{
    Testing::TempDir dir;
    fs::create_directories(dir / "x");
    fs::create_directories(dir / "y");
    Testing::writeFile(dir.path() / "x" / "same.bin", Testing::patternBytes(10));
    Testing::writeFile(dir.path() / "y" / "same.bin", Testing::patternBytes(20));

    BatchRunner runner(smallConfig());
    auto outcomes = runner.splitAll({dir.path() / "x" / "same.bin", dir.path() / "y" / "same.bin"}, 8, dir / "out", false);
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_TRUE(outcomes[0].success);
    EXPECT_FALSE(outcomes[1].success);
    EXPECT_EQ(outcomes[1].error_kind, std::optional<ErrorKind>(ErrorKind::InvalidConfig));

    auto restored = runner.restoreAll({outcomes[0].output, outcomes[0].output}, dir / "out", dir / "restored");
    EXPECT_TRUE(restored[0].success);
    EXPECT_FALSE(restored[1].success);
}

TEST(BatchRunnerTest, RestoreReportsManifestProblemsPerFile)
{
    Testing::TempDir dir;
    Testing::writeFile(dir / "ok.bin", Testing::patternBytes(30));
    Testing::writeText(dir / "bad.json", "not a manifest");

    BatchRunner runner(smallConfig());
    auto split = runner.splitAll({dir / "ok.bin"}, 16, dir / "parts", false);
    ASSERT_TRUE(split[0].success);

    auto restored = runner.restoreAll({dir / "bad.json", split[0].output, dir / "absent.json"}, dir / "parts", dir / "restored");
    ASSERT_EQ(restored.size(), 3u);
    EXPECT_EQ(restored[0].error_kind, std::optional<ErrorKind>(ErrorKind::InvalidManifest));
    EXPECT_TRUE(restored[1].success);
    EXPECT_EQ(restored[2].error_kind, std::optional<ErrorKind>(ErrorKind::InvalidManifest));
}

TEST(BatchRunnerTest, InvalidConfigIsRejected)
{
    SplitConfig config;
    config.compression_level = 42;
    EXPECT_THROW(BatchRunner runner(config), SplitError);
}
