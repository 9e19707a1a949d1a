// include/batch_runner.hpp
#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <filesystem>

#include "progress_reporter.hpp"
#include "restorer.hpp"
#include "split_config.hpp"
#include "split_errors.hpp"
#include "splitter.hpp"
#include "thread_pool.hpp"

namespace FileSplitter
{
    namespace Batch
    {

        // Result of one file's pipeline within a batch
        struct FileOutcome
        {
            std::filesystem::path input;  // Source file (split) or manifest (restore)
            bool success = false;
            std::filesystem::path output; // Manifest written (split) or file rebuilt (restore)
            std::optional<ErrorKind> error_kind;
            std::string message;
        };

        // Hands each file its own progress reporter
        using ReporterFactory = std::function<std::unique_ptr<Progress::ProgressReporter>(const std::filesystem::path &)>;

        // Runs independent per-file pipelines concurrently. Files share nothing but the
        // reporter factory; one file failing never stops the others.
        class BatchRunner
        {
        public:
            // Throws SplitError(InvalidConfig) if the config doesn't validate
            explicit BatchRunner(const Config::SplitConfig &config);

            std::vector<FileOutcome> splitAll(const std::vector<std::filesystem::path> &sources,
                                              uint64_t size_limit,
                                              const std::filesystem::path &output_dir,
                                              bool compress,
                                              const ReporterFactory &reporters = nullptr,
                                              const Progress::CancellationToken *cancel = nullptr);

            std::vector<FileOutcome> restoreAll(const std::vector<std::filesystem::path> &manifests,
                                                const std::filesystem::path &chunk_dir,
                                                const std::filesystem::path &output_dir,
                                                const ReporterFactory &reporters = nullptr,
                                                const Progress::CancellationToken *cancel = nullptr);

            static bool allSucceeded(const std::vector<FileOutcome> &outcomes);

        private:
            Engine::Splitter splitter;
            Engine::Restorer restorer;
            Concurrency::ThreadPool file_pool;

            // Runs pipeline(i) for each pending slot on the file pool and fills in outcomes, in input order
            void runPipelines(std::vector<FileOutcome> &outcomes,
                              const std::vector<bool> &pending,
                              const std::function<std::filesystem::path(size_t)> &pipeline);

            std::unique_ptr<Progress::ProgressReporter> reporterFor(const ReporterFactory &reporters,
                                                                    const std::filesystem::path &input) const;
        };

    } // namespace Batch
} // namespace FileSplitter
