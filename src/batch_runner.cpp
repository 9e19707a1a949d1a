// src/batch_runner.cpp
#include "batch_runner.hpp"

#include <future>
#include <iostream>
#include <map>

namespace fs = std::filesystem;

namespace FileSplitter
{
    namespace Batch
    {

        namespace
        {
            Engine::SplitOptions splitOptionsFrom(const Config::SplitConfig &config)
            {
                config.validate();
                return Engine::SplitOptions{config.compression_level, config.chunk_workers};
            }

            void recordFailure(FileOutcome &outcome, const SplitError &e)
            {
                outcome.success = false;
                outcome.error_kind = e.kind();
                outcome.message = e.what();
            }
        } // namespace

        BatchRunner::BatchRunner(const Config::SplitConfig &split_config)
            : splitter(splitOptionsFrom(split_config)),
              file_pool(split_config.file_workers, "file-pipeline")
        {
        }

        std::vector<FileOutcome> BatchRunner::splitAll(const std::vector<fs::path> &sources,
                                                       uint64_t size_limit,
                                                       const fs::path &output_dir,
                                                       bool compress,
                                                       const ReporterFactory &reporters,
                                                       const Progress::CancellationToken *cancel)
        {
            std::cout << "Starting to split " << sources.size() << " file(s) into " << output_dir.string() << std::endl;

            std::vector<FileOutcome> outcomes(sources.size());
            std::vector<bool> pending(sources.size(), true);

            // Parts directories are named after the file, so two inputs with the same
            // name would write over each other.
            std::map<std::string, size_t> seen_names;
            for (size_t i = 0; i < sources.size(); ++i)
            {
                outcomes[i].input = sources[i];
                const std::string name = sources[i].filename().string();
                if (name.empty())
                {
                    continue; // The splitter reports this one
                }
                if (!seen_names.emplace(name, i).second)
                {
                    recordFailure(outcomes[i], SplitError(ErrorKind::InvalidConfig,
                                                          "Another file in this batch is also named '" + name + "'",
                                                          sources[i]));
                    pending[i] = false;
                }
            }

            runPipelines(outcomes, pending, [&](size_t i)
                         {
                             auto reporter = reporterFor(reporters, sources[i]);
                             splitter.split(sources[i], size_limit, output_dir, compress, *reporter, cancel);
                             return Config::SplitConfig::manifestPathFor(output_dir, sources[i].filename().string()); });
            return outcomes;
        }

        std::vector<FileOutcome> BatchRunner::restoreAll(const std::vector<fs::path> &manifests,
                                                         const fs::path &chunk_dir,
                                                         const fs::path &output_dir,
                                                         const ReporterFactory &reporters,
                                                         const Progress::CancellationToken *cancel)
        {
            std::cout << "Starting to restore " << manifests.size() << " file(s) into " << output_dir.string() << std::endl;

            std::vector<FileOutcome> outcomes(manifests.size());
            std::vector<bool> pending(manifests.size(), true);
            std::vector<Metadata::SplitManifest> loaded(manifests.size());

            // Manifests are read up front so two of them restoring to the same name are caught
            // before either pipeline starts writing.
            std::map<std::string, size_t> seen_names;
            for (size_t i = 0; i < manifests.size(); ++i)
            {
                outcomes[i].input = manifests[i];
                try
                {
                    loaded[i] = Metadata::ManifestCodec::load(manifests[i]);
                    if (!seen_names.emplace(loaded[i].original_filename, i).second)
                    {
                        throw SplitError(ErrorKind::InvalidConfig,
                                         "Another manifest in this batch also restores '" + loaded[i].original_filename + "'",
                                         manifests[i]);
                    }
                }
                catch (const SplitError &e)
                {
                    std::cerr << "Error reading manifest '" << manifests[i].string() << "': " << e.what() << std::endl;
                    recordFailure(outcomes[i], e);
                    pending[i] = false;
                }
            }

            runPipelines(outcomes, pending, [&](size_t i)
                         {
                             auto reporter = reporterFor(reporters, manifests[i]);
                             return restorer.restore(loaded[i], chunk_dir, output_dir, *reporter, cancel); });
            return outcomes;
        }

        bool BatchRunner::allSucceeded(const std::vector<FileOutcome> &outcomes)
        {
            for (const auto &outcome : outcomes)
            {
                if (!outcome.success)
                {
                    return false;
                }
            }
            return true;
        }

        void BatchRunner::runPipelines(std::vector<FileOutcome> &outcomes,
                                       const std::vector<bool> &pending,
                                       const std::function<fs::path(size_t)> &pipeline)
        {
            std::vector<std::future<void>> futures;
            futures.reserve(outcomes.size());

            for (size_t i = 0; i < outcomes.size(); ++i)
            {
                if (!pending[i])
                {
                    continue;
                }
                // Each task writes only its own outcome slot
                futures.push_back(file_pool.enqueue([&outcomes, &pipeline, i]()
                                                    {
                    FileOutcome &outcome = outcomes[i];
                    try
                    {
                        outcome.output = pipeline(i);
                        outcome.success = true;
                    }
                    catch (const SplitError &e)
                    {
                        recordFailure(outcome, e);
                    }
                    catch (const std::exception &e)
                    {
                        std::cerr << "Unexpected error processing '" << outcome.input.string() << "': " << e.what() << std::endl;
                        outcome.success = false;
                        outcome.message = e.what();
                    } }));
            }

            for (auto &future : futures)
            {
                future.get();
            }
        }

        std::unique_ptr<Progress::ProgressReporter> BatchRunner::reporterFor(const ReporterFactory &reporters,
                                                                             const fs::path &input) const
        {
            if (reporters)
            {
                auto reporter = reporters(input);
                if (reporter)
                {
                    return reporter;
                }
            }
            return std::make_unique<Progress::NullProgressReporter>();
        }

    } // namespace Batch
} // namespace FileSplitter
