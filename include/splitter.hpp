// include/splitter.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "progress_reporter.hpp"
#include "split_config.hpp"
#include "split_manifest.hpp"
#include "thread_pool.hpp"

namespace FileSplitter
{
    namespace Engine
    {

        struct SplitOptions
        {
            int compression_level = Config::SplitConfig::DEFAULT_COMPRESSION_LEVEL;

            // > 1 moves compress + digest + write of each window onto a worker pool.
            // Windows are still read, hashed and recorded in sequence order.
            size_t chunk_workers = 1;
        };

        class Splitter
        {
        public:
            explicit Splitter(SplitOptions options = SplitOptions());

            // Splits source_path into windows of size_limit bytes under
            // <output_dir>/<name>_parts/, writes <name>.json next to them and returns the manifest.
            //
            // Errors (SplitError): InvalidConfig before any I/O for a zero limit, bad paths or a bad
            // compression level; IoError for read/write failures; Cancelled if the token fires
            // between windows. Chunk files written before a failure are left on disk.
            Metadata::SplitManifest split(const std::filesystem::path &source_path,
                                          uint64_t size_limit,
                                          const std::filesystem::path &output_dir,
                                          bool compress,
                                          Progress::ProgressReporter &progress,
                                          const Progress::CancellationToken *cancel = nullptr);

        private:
            SplitOptions options;
            std::unique_ptr<Concurrency::ThreadPool> chunk_pool; // Only when chunk_workers > 1
        };

    } // namespace Engine
} // namespace FileSplitter
