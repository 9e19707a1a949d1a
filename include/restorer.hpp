// include/restorer.hpp
#pragma once

#include <filesystem>

#include "progress_reporter.hpp"
#include "split_manifest.hpp"

namespace FileSplitter
{
    namespace Engine
    {

        class Restorer
        {
        public:
            // Reads the manifest at manifest_path and rebuilds the original file as
            // <output_dir>/<original_filename>. Returns that path.
            //
            // The output is assembled in a "<name>.<pid>-<n>.partial" file private to this call and
            // only renamed into place once every chunk passed its checks; on a chunk-level error
            // the partial file is removed.
            // A whole-file digest mismatch still leaves the rebuilt file on disk, then throws
            // SplitError(IntegrityError).
            std::filesystem::path restore(const std::filesystem::path &manifest_path,
                                          const std::filesystem::path &chunk_dir,
                                          const std::filesystem::path &output_dir,
                                          Progress::ProgressReporter &progress,
                                          const Progress::CancellationToken *cancel = nullptr);

            // Same, for a manifest that's already decoded
            std::filesystem::path restore(const Metadata::SplitManifest &manifest,
                                          const std::filesystem::path &chunk_dir,
                                          const std::filesystem::path &output_dir,
                                          Progress::ProgressReporter &progress,
                                          const Progress::CancellationToken *cancel = nullptr);
        };

    } // namespace Engine
} // namespace FileSplitter
