// include/console_progress.hpp
#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

#include "progress_reporter.hpp"

namespace FileSplitter
{
    namespace Cli
    {

        // Shared console sink for a batch. Each file gets its own reporter; all of them
        // print through one mutex so lines from concurrent pipelines don't interleave.
        class ConsoleProgress
        {
        public:
            ConsoleProgress(std::ostream &out, bool enabled);

            std::unique_ptr<Progress::ProgressReporter> reporterFor(const std::filesystem::path &input);

            // "<label>: <processed>/<total> bytes (<pct>%)"
            static std::string formatLine(const std::string &label, uint64_t processed, uint64_t total);

        private:
            class FileReporter;

            void printLine(const std::string &line);

            std::ostream &out;
            bool enabled;
            std::mutex output_mutex;
        };

    } // namespace Cli
} // namespace FileSplitter
