// include/cli_options.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace FileSplitter
{
    namespace Cli
    {

        struct Args
        {
            std::string mode;                 // "split" or "restore"
            std::vector<std::string> inputs;  // Source files (split) or manifests (restore)
            std::optional<uint64_t> size_limit;
            std::string output_dir = ".";
            std::string input_dir = ".";      // Chunk directory for restore
            bool compress = false;
            std::optional<size_t> jobs;
            std::string config_path;
            bool quiet = false;
            bool help = false;
        };

        // Throws SplitError(InvalidConfig) on anything it can't make sense of.
        Args parseArgs(int argc, const char *const *argv);

        std::string usage();

        // Strict decimal byte count: digits only, no sign, no overflow
        uint64_t parseByteCount(const std::string &text, const std::string &flag);

    } // namespace Cli
} // namespace FileSplitter
