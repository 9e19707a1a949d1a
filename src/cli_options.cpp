// src/cli_options.cpp
#include "cli_options.hpp"
#include "split_errors.hpp"

#include <cctype>
#include <limits>

namespace FileSplitter
{
    namespace Cli
    {

        namespace
        {
            const char *USAGE =
                "file_splitter split <file>... [-s|--size-limit BYTES] [-o|--output-dir DIR] [-c|--compress]\n"
                "                    [-j|--jobs N] [--config PATH] [-q|--quiet]\n"
                "file_splitter restore <manifest.json>... [-i|--input-dir DIR] [-o|--output-dir DIR]\n"
                "                    [-j|--jobs N] [--config PATH] [-q|--quiet]\n"
                "file_splitter --help\n";

            [[noreturn]] void usageError(const std::string &message)
            {
                throw SplitError(ErrorKind::InvalidConfig, message);
            }
        } // namespace

        std::string usage()
        {
            return USAGE;
        }

        uint64_t parseByteCount(const std::string &text, const std::string &flag)
        {
            if (text.empty())
            {
                usageError("Empty value for " + flag);
            }
            uint64_t value = 0;
            for (char c : text)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                {
                    usageError("Value for " + flag + " must be a whole number, got '" + text + "'");
                }
                const uint64_t digit = static_cast<uint64_t>(c - '0');
                if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10)
                {
                    usageError("Value for " + flag + " is too large: " + text);
                }
                value = value * 10 + digit;
            }
            return value;
        }

        Args parseArgs(int argc, const char *const *argv)
        {
            Args a;
            if (argc < 2)
            {
                usageError("Missing subcommand");
            }

            a.mode = argv[1];
            if (a.mode == "-h" || a.mode == "--help" || a.mode == "help")
            {
                a.help = true;
                return a;
            }
            if (a.mode != "split" && a.mode != "restore")
            {
                usageError("Unknown subcommand: " + a.mode);
            }

            int i = 2;
            while (i < argc)
            {
                std::string f = argv[i++];
                auto next = [&](std::string &dst)
                {
                    if (i >= argc)
                    {
                        usageError("Missing value after " + f);
                    }
                    dst = argv[i++];
                };

                if (f == "-h" || f == "--help")
                    a.help = true;
                else if (f == "-o" || f == "--output-dir")
                    next(a.output_dir);
                else if (f == "--config")
                    next(a.config_path);
                else if (f == "-q" || f == "--quiet")
                    a.quiet = true;
                else if (f == "-j" || f == "--jobs")
                {
                    std::string v;
                    next(v);
                    uint64_t jobs = parseByteCount(v, f);
                    if (jobs == 0)
                    {
                        usageError("Value for " + f + " must be at least 1");
                    }
                    a.jobs = static_cast<size_t>(jobs);
                }
                else if (a.mode == "split" && (f == "-s" || f == "--size-limit"))
                {
                    std::string v;
                    next(v);
                    a.size_limit = parseByteCount(v, f);
                    if (*a.size_limit == 0)
                    {
                        usageError("Size limit must be greater than 0");
                    }
                }
                else if (a.mode == "split" && (f == "-c" || f == "--compress"))
                    a.compress = true;
                else if (a.mode == "restore" && (f == "-i" || f == "--input-dir"))
                    next(a.input_dir);
                else if (f.size() > 1 && f[0] == '-')
                    usageError("Unknown flag for " + a.mode + ": " + f);
                else
                    a.inputs.push_back(f);
            }

            if (!a.help && a.inputs.empty())
            {
                usageError(a.mode == "split" ? "No files to split" : "No manifests to restore");
            }
            if (a.output_dir.empty() || a.input_dir.empty())
            {
                usageError("Directory arguments must not be empty");
            }
            return a;
        }

    } // namespace Cli
} // namespace FileSplitter
