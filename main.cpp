// main.cpp
#include <iostream>
#include <vector>
#include <string>
#include <filesystem>

// Our project includes
#include "batch_runner.hpp"
#include "cli_options.hpp"
#include "console_progress.hpp"
#include "split_config.hpp"
#include "split_errors.hpp"

namespace fs = std::filesystem;

using FileSplitter::SplitError;
using FileSplitter::Batch::BatchRunner;
using FileSplitter::Batch::FileOutcome;
using FileSplitter::Config::SplitConfig;

namespace {

const int EXIT_ALL_OK = 0;
const int EXIT_SOME_FAILED = 1;
const int EXIT_USAGE = 2;

// Config file first, then whatever the command line overrides
SplitConfig resolveConfig(const FileSplitter::Cli::Args& args) {
    SplitConfig config;
    if (!args.config_path.empty()) {
        config = SplitConfig::loadFromFile(args.config_path);
    }
    if (args.size_limit) {
        config.size_limit = *args.size_limit;
    }
    if (args.jobs) {
        config.file_workers = *args.jobs;
    }
    if (args.compress) {
        config.compress = true;
    }
    config.validate();
    return config;
}

void printSummary(const std::vector<FileOutcome>& outcomes) {
    size_t failed = 0;
    for (const auto& outcome : outcomes) {
        if (outcome.success) {
            std::cout << "OK     " << outcome.input.string() << " -> " << outcome.output.string() << std::endl;
        } else {
            ++failed;
            std::cout << "FAILED " << outcome.input.string() << ": " << outcome.message << std::endl;
        }
    }
    std::cout << (outcomes.size() - failed) << " of " << outcomes.size() << " file(s) succeeded" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    FileSplitter::Cli::Args args;
    SplitConfig config;
    try {
        args = FileSplitter::Cli::parseArgs(argc, argv);
        if (args.help) {
            std::cout << FileSplitter::Cli::usage();
            return EXIT_ALL_OK;
        }
        config = resolveConfig(args);
    } catch (const SplitError& e) {
        std::cerr << e.detail() << "\n\n" << FileSplitter::Cli::usage();
        return EXIT_USAGE;
    }

    std::vector<fs::path> inputs(args.inputs.begin(), args.inputs.end());

    // Progress goes to stderr so stdout stays a clean per-file summary
    FileSplitter::Cli::ConsoleProgress console(std::cerr, !args.quiet);
    auto reporters = [&console](const fs::path& input) { return console.reporterFor(input); };

    try {
        BatchRunner runner(config);
        std::vector<FileOutcome> outcomes;
        if (args.mode == "split") {
            outcomes = runner.splitAll(inputs, config.size_limit, args.output_dir, config.compress, reporters);
        } else {
            outcomes = runner.restoreAll(inputs, args.input_dir, args.output_dir, reporters);
        }
        printSummary(outcomes);
        return BatchRunner::allSucceeded(outcomes) ? EXIT_ALL_OK : EXIT_SOME_FAILED;
    } catch (const SplitError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return e.kind() == FileSplitter::ErrorKind::InvalidConfig ? EXIT_USAGE : EXIT_SOME_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_SOME_FAILED;
    }
}
