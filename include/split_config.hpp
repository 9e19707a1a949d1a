// include/split_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <cstdint>
#include <filesystem> // For std::filesystem::path

namespace FileSplitter
{
    namespace Config
    {

        class SplitConfig
        {
        public:
            // Default size of each part (100MB)
            static constexpr uint64_t DEFAULT_SIZE_LIMIT = 100ULL * 1024 * 1024;

            // zlib's own "default" level
            static constexpr int DEFAULT_COMPRESSION_LEVEL = -1;

            static constexpr unsigned short DEFAULT_SERVER_PORT = 8080;

            // Minimum digits of the 1-based part number in chunk file names
            static constexpr int CHUNK_NUMBER_WIDTH = 3;

            // Suffixes used to derive names from the source file name
            static const std::string PARTS_DIR_SUFFIX;
            static const std::string MANIFEST_EXTENSION;
            static const std::string PARTIAL_SUFFIX;

            uint64_t size_limit = DEFAULT_SIZE_LIMIT;
            bool compress = false;
            int compression_level = DEFAULT_COMPRESSION_LEVEL;
            size_t chunk_workers = 1;
            size_t file_workers = defaultFileWorkers();
            unsigned short server_port = DEFAULT_SERVER_PORT;

            SplitConfig() = default;

            // Load settings from a JSON file. Keys that are absent keep their defaults,
            // unknown keys are ignored. Throws SplitError(InvalidConfig) on bad input.
            static SplitConfig loadFromFile(const std::filesystem::path &config_path);

            // Throws SplitError(InvalidConfig) if a setting is out of range
            void validate() const;

            // "<name>_parts"
            static std::string partsDirName(const std::string &source_filename);

            // "<name>-001" for index 0
            static std::string chunkFileName(const std::string &source_filename, uint64_t index);

            // "<name>.json"
            static std::string manifestFileName(const std::string &source_filename);

            // <output_dir>/<name>_parts/<name>.json
            static std::filesystem::path manifestPathFor(const std::filesystem::path &output_dir,
                                                         const std::string &source_filename);

            // Creates the directory (and parents) if it doesn't exist.
            // Throws SplitError(IoError) when it can't be created.
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);

            static size_t defaultFileWorkers();
        };

    } // namespace Config
} // namespace FileSplitter
