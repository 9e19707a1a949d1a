// src/split_config.cpp
#include "split_config.hpp"
#include "split_errors.hpp"

#include <fstream>
#include <initializer_list>
#include <iostream>
#include <thread>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace FileSplitter
{
    namespace Config
    {

        const std::string SplitConfig::PARTS_DIR_SUFFIX = "_parts";
        const std::string SplitConfig::MANIFEST_EXTENSION = ".json";
        const std::string SplitConfig::PARTIAL_SUFFIX = ".partial";

        SplitConfig SplitConfig::loadFromFile(const fs::path &config_path)
        {
            std::ifstream ifs(config_path);
            if (!ifs.is_open())
            {
                throw SplitError(ErrorKind::InvalidConfig, "Failed to open config file: " + config_path.string(), config_path);
            }

            nlohmann::json j;
            try
            {
                ifs >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw SplitError(ErrorKind::InvalidConfig, "Error parsing config file " + config_path.string() + ": " + e.what(), config_path);
            }

            if (!j.is_object())
            {
                throw SplitError(ErrorKind::InvalidConfig, "Config file must contain a JSON object: " + config_path.string(), config_path);
            }

            // Negative values would wrap around when converted to unsigned fields
            for (const char *key : {"size_limit", "chunk_workers", "file_workers", "server_port"})
            {
                if (j.contains(key) && !j.at(key).is_number_unsigned())
                {
                    throw SplitError(ErrorKind::InvalidConfig, std::string("'") + key + "' must be a non-negative integer in " + config_path.string(), config_path);
                }
            }

            SplitConfig config;
            try
            {
                if (j.contains("size_limit"))
                    j.at("size_limit").get_to(config.size_limit);
                if (j.contains("compress"))
                    j.at("compress").get_to(config.compress);
                if (j.contains("compression_level"))
                    j.at("compression_level").get_to(config.compression_level);
                if (j.contains("chunk_workers"))
                    j.at("chunk_workers").get_to(config.chunk_workers);
                if (j.contains("file_workers"))
                    j.at("file_workers").get_to(config.file_workers);
                if (j.contains("server_port"))
                    j.at("server_port").get_to(config.server_port);
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw SplitError(ErrorKind::InvalidConfig, "Wrong value type in config file " + config_path.string() + ": " + e.what(), config_path);
            }

            config.validate();
            std::cout << "Loaded configuration from " << config_path.string() << std::endl;
            return config;
        }

        void SplitConfig::validate() const
        {
            if (size_limit == 0)
            {
                throw SplitError(ErrorKind::InvalidConfig, "size_limit must be greater than 0");
            }
            if (compression_level < -1 || compression_level > 9)
            {
                throw SplitError(ErrorKind::InvalidConfig, "compression_level must be between -1 and 9, got " + std::to_string(compression_level));
            }
            if (chunk_workers == 0)
            {
                throw SplitError(ErrorKind::InvalidConfig, "chunk_workers must be at least 1");
            }
            if (file_workers == 0)
            {
                throw SplitError(ErrorKind::InvalidConfig, "file_workers must be at least 1");
            }
        }

        std::string SplitConfig::partsDirName(const std::string &source_filename)
        {
            return source_filename + PARTS_DIR_SUFFIX;
        }

        std::string SplitConfig::chunkFileName(const std::string &source_filename, uint64_t index)
        {
            std::string number = std::to_string(index + 1);
            if (number.size() < static_cast<size_t>(CHUNK_NUMBER_WIDTH))
            {
                number.insert(0, CHUNK_NUMBER_WIDTH - number.size(), '0');
            }
            return source_filename + "-" + number;
        }

        std::string SplitConfig::manifestFileName(const std::string &source_filename)
        {
            return source_filename + MANIFEST_EXTENSION;
        }

        fs::path SplitConfig::manifestPathFor(const fs::path &output_dir, const std::string &source_filename)
        {
            return output_dir / partsDirName(source_filename) / manifestFileName(source_filename);
        }

        fs::path SplitConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            try
            {
                if (!fs::exists(dir_path))
                {
                    if (fs::create_directories(dir_path))
                    {
                        std::cout << "Created directory: " << dir_path.string() << std::endl;
                    }
                    else if (!fs::exists(dir_path))
                    {
                        // Another process may have created it in the meantime; only fail if it's still missing.
                        throw SplitError(ErrorKind::IoError, "Failed to create directory: " + dir_path.string(), dir_path);
                    }
                }
                else if (!fs::is_directory(dir_path))
                {
                    throw SplitError(ErrorKind::IoError, "Path exists but is not a directory: " + dir_path.string(), dir_path);
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw SplitError(ErrorKind::IoError, "Filesystem error creating directory " + dir_path.string() + ": " + e.what(), dir_path);
            }
            return dir_path;
        }

        size_t SplitConfig::defaultFileWorkers()
        {
            const size_t hw = std::thread::hardware_concurrency();
            return hw == 0 ? 4 : hw;
        }

    } // namespace Config
} // namespace FileSplitter
