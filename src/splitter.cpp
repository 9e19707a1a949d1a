// src/splitter.cpp
#include "splitter.hpp"
#include "chunk.hpp"
#include "digest_utility.hpp"
#include "split_errors.hpp"

#include <algorithm>
#include <deque>
#include <fstream>
#include <future>
#include <iostream>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace FileSplitter
{
    namespace Engine
    {

        namespace
        {
            // Reads exactly length bytes at offset. The source is opened per window so no
            // handle stays open across the whole pass.
            std::vector<char> readWindow(const fs::path &source_path, uint64_t offset, uint64_t length)
            {
                std::ifstream ifs(source_path, std::ios::binary);
                if (!ifs.is_open())
                {
                    throw SplitError(ErrorKind::IoError, "Failed to open input file: " + source_path.string(), source_path);
                }
                ifs.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
                if (!ifs)
                {
                    throw SplitError(ErrorKind::IoError, "Failed to seek to offset " + std::to_string(offset) + " in " + source_path.string(), source_path);
                }

                std::vector<char> window(static_cast<size_t>(length));
                ifs.read(window.data(), static_cast<std::streamsize>(length));
                if (static_cast<uint64_t>(ifs.gcount()) != length)
                {
                    throw SplitError(ErrorKind::IoError,
                                     "Short read at offset " + std::to_string(offset) + " (source changed during split?): " + source_path.string(),
                                     source_path);
                }
                return window;
            }
        } // namespace

        Splitter::Splitter(SplitOptions split_options) : options(split_options)
        {
            if (options.chunk_workers == 0)
            {
                throw SplitError(ErrorKind::InvalidConfig, "chunk_workers must be at least 1");
            }
            if (options.chunk_workers > 1)
            {
                chunk_pool = std::make_unique<Concurrency::ThreadPool>(options.chunk_workers, "chunk-writer");
            }
        }

        Metadata::SplitManifest Splitter::split(const fs::path &source_path,
                                                uint64_t size_limit,
                                                const fs::path &output_dir,
                                                bool compress,
                                                Progress::ProgressReporter &progress,
                                                const Progress::CancellationToken *cancel)
        {
            // --- Argument checks, before anything touches the disk ---
            if (size_limit == 0)
            {
                throw SplitError(ErrorKind::InvalidConfig, "Size limit must be greater than 0", source_path);
            }
            if (source_path.empty())
            {
                throw SplitError(ErrorKind::InvalidConfig, "Source path is empty");
            }
            if (output_dir.empty())
            {
                throw SplitError(ErrorKind::InvalidConfig, "Output directory is empty", source_path);
            }
            if (compress && (options.compression_level < -1 || options.compression_level > 9))
            {
                throw SplitError(ErrorKind::InvalidConfig, "Compression level must be between -1 and 9", source_path);
            }

            std::error_code ec;
            if (!fs::exists(source_path, ec))
            {
                throw SplitError(ErrorKind::InvalidConfig, "Input file not found: " + source_path.string(), source_path);
            }
            if (!fs::is_regular_file(source_path, ec))
            {
                throw SplitError(ErrorKind::InvalidConfig, "Input is not a regular file: " + source_path.string(), source_path);
            }
            const std::string filename = source_path.filename().string();
            if (filename.empty() || filename == "." || filename == "..")
            {
                throw SplitError(ErrorKind::InvalidConfig, "Input path has no file name: " + source_path.string(), source_path);
            }
            // The name is recorded in the manifest, which nlohmann::json only writes as UTF-8
            try
            {
                static_cast<void>(nlohmann::json(filename).dump());
            }
            catch (const nlohmann::json::type_error &)
            {
                throw SplitError(ErrorKind::InvalidConfig, "Input file name is not valid UTF-8: " + source_path.string(), source_path);
            }

            const uint64_t file_size = fs::file_size(source_path, ec);
            if (ec)
            {
                throw SplitError(ErrorKind::IoError, "Failed to get size of " + source_path.string() + ": " + ec.message(), source_path);
            }

            std::cout << "Splitting file: " << source_path.string() << " (" << file_size << " bytes, limit " << size_limit
                      << (compress ? ", gzip" : "") << ")" << std::endl;

            const std::string parts_dir_name = Config::SplitConfig::partsDirName(filename);
            const fs::path parts_dir = Config::SplitConfig::ensureDirectoryExists(output_dir / parts_dir_name);
            const int level = options.compression_level;

            // Compress, hash and write one window. Runs inline or on the chunk pool.
            auto storeWindow = [compress, level, parts_dir, parts_dir_name, filename](uint64_t index, const std::vector<char> &window)
            {
                Chunks::Chunk chunk(index, window, compress, level);
                const std::string chunk_name = Config::SplitConfig::chunkFileName(filename, index);
                chunk.save(parts_dir / chunk_name);
                return chunk.describe((fs::path(parts_dir_name) / chunk_name).generic_string());
            };

            Digest::StreamingDigest whole_file_digest;
            std::vector<Metadata::ChunkDescriptor> descriptors;

            // Ordered completion buffer: futures are collected front to back, so descriptors
            // land in sequence order whatever order the workers finish in.
            std::deque<std::future<Metadata::ChunkDescriptor>> in_flight;
            const size_t max_in_flight = chunk_pool ? 2 * chunk_pool->workerCount() : 0;

            try
            {
                uint64_t offset = 0;
                uint64_t index = 0;
                while (offset < file_size)
                {
                    if (cancel != nullptr && cancel->isCancelled())
                    {
                        throw SplitError(ErrorKind::Cancelled, "Split cancelled: " + source_path.string(), source_path, index);
                    }

                    const uint64_t length = std::min(size_limit, file_size - offset);
                    std::vector<char> window = readWindow(source_path, offset, length);
                    whole_file_digest.update(window);
                    offset += length;

                    if (chunk_pool)
                    {
                        in_flight.push_back(chunk_pool->enqueue(
                            [storeWindow, index, window = std::move(window)]()
                            { return storeWindow(index, window); }));
                        while (in_flight.size() >= max_in_flight)
                        {
                            descriptors.push_back(in_flight.front().get());
                            in_flight.pop_front();
                        }
                    }
                    else
                    {
                        descriptors.push_back(storeWindow(index, window));
                    }

                    progress.report(offset, file_size);
                    ++index;
                }

                while (!in_flight.empty())
                {
                    descriptors.push_back(in_flight.front().get());
                    in_flight.pop_front();
                }
            }
            catch (const std::exception &e)
            {
                // Let in-flight writes finish before the error leaves this pass
                for (auto &pending : in_flight)
                {
                    if (pending.valid())
                    {
                        pending.wait();
                    }
                }
                std::cerr << "Error splitting file '" << source_path.string() << "': " << e.what() << std::endl;
                throw;
            }

            if (file_size == 0)
            {
                progress.report(0, 0);
            }

            Metadata::SplitManifest manifest;
            manifest.original_filename = filename;
            manifest.original_file_size = file_size;
            manifest.size_limit = size_limit;
            manifest.is_compressed = compress;
            manifest.original_checksum = whole_file_digest.finalizeHex();
            manifest.created_at = Metadata::SplitManifest::currentTimestamp();
            manifest.chunks = std::move(descriptors);

            const fs::path manifest_path = parts_dir / Config::SplitConfig::manifestFileName(filename);
            Metadata::ManifestCodec::save(manifest, manifest_path);

            std::cout << "File '" << filename << "' split into " << manifest.chunks.size() << " chunks, manifest: "
                      << manifest_path.string() << std::endl;
            return manifest;
        }

    } // namespace Engine
} // namespace FileSplitter
