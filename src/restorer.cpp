// src/restorer.cpp
#include "restorer.hpp"
#include "chunk.hpp"
#include "digest_utility.hpp"
#include "gzip_codec.hpp"
#include "split_config.hpp"
#include "split_errors.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>

#include <fcntl.h>  // open, O_EXCL
#include <unistd.h> // close, getpid

namespace fs = std::filesystem;

namespace FileSplitter
{
    namespace Engine
    {

        namespace
        {
            // Sequence part of partial names, unique within the process
            std::atomic<uint64_t> partial_counter{0};

            const int MAX_PARTIAL_ATTEMPTS = 16;

            // Owns "<name>.<pid>-<n>.partial" until commit() moves it to its final name.
            // Each restore gets its own file, so two restores of the same name into one
            // directory never append to each other's output.
            // Anything still uncommitted when the restore unwinds is deleted.
            class PartialOutput
            {
            public:
                explicit PartialOutput(fs::path target) : final_path(std::move(target)) {}

                ~PartialOutput()
                {
                    if (!created || committed)
                    {
                        return;
                    }
                    std::error_code ec;
                    fs::remove(path, ec);
                    if (ec)
                    {
                        std::cerr << "Warning: could not remove incomplete output " << path.string() << ": " << ec.message() << std::endl;
                    }
                }

                PartialOutput(const PartialOutput &) = delete;
                PartialOutput &operator=(const PartialOutput &) = delete;

                // Creates the partial file exclusively; an existing file of the same name is never reused
                void create()
                {
                    for (int attempt = 0; attempt < MAX_PARTIAL_ATTEMPTS; ++attempt)
                    {
                        fs::path candidate = final_path;
                        candidate += "." + std::to_string(::getpid()) + "-" + std::to_string(partial_counter++) +
                                     Config::SplitConfig::PARTIAL_SUFFIX;

                        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0644);
                        if (fd >= 0)
                        {
                            ::close(fd);
                            path = candidate;
                            created = true;
                            return;
                        }
                        const int err = errno;
                        if (err != EEXIST)
                        {
                            throw SplitError(ErrorKind::IoError,
                                             "Failed to create output file " + candidate.string() + ": " + std::strerror(err),
                                             candidate);
                        }
                    }
                    throw SplitError(ErrorKind::IoError, "Could not find a free partial file name next to " + final_path.string(), final_path);
                }

                void append(const std::vector<char> &bytes, uint64_t index)
                {
                    std::ofstream ofs(path, std::ios::binary | std::ios::app);
                    if (!ofs.is_open())
                    {
                        throw SplitError(ErrorKind::IoError, "Failed to reopen output file: " + path.string(), path, index);
                    }
                    ofs.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
                    ofs.flush();
                    if (!ofs.good())
                    {
                        throw SplitError(ErrorKind::IoError, "Failed to write chunk data to output file: " + path.string(), path, index);
                    }
                }

                void commit()
                {
                    std::error_code ec;
                    fs::rename(path, final_path, ec);
                    if (ec)
                    {
                        throw SplitError(ErrorKind::IoError, "Failed to move " + path.string() + " to " + final_path.string() + ": " + ec.message(), final_path);
                    }
                    committed = true;
                }

            private:
                fs::path final_path;
                fs::path path;
                bool created = false;
                bool committed = false;
            };

            bool sameDigest(const std::string &recorded, const std::string &actual)
            {
                return recorded.size() == actual.size() &&
                       std::equal(recorded.begin(), recorded.end(), actual.begin(),
                                  [](char a, char b)
                                  { return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b)); });
            }
        } // namespace

        fs::path Restorer::restore(const fs::path &manifest_path,
                                   const fs::path &chunk_dir,
                                   const fs::path &output_dir,
                                   Progress::ProgressReporter &progress,
                                   const Progress::CancellationToken *cancel)
        {
            std::cout << "Reading manifest: " << manifest_path.string() << std::endl;
            Metadata::SplitManifest manifest = Metadata::ManifestCodec::load(manifest_path);
            return restore(manifest, chunk_dir, output_dir, progress, cancel);
        }

        fs::path Restorer::restore(const Metadata::SplitManifest &manifest,
                                   const fs::path &chunk_dir,
                                   const fs::path &output_dir,
                                   Progress::ProgressReporter &progress,
                                   const Progress::CancellationToken *cancel)
        {
            Metadata::ManifestCodec::validate(manifest);
            if (chunk_dir.empty())
            {
                throw SplitError(ErrorKind::InvalidConfig, "Chunk directory is empty");
            }
            if (output_dir.empty())
            {
                throw SplitError(ErrorKind::InvalidConfig, "Output directory is empty");
            }

            std::cout << "Restoring file: " << manifest.original_filename << " (" << manifest.chunks.size() << " chunks"
                      << (manifest.is_compressed ? ", gzip" : "") << ")" << std::endl;

            Config::SplitConfig::ensureDirectoryExists(output_dir);
            const fs::path final_path = output_dir / manifest.original_filename;

            // Reassembly order is the sequence index, not the order entries appear in the JSON
            std::vector<Metadata::ChunkDescriptor> ordered = manifest.chunks;
            std::sort(ordered.begin(), ordered.end(),
                      [](const Metadata::ChunkDescriptor &a, const Metadata::ChunkDescriptor &b)
                      { return a.index < b.index; });

            const uint64_t total = manifest.original_file_size;
            Digest::StreamingDigest whole_file_digest;
            uint64_t written = 0;

            PartialOutput output(final_path);
            try
            {
                output.create();

                for (const auto &descriptor : ordered)
                {
                    const uint64_t index = descriptor.index;
                    if (cancel != nullptr && cancel->isCancelled())
                    {
                        throw SplitError(ErrorKind::Cancelled, "Restore cancelled: " + manifest.original_filename, final_path, index);
                    }

                    const fs::path chunk_path = chunk_dir / descriptor.chunk_path;
                    std::error_code ec;
                    if (!fs::is_regular_file(chunk_path, ec))
                    {
                        throw SplitError(ErrorKind::MissingChunk, "Chunk file not found: " + chunk_path.string(), chunk_path, index);
                    }

                    // Size is checked before reading so a swapped-in huge file is never loaded
                    const uint64_t on_disk = fs::file_size(chunk_path, ec);
                    if (ec)
                    {
                        throw SplitError(ErrorKind::IoError, "Failed to get size of chunk file " + chunk_path.string() + ": " + ec.message(), chunk_path, index);
                    }
                    if (on_disk != descriptor.stored_size)
                    {
                        throw SplitError(ErrorKind::ChunkIntegrityError,
                                         "Stored size mismatch: expected " + std::to_string(descriptor.stored_size) + " bytes, found " + std::to_string(on_disk),
                                         chunk_path, index);
                    }

                    std::vector<char> stored = Chunks::Chunk::loadData(chunk_path);
                    if (stored.size() != descriptor.stored_size)
                    {
                        throw SplitError(ErrorKind::ChunkIntegrityError, "Chunk file changed while it was being read", chunk_path, index);
                    }
                    const std::string stored_checksum = Digest::DigestUtility::sha256Hex(stored);
                    if (!sameDigest(descriptor.checksum, stored_checksum))
                    {
                        throw SplitError(ErrorKind::ChunkIntegrityError,
                                         "Checksum mismatch: expected " + descriptor.checksum + ", actual " + stored_checksum,
                                         chunk_path, index);
                    }

                    std::vector<char> original;
                    if (manifest.is_compressed)
                    {
                        try
                        {
                            original = Compression::GzipCodec::decompress(stored, static_cast<size_t>(descriptor.original_size));
                        }
                        catch (const Compression::GzipError &e)
                        {
                            throw SplitError(ErrorKind::DecompressionError, e.what(), chunk_path, index);
                        }
                    }
                    else
                    {
                        original = std::move(stored);
                    }

                    if (original.size() != descriptor.original_size)
                    {
                        throw SplitError(ErrorKind::ChunkIntegrityError,
                                         "Original size mismatch: expected " + std::to_string(descriptor.original_size) + " bytes, got " + std::to_string(original.size()),
                                         chunk_path, index);
                    }
                    if (!descriptor.original_checksum.empty() &&
                        !sameDigest(descriptor.original_checksum, Digest::DigestUtility::sha256Hex(original)))
                    {
                        throw SplitError(ErrorKind::ChunkIntegrityError, "Checksum mismatch on the uncompressed chunk data", chunk_path, index);
                    }

                    output.append(original, index);
                    whole_file_digest.update(original);
                    written += original.size();
                    progress.report(written, total);
                }

                if (ordered.empty())
                {
                    progress.report(0, 0);
                }

                output.commit();
            }
            catch (const SplitError &e)
            {
                std::cerr << "Error restoring file '" << manifest.original_filename << "': " << e.what() << std::endl;
                throw;
            }

            const std::string actual_checksum = whole_file_digest.finalizeHex();
            if (!sameDigest(manifest.original_checksum, actual_checksum))
            {
                std::cerr << "Whole-file checksum mismatch for restored file '" << final_path.string() << "'! Expected: "
                          << manifest.original_checksum << ", Actual: " << actual_checksum << std::endl;
                throw SplitError(ErrorKind::IntegrityError,
                                 "Restored file checksum mismatch: expected " + manifest.original_checksum + ", actual " + actual_checksum,
                                 final_path);
            }

            std::cout << "File '" << manifest.original_filename << "' restored to '" << final_path.string() << "' successfully." << std::endl;
            return final_path;
        }

    } // namespace Engine
} // namespace FileSplitter
