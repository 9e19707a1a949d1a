// src/chunk.cpp
#include "chunk.hpp"
#include "digest_utility.hpp"
#include "gzip_codec.hpp"
#include "split_errors.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace FileSplitter
{
    namespace Chunks
    {

        Chunk::Chunk(uint64_t chunk_index, const std::vector<char> &window, bool compress, int compression_level)
            : index(chunk_index), original_size(window.size())
        {
            original_checksum = Digest::DigestUtility::sha256Hex(window);
            if (compress)
            {
                try
                {
                    data = Compression::GzipCodec::compress(window, compression_level);
                }
                catch (const Compression::GzipError &e)
                {
                    throw SplitError(ErrorKind::IoError, std::string("Failed to compress chunk: ") + e.what(), {}, chunk_index);
                }
                checksum = Digest::DigestUtility::sha256Hex(data);
            }
            else
            {
                data = window;
                checksum = original_checksum;
            }
        }

        void Chunk::save(const fs::path &chunk_path) const
        {
            std::ofstream ofs(chunk_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw SplitError(ErrorKind::IoError, "Failed to open file for writing chunk: " + chunk_path.string(), chunk_path, index);
            }
            ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
            ofs.flush();
            if (!ofs.good())
            {
                throw SplitError(ErrorKind::IoError, "Failed to write all data to chunk file: " + chunk_path.string(), chunk_path, index);
            }
        }

        std::vector<char> Chunk::loadData(const fs::path &chunk_path)
        {
            std::ifstream ifs(chunk_path, std::ios::binary | std::ios::ate);
            if (!ifs.is_open())
            {
                throw SplitError(ErrorKind::IoError, "Failed to open chunk file for reading: " + chunk_path.string(), chunk_path);
            }

            std::streamsize size = ifs.tellg();
            if (size == -1)
            {
                throw SplitError(ErrorKind::IoError, "Failed to get size of chunk file: " + chunk_path.string(), chunk_path);
            }
            ifs.seekg(0, std::ios::beg);

            std::vector<char> buffer(static_cast<size_t>(size));
            if (size > 0 && !ifs.read(buffer.data(), size))
            {
                throw SplitError(ErrorKind::IoError, "Failed to read all data from chunk file: " + chunk_path.string(), chunk_path);
            }
            return buffer;
        }

        Metadata::ChunkDescriptor Chunk::describe(const std::string &relative_path) const
        {
            Metadata::ChunkDescriptor descriptor;
            descriptor.index = index;
            descriptor.chunk_path = relative_path;
            descriptor.stored_size = data.size();
            descriptor.original_size = original_size;
            descriptor.checksum = checksum;
            descriptor.original_checksum = original_checksum;
            return descriptor;
        }

    } // namespace Chunks
} // namespace FileSplitter
