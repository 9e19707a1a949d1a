// include/chunk.hpp
#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <filesystem>

#include "split_manifest.hpp"

namespace FileSplitter {
namespace Chunks {

class Chunk {
public:
    uint64_t index = 0;             // Sequence index within the split
    std::vector<char> data;         // Stored bytes (gzip member when compressed)
    uint64_t original_size = 0;     // Length of the source window
    std::string checksum;           // SHA-256 of the stored bytes
    std::string original_checksum;  // SHA-256 of the source window

    // Build a chunk from one source window: compress it if asked and compute both digests.
    Chunk(uint64_t chunk_index, const std::vector<char>& window, bool compress, int compression_level);

    // Default constructor for loading
    Chunk() = default;

    // Write the stored bytes to chunk_path. The file handle lives only for this call.
    // Throws SplitError(IoError) on failure.
    void save(const std::filesystem::path& chunk_path) const;

    // Read a whole chunk file. Throws SplitError(IoError) on failure.
    static std::vector<char> loadData(const std::filesystem::path& chunk_path);

    // Manifest entry for this chunk, stored under relative_path
    Metadata::ChunkDescriptor describe(const std::string& relative_path) const;
};

} // namespace Chunks
} // namespace FileSplitter
