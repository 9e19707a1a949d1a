// include/split_errors.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace FileSplitter
{

    enum class ErrorKind
    {
        InvalidConfig,
        IoError,
        InvalidManifest,
        CorruptManifest,
        MissingChunk,
        ChunkIntegrityError,
        DecompressionError,
        IntegrityError,
        Cancelled
    };

    // Short, stable name of an error kind ("MissingChunk", ...)
    const char *errorKindName(ErrorKind kind);

    // Every failure of the split/restore pipeline surfaces as a SplitError.
    // It names the offending path and, for restoration problems, the chunk index.
    class SplitError : public std::runtime_error
    {
    public:
        SplitError(ErrorKind kind,
                   const std::string &message,
                   std::filesystem::path path = {},
                   std::optional<uint64_t> chunk_index = std::nullopt);

        ErrorKind kind() const { return kind_; }
        const std::filesystem::path &path() const { return path_; }
        const std::optional<uint64_t> &chunkIndex() const { return chunk_index_; }

        // The message without the "<Kind>[ chunk N]: " prefix
        const std::string &detail() const { return detail_; }

    private:
        ErrorKind kind_;
        std::filesystem::path path_;
        std::optional<uint64_t> chunk_index_;
        std::string detail_;
    };

} // namespace FileSplitter
