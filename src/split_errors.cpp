// src/split_errors.cpp
#include "split_errors.hpp"

namespace FileSplitter
{

    namespace
    {
        std::string formatMessage(ErrorKind kind, const std::string &message, const std::optional<uint64_t> &chunk_index)
        {
            std::string text = errorKindName(kind);
            if (chunk_index)
            {
                text += " chunk " + std::to_string(*chunk_index);
            }
            text += ": ";
            text += message;
            return text;
        }
    } // namespace

    const char *errorKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::InvalidConfig:
            return "InvalidConfig";
        case ErrorKind::IoError:
            return "IoError";
        case ErrorKind::InvalidManifest:
            return "InvalidManifest";
        case ErrorKind::CorruptManifest:
            return "CorruptManifest";
        case ErrorKind::MissingChunk:
            return "MissingChunk";
        case ErrorKind::ChunkIntegrityError:
            return "ChunkIntegrityError";
        case ErrorKind::DecompressionError:
            return "DecompressionError";
        case ErrorKind::IntegrityError:
            return "IntegrityError";
        case ErrorKind::Cancelled:
            return "Cancelled";
        }
        return "Unknown";
    }

    SplitError::SplitError(ErrorKind kind,
                           const std::string &message,
                           std::filesystem::path path,
                           std::optional<uint64_t> chunk_index)
        : std::runtime_error(formatMessage(kind, message, chunk_index)),
          kind_(kind),
          path_(std::move(path)),
          chunk_index_(chunk_index),
          detail_(message)
    {
    }

} // namespace FileSplitter
