// include/digest_utility.hpp
#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <filesystem>

#include <openssl/sha.h>

namespace FileSplitter
{
    namespace Digest
    {

        class DigestUtility
        {
        public:
            // SHA-256 of the buffer as a lowercase hex string (64 characters).
            static std::string sha256Hex(const std::vector<char> &data_buffer);
            static std::string sha256Hex(const char *data, size_t length);

            // SHA-256 of a file's contents, read in small blocks.
            // Throws SplitError(IoError) if the file can't be read.
            static std::string sha256File(const std::filesystem::path &file_path);

            // True if the text looks like a hex encoded SHA-256 digest
            static bool isHexDigest(const std::string &text);

            static std::string toHex(const unsigned char *bytes, size_t length);
        };

        // Incremental SHA-256 state. Fed window by window so the whole-file digest
        // never needs the whole file in memory.
        class StreamingDigest
        {
        public:
            StreamingDigest();

            void update(const char *data, size_t length);
            void update(const std::vector<char> &data_buffer);

            // Finishes the hash. The object can't be updated or finalized again afterwards.
            std::string finalizeHex();

            uint64_t bytesProcessed() const { return bytes_processed; }

        private:
            SHA256_CTX context;
            uint64_t bytes_processed;
            bool finalized;
        };

    } // namespace Digest
} // namespace FileSplitter
