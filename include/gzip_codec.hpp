// include/gzip_codec.hpp
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace FileSplitter
{
    namespace Compression
    {

        // Raised for any zlib failure: bad level, corrupt or truncated input,
        // trailing bytes after the gzip member, oversized output.
        class GzipError : public std::runtime_error
        {
        public:
            explicit GzipError(const std::string &message) : std::runtime_error(message) {}
        };

        // Whole-buffer gzip (RFC 1952) compression of a single window.
        // Chunk files carry no header of their own, the gzip member is the whole file.
        class GzipCodec
        {
        public:
            static std::vector<char> compress(const std::vector<char> &input, int level);

            // Inflates one gzip member. Fails if the result would exceed max_output bytes.
            static std::vector<char> decompress(const std::vector<char> &input, size_t max_output);

        private:
            static const size_t BUFFER_SIZE = 16384;
        };

    } // namespace Compression
} // namespace FileSplitter
