// src/digest_utility.cpp
#include "digest_utility.hpp"
#include "split_errors.hpp"

#include <cctype>
#include <fstream>
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::logic_error

namespace FileSplitter
{
    namespace Digest
    {

        namespace
        {
            const size_t FILE_READ_BLOCK = 8192;
        }

        std::string DigestUtility::toHex(const unsigned char *bytes, size_t length)
        {
            std::stringstream ss;
            for (size_t i = 0; i < length; i++)
            {
                ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
            }
            return ss.str();
        }

        std::string DigestUtility::sha256Hex(const std::vector<char> &data_buffer)
        {
            return sha256Hex(data_buffer.data(), data_buffer.size());
        }

        std::string DigestUtility::sha256Hex(const char *data, size_t length)
        {
            StreamingDigest digest;
            digest.update(data, length);
            return digest.finalizeHex();
        }

        std::string DigestUtility::sha256File(const std::filesystem::path &file_path)
        {
            std::ifstream ifs(file_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw SplitError(ErrorKind::IoError, "Failed to open file to calculate checksum: " + file_path.string(), file_path);
            }

            StreamingDigest digest;
            std::vector<char> buffer(FILE_READ_BLOCK);
            while (ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || ifs.gcount() > 0)
            {
                digest.update(buffer.data(), static_cast<size_t>(ifs.gcount()));
            }
            if (ifs.bad())
            {
                throw SplitError(ErrorKind::IoError, "Failed to read file to calculate checksum: " + file_path.string(), file_path);
            }
            return digest.finalizeHex();
        }

        bool DigestUtility::isHexDigest(const std::string &text)
        {
            if (text.size() != static_cast<size_t>(SHA256_DIGEST_LENGTH) * 2)
            {
                return false;
            }
            for (char c : text)
            {
                if (!std::isxdigit(static_cast<unsigned char>(c)))
                {
                    return false;
                }
            }
            return true;
        }

        StreamingDigest::StreamingDigest() : bytes_processed(0), finalized(false)
        {
            if (!SHA256_Init(&context))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
        }

        void StreamingDigest::update(const char *data, size_t length)
        {
            if (finalized)
            {
                throw std::logic_error("StreamingDigest updated after finalizeHex()");
            }
            if (length == 0)
            {
                return;
            }
            if (!SHA256_Update(&context, data, length))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
            bytes_processed += length;
        }

        void StreamingDigest::update(const std::vector<char> &data_buffer)
        {
            update(data_buffer.data(), data_buffer.size());
        }

        std::string StreamingDigest::finalizeHex()
        {
            if (finalized)
            {
                throw std::logic_error("StreamingDigest finalized twice");
            }
            unsigned char hash[SHA256_DIGEST_LENGTH];
            if (!SHA256_Final(hash, &context))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            finalized = true;
            return DigestUtility::toHex(hash, SHA256_DIGEST_LENGTH);
        }

    } // namespace Digest
} // namespace FileSplitter
