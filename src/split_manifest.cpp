// src/split_manifest.cpp
#include "split_manifest.hpp"
#include "digest_utility.hpp"
#include "split_errors.hpp"

#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream> // For logging
#include <sstream>

namespace fs = std::filesystem;

namespace FileSplitter
{
    namespace Metadata
    {

        namespace
        {
            // Sizes and indices are stored as plain JSON integers; reject negatives and
            // fractions here instead of letting them wrap on conversion.
            void requireUnsigned(const nlohmann::json &j, const char *key)
            {
                const nlohmann::json &value = j.at(key);
                if (!value.is_number_unsigned())
                {
                    throw SplitError(ErrorKind::InvalidManifest, std::string("Field '") + key + "' must be a non-negative integer");
                }
            }

            void requireString(const nlohmann::json &j, const char *key)
            {
                if (!j.at(key).is_string())
                {
                    throw SplitError(ErrorKind::InvalidManifest, std::string("Field '") + key + "' must be a string");
                }
            }

            void corrupt(const std::string &message, std::optional<uint64_t> index = std::nullopt)
            {
                throw SplitError(ErrorKind::CorruptManifest, message, {}, index);
            }

            bool isSafeRelativePath(const std::string &text)
            {
                if (text.empty())
                {
                    return false;
                }
                fs::path p(text);
                if (p.has_root_path() || p.is_absolute())
                {
                    return false;
                }
                for (const auto &part : p)
                {
                    if (part == "..")
                    {
                        return false;
                    }
                }
                return true;
            }

            bool isPlainFileName(const std::string &name)
            {
                if (name.empty() || name == "." || name == "..")
                {
                    return false;
                }
                return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
            }
        } // namespace

        void to_json(nlohmann::json &j, const ChunkDescriptor &c)
        {
            j = nlohmann::json{
                {"index", c.index},
                {"chunk_path", c.chunk_path},
                {"stored_size", c.stored_size},
                {"original_size", c.original_size},
                {"checksum", c.checksum}};
            if (!c.original_checksum.empty())
            {
                j["original_checksum"] = c.original_checksum;
            }
        }

        void from_json(const nlohmann::json &j, ChunkDescriptor &c)
        {
            if (!j.is_object())
            {
                throw SplitError(ErrorKind::InvalidManifest, "Chunk entry must be a JSON object");
            }
            requireUnsigned(j, "index");
            requireUnsigned(j, "stored_size");
            requireUnsigned(j, "original_size");
            requireString(j, "chunk_path");
            requireString(j, "checksum");

            j.at("index").get_to(c.index);
            j.at("chunk_path").get_to(c.chunk_path);
            j.at("stored_size").get_to(c.stored_size);
            j.at("original_size").get_to(c.original_size);
            j.at("checksum").get_to(c.checksum);
            c.original_checksum = j.value("original_checksum", std::string());
        }

        void to_json(nlohmann::json &j, const SplitManifest &m)
        {
            j = nlohmann::json{
                {"schema_version", m.schema_version},
                {"original_filename", m.original_filename},
                {"original_file_size", m.original_file_size},
                {"size_limit", m.size_limit},
                {"is_compressed", m.is_compressed},
                {"original_checksum", m.original_checksum},
                {"created_at", m.created_at},
                {"chunks", m.chunks}};
        }

        void from_json(const nlohmann::json &j, SplitManifest &m)
        {
            if (!j.is_object())
            {
                throw SplitError(ErrorKind::InvalidManifest, "Manifest must be a JSON object");
            }
            requireString(j, "original_filename");
            requireUnsigned(j, "original_file_size");
            requireUnsigned(j, "size_limit");
            requireString(j, "original_checksum");
            requireString(j, "created_at");
            if (!j.at("is_compressed").is_boolean())
            {
                throw SplitError(ErrorKind::InvalidManifest, "Field 'is_compressed' must be a boolean");
            }
            if (!j.at("chunks").is_array())
            {
                throw SplitError(ErrorKind::InvalidManifest, "Field 'chunks' must be an array");
            }

            m.schema_version = j.value("schema_version", SplitManifest::CURRENT_SCHEMA_VERSION);
            j.at("original_filename").get_to(m.original_filename);
            j.at("original_file_size").get_to(m.original_file_size);
            j.at("size_limit").get_to(m.size_limit);
            j.at("is_compressed").get_to(m.is_compressed);
            j.at("original_checksum").get_to(m.original_checksum);
            j.at("created_at").get_to(m.created_at);
            j.at("chunks").get_to(m.chunks);
        }

        uint64_t SplitManifest::totalStoredSize() const
        {
            uint64_t total = 0;
            for (const auto &chunk : chunks)
            {
                total += chunk.stored_size;
            }
            return total;
        }

        std::string SplitManifest::currentTimestamp()
        {
            auto now = std::chrono::system_clock::now();
            std::time_t now_c = std::chrono::system_clock::to_time_t(now);
            std::tm utc{};
            // Pipelines run concurrently, std::gmtime's buffer is shared
#ifdef _WIN32
            gmtime_s(&utc, &now_c);
#else
            gmtime_r(&now_c, &utc);
#endif
            char buf[32];
            // Format as YYYY-MM-DDTHH:MM:SSZ
            std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return buf;
        }

        nlohmann::json ManifestCodec::toJson(const SplitManifest &manifest)
        {
            return manifest; // Uses the to_json helper function
        }

        SplitManifest ManifestCodec::fromJson(const nlohmann::json &j)
        {
            SplitManifest manifest;
            try
            {
                j.get_to(manifest); // Uses the from_json helper function
            }
            catch (const nlohmann::json::out_of_range &e)
            {
                throw SplitError(ErrorKind::InvalidManifest, std::string("Missing required field: ") + e.what());
            }
            catch (const nlohmann::json::type_error &e)
            {
                throw SplitError(ErrorKind::InvalidManifest, std::string("Wrong field type: ") + e.what());
            }
            return manifest;
        }

        std::string ManifestCodec::encode(const SplitManifest &manifest)
        {
            try
            {
                return toJson(manifest).dump(4); // Pretty print with 4 spaces
            }
            catch (const nlohmann::json::type_error &e)
            {
                // dump() rejects strings that aren't valid UTF-8, e.g. some file names
                throw SplitError(ErrorKind::InvalidManifest, std::string("Manifest can't be encoded as JSON: ") + e.what());
            }
        }

        SplitManifest ManifestCodec::decode(const std::string &text)
        {
            nlohmann::json j;
            try
            {
                j = nlohmann::json::parse(text);
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw SplitError(ErrorKind::InvalidManifest, std::string("Error parsing manifest JSON: ") + e.what());
            }
            return fromJson(j);
        }

        void ManifestCodec::save(const SplitManifest &manifest, const fs::path &manifest_path)
        {
            std::ofstream ofs(manifest_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw SplitError(ErrorKind::IoError, "Failed to open file for writing manifest: " + manifest_path.string(), manifest_path);
            }
            ofs << encode(manifest) << '\n';
            ofs.flush();
            if (!ofs.good())
            {
                throw SplitError(ErrorKind::IoError, "Failed to write all data to manifest file: " + manifest_path.string(), manifest_path);
            }
        }

        SplitManifest ManifestCodec::load(const fs::path &manifest_path)
        {
            std::error_code ec;
            if (!fs::is_regular_file(manifest_path, ec))
            {
                throw SplitError(ErrorKind::InvalidManifest, "Manifest file not found: " + manifest_path.string(), manifest_path);
            }

            std::ifstream ifs(manifest_path, std::ios::binary);
            if (!ifs.is_open())
            {
                throw SplitError(ErrorKind::InvalidManifest, "Failed to open manifest file for reading: " + manifest_path.string(), manifest_path);
            }

            std::stringstream contents;
            contents << ifs.rdbuf();
            if (ifs.bad())
            {
                throw SplitError(ErrorKind::InvalidManifest, "Failed to read manifest file: " + manifest_path.string(), manifest_path);
            }

            try
            {
                return decode(contents.str());
            }
            catch (const SplitError &e)
            {
                throw SplitError(e.kind(), e.detail() + " (" + manifest_path.string() + ")", manifest_path, e.chunkIndex());
            }
        }

        void ManifestCodec::validate(const SplitManifest &manifest)
        {
            if (!isPlainFileName(manifest.original_filename))
            {
                corrupt("Original file name must be a plain file name, got '" + manifest.original_filename + "'");
            }
            if (manifest.size_limit == 0)
            {
                corrupt("Size limit must be greater than 0");
            }
            if (!Digest::DigestUtility::isHexDigest(manifest.original_checksum))
            {
                corrupt("Whole-file checksum is not a SHA-256 hex digest");
            }

            const uint64_t total = manifest.original_file_size;
            const uint64_t expected_count = total / manifest.size_limit + (total % manifest.size_limit != 0 ? 1 : 0);
            if (manifest.chunks.size() != expected_count)
            {
                corrupt("Expected " + std::to_string(expected_count) + " chunks for " + std::to_string(total) +
                        " bytes with limit " + std::to_string(manifest.size_limit) + ", found " + std::to_string(manifest.chunks.size()));
            }

            const uint64_t count = manifest.chunks.size();
            std::vector<bool> seen(count, false);
            uint64_t original_sum = 0;
            for (const auto &chunk : manifest.chunks)
            {
                if (chunk.index >= count || seen[chunk.index])
                {
                    corrupt("Chunk indices must be unique and contiguous from 0", chunk.index);
                }
                seen[chunk.index] = true;

                if (chunk.original_size == 0 || chunk.original_size > manifest.size_limit)
                {
                    corrupt("Original size " + std::to_string(chunk.original_size) + " is outside 1.." + std::to_string(manifest.size_limit), chunk.index);
                }
                // Only the last window may be short
                if (chunk.index + 1 < count && chunk.original_size != manifest.size_limit)
                {
                    corrupt("Only the last chunk may be shorter than the size limit", chunk.index);
                }
                if (!manifest.is_compressed && chunk.stored_size != chunk.original_size)
                {
                    corrupt("Stored size differs from original size in an uncompressed manifest", chunk.index);
                }
                if (!Digest::DigestUtility::isHexDigest(chunk.checksum))
                {
                    corrupt("Chunk checksum is not a SHA-256 hex digest", chunk.index);
                }
                if (!chunk.original_checksum.empty() && !Digest::DigestUtility::isHexDigest(chunk.original_checksum))
                {
                    corrupt("Chunk original checksum is not a SHA-256 hex digest", chunk.index);
                }
                if (!isSafeRelativePath(chunk.chunk_path))
                {
                    corrupt("Chunk path must be a relative path inside the chunk directory: '" + chunk.chunk_path + "'", chunk.index);
                }
                original_sum += chunk.original_size;
            }

            if (original_sum != total)
            {
                corrupt("Chunk sizes add up to " + std::to_string(original_sum) + " bytes, manifest records " + std::to_string(total));
            }
        }

    } // namespace Metadata
} // namespace FileSplitter
