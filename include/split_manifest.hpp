// include/split_manifest.hpp
#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>

#include <nlohmann/json.hpp> // For JSON handling

namespace FileSplitter
{
    namespace Metadata
    {

        // One entry per part file
        struct ChunkDescriptor
        {
            uint64_t index = 0;            // 0-based, defines reassembly order
            std::string chunk_path;        // Relative to the chunk directory, e.g. "data.bin_parts/data.bin-001"
            uint64_t stored_size = 0;      // Bytes on disk (compressed size when compression is on)
            uint64_t original_size = 0;    // Bytes of the source window
            std::string checksum;          // SHA-256 of the stored bytes
            std::string original_checksum; // SHA-256 of the source window, empty if not recorded
        };

        class SplitManifest
        {
        public:
            static constexpr int CURRENT_SCHEMA_VERSION = 1;

            int schema_version = CURRENT_SCHEMA_VERSION;
            std::string original_filename;
            uint64_t original_file_size = 0;
            uint64_t size_limit = 0;
            bool is_compressed = false;
            std::string original_checksum; // SHA-256 of the whole uncompressed file
            std::string created_at;        // ISO 8601 format (e.g., "YYYY-MM-DDTHH:MM:SSZ")
            std::vector<ChunkDescriptor> chunks;

            SplitManifest() = default;

            uint64_t totalStoredSize() const;

            // Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
            static std::string currentTimestamp();
        };

        void to_json(nlohmann::json &j, const ChunkDescriptor &c);
        void from_json(const nlohmann::json &j, ChunkDescriptor &c);
        void to_json(nlohmann::json &j, const SplitManifest &m);
        void from_json(const nlohmann::json &j, SplitManifest &m);

        // Manifest <-> JSON text. Keys, not positions, are the contract: unknown keys
        // are ignored so that later builds can add fields.
        class ManifestCodec
        {
        public:
            static std::string encode(const SplitManifest &manifest);

            // Throws SplitError(InvalidManifest) on malformed text or missing/mistyped fields.
            static SplitManifest decode(const std::string &text);

            static nlohmann::json toJson(const SplitManifest &manifest);
            static SplitManifest fromJson(const nlohmann::json &j);

            // Throws SplitError(IoError) if the file can't be written.
            static void save(const SplitManifest &manifest, const std::filesystem::path &manifest_path);

            // Throws SplitError(InvalidManifest) if the file is missing, unreadable or malformed.
            static SplitManifest load(const std::filesystem::path &manifest_path);

            // Structural checks done before any chunk is touched.
            // Throws SplitError(CorruptManifest) on the first violation found.
            static void validate(const SplitManifest &manifest);
        };

    } // namespace Metadata
} // namespace FileSplitter
