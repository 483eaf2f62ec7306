// include/manifest.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp> // For JSON handling
#include "reference.hpp"

namespace ChannelStore {
namespace Metadata {

struct ChunkEntry {
    std::size_t index = 0;
    ChunkReference reference;
    std::string chunk_hash;

    friend bool operator==(const ChunkEntry& a, const ChunkEntry& b) {
        return a.index == b.index && a.reference == b.reference && a.chunk_hash == b.chunk_hash;
    }
};

// The authoritative, immutable record of one stored file.
//
// Wire form is a marker line followed by compact JSON:
//   ### This message is generated by ChannelStore. Do not edit this message.
//   {"formatVersion":1,"fileName":...,"totalSize":...,"chunkSize":...,
//    "wholeFileHash":...,"createdAt":...,"chunks":[{"index":0,"reference":...,"chunkHash":...}]}
//
// Any schema change bumps FORMAT_VERSION; older readers reject newer manifests
// with UnsupportedVersion. Unknown top-level keys are kept in `extensions` and
// written back unchanged.
class Manifest {
public:
    static constexpr int FORMAT_VERSION = 1;
    inline static const std::string MARKER =
        "### This message is generated by ChannelStore. Do not edit this message.";

    int format_version = FORMAT_VERSION;
    std::string file_name;
    std::uint64_t total_size = 0;
    std::uint64_t chunk_size = 0;
    std::string whole_file_hash;
    std::string created_at; // ISO 8601 format (e.g., "YYYY-MM-DDTHH:MM:SSZ")
    std::vector<ChunkEntry> chunks; // Ordered by index
    nlohmann::json extensions = nlohmann::json::object();

    Manifest() = default;

    // Stamps created_at with the current UTC time
    Manifest(std::string name, std::uint64_t size, std::uint64_t chunk_size_used,
             std::string whole_hash, std::vector<ChunkEntry> chunk_entries);

    nlohmann::json toJson() const;

    // Throws CorruptManifest or UnsupportedVersion
    static Manifest fromJson(const nlohmann::json& j);

    std::string serialize() const;

    // Throws CorruptManifest (no marker, bad JSON, broken invariants) or
    // UnsupportedVersion.
    static Manifest deserialize(const std::string& bytes);

    // True if the message body starts with the marker line
    static bool hasMarker(const std::string& body);

    // Throws CorruptManifest when the invariants don't hold:
    // indices 0..n-1, n == ceil(total_size / chunk_size), hex hashes, safe file name.
    void validate() const;

    std::vector<std::string> chunkHashes() const;

    // Worst-case serialized size for a file of total_size bytes split into
    // chunk_size chunks, assuming references of max_reference_length characters.
    static std::size_t estimateSerializedSize(const std::string& file_name,
                                              std::uint64_t total_size,
                                              std::size_t chunk_size,
                                              std::size_t max_reference_length);

    // Local manifest written next to part files: "<file_name>.manifest"
    static std::string manifestFileName(const std::string& file_name);
    std::filesystem::path save(const std::filesystem::path& dir) const;
    static Manifest load(const std::filesystem::path& dir, const std::string& file_name);

    friend bool operator==(const Manifest& a, const Manifest& b);
    friend bool operator!=(const Manifest& a, const Manifest& b) { return !(a == b); }
};

// A name a manifest may record: non-empty, not "." or "..", no path
// separators, quotes or control characters, and valid UTF-8.
bool isPlainFileName(const std::string& name);

// Current UTC time as "YYYY-MM-DDTHH:MM:SSZ"
std::string currentTimestamp();

} // namespace Metadata
} // namespace ChannelStore
