// src/manifest.cpp
#include "manifest.hpp"
#include <chrono>
#include <ctime>
#include <fstream>
#include <iterator>
#include <stdexcept> // For std::runtime_error
#include <type_traits>

#include "chunk.hpp"
#include "errors.hpp"

namespace fs = std::filesystem;

namespace ChannelStore {
namespace Metadata {

namespace {

const char* const kKnownKeys[] = {"formatVersion", "fileName", "totalSize", "chunkSize",
                                  "wholeFileHash", "createdAt", "chunks"};

bool isKnownKey(const std::string& key) {
    for (const char* known : kKnownKeys) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

bool isHexDigest(const std::string& s) {
    if (s.size() != 64) {
        return false;
    }
    for (char c : s) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return true;
}

template <class T>
T required(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        throw CorruptManifest(std::string("Manifest is missing field '") + key + "'.");
    }
    const auto& value = j.at(key);
    bool type_ok;
    if constexpr (std::is_same_v<T, std::string>) {
        type_ok = value.is_string();
    } else if constexpr (std::is_unsigned_v<T>) {
        type_ok = value.is_number_unsigned();
    } else {
        type_ok = value.is_number_integer();
    }
    if (!type_ok) {
        throw CorruptManifest(std::string("Manifest field '") + key + "' has the wrong type.");
    }
    try {
        return value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw CorruptManifest(std::string("Manifest field '") + key + "' has the wrong type: " + e.what());
    }
}

// Read at full width so that e.g. 2^32 + 1 can't pass as version 1.
std::uint64_t requiredVersion(const nlohmann::json& j) {
    if (!j.contains("formatVersion")) {
        throw CorruptManifest("Manifest is missing field 'formatVersion'.");
    }
    const auto& value = j.at("formatVersion");
    if (!value.is_number_integer()) {
        throw CorruptManifest("Manifest field 'formatVersion' has the wrong type.");
    }
    if (value.is_number_unsigned()) {
        return value.get<std::uint64_t>();
    }
    std::int64_t version = value.get<std::int64_t>();
    if (version < 1) {
        throw CorruptManifest("Manifest format version " + std::to_string(version) + " is invalid.");
    }
    return static_cast<std::uint64_t>(version);
}

} // namespace

bool isPlainFileName(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    for (char c : name) {
        unsigned char u = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || c == '"' || u < 0x20 || u == 0x7F) {
            return false;
        }
    }
    // Must come out of the JSON encoder byte for byte
    try {
        nlohmann::json(name).dump();
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
    return true;
}

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t now_c = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&now_c, &utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return buf;
}

Manifest::Manifest(std::string name, std::uint64_t size, std::uint64_t chunk_size_used,
                   std::string whole_hash, std::vector<ChunkEntry> chunk_entries)
    : file_name(std::move(name)),
      total_size(size),
      chunk_size(chunk_size_used),
      whole_file_hash(std::move(whole_hash)),
      created_at(currentTimestamp()),
      chunks(std::move(chunk_entries)) {}

nlohmann::json Manifest::toJson() const {
    nlohmann::json j = extensions.is_object() ? extensions : nlohmann::json::object();
    j["formatVersion"] = format_version;
    j["fileName"] = file_name;
    j["totalSize"] = total_size;
    j["chunkSize"] = chunk_size;
    j["wholeFileHash"] = whole_file_hash;
    j["createdAt"] = created_at;
    nlohmann::json list = nlohmann::json::array();
    for (const auto& entry : chunks) {
        list.push_back({{"index", entry.index},
                        {"reference", entry.reference.str()},
                        {"chunkHash", entry.chunk_hash}});
    }
    j["chunks"] = std::move(list);
    return j;
}

Manifest Manifest::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw CorruptManifest("Manifest is not a JSON object.");
    }

    // The version decides how the rest is read, so it goes first.
    Manifest m;
    const std::uint64_t version = requiredVersion(j);
    if (version == 0) {
        throw CorruptManifest("Manifest format version 0 is invalid.");
    }
    if (version > static_cast<std::uint64_t>(FORMAT_VERSION)) {
        throw UnsupportedVersion(version, FORMAT_VERSION);
    }
    m.format_version = static_cast<int>(version);

    m.file_name = required<std::string>(j, "fileName");
    m.total_size = required<std::uint64_t>(j, "totalSize");
    m.chunk_size = required<std::uint64_t>(j, "chunkSize");
    m.whole_file_hash = required<std::string>(j, "wholeFileHash");
    m.created_at = required<std::string>(j, "createdAt");

    const auto& list = j.contains("chunks") ? j.at("chunks") : nlohmann::json();
    if (!list.is_array()) {
        throw CorruptManifest("Manifest field 'chunks' must be an array.");
    }
    m.chunks.reserve(list.size());
    for (const auto& item : list) {
        if (!item.is_object()) {
            throw CorruptManifest("Manifest chunk entry is not an object.");
        }
        ChunkEntry entry;
        entry.index = required<std::size_t>(item, "index");
        entry.reference = ChunkReference(required<std::string>(item, "reference"));
        entry.chunk_hash = required<std::string>(item, "chunkHash");
        m.chunks.push_back(std::move(entry));
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!isKnownKey(it.key())) {
            m.extensions[it.key()] = it.value();
        }
    }

    m.validate();
    return m;
}

void Manifest::validate() const {
    if (!isPlainFileName(file_name)) {
        throw CorruptManifest("Manifest file name '" + file_name + "' is not a plain file name.");
    }
    if (chunk_size == 0) {
        throw CorruptManifest("Manifest chunk size is zero.");
    }
    if (!isHexDigest(whole_file_hash)) {
        throw CorruptManifest("Manifest whole-file hash is not a SHA-256 hex digest.");
    }
    std::size_t expected = Chunks::chunkCountFor(total_size, static_cast<std::size_t>(chunk_size));
    if (chunks.size() != expected) {
        throw CorruptManifest("Manifest lists " + std::to_string(chunks.size()) + " chunks, but " +
                              std::to_string(total_size) + " bytes in chunks of " +
                              std::to_string(chunk_size) + " need " + std::to_string(expected) + ".");
    }
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != i) {
            throw CorruptManifest("Manifest chunk at position " + std::to_string(i) + " has index " +
                                  std::to_string(chunks[i].index) + ".");
        }
        if (chunks[i].reference.empty()) {
            throw CorruptManifest("Manifest chunk " + std::to_string(i) + " has no reference.");
        }
        if (!isHexDigest(chunks[i].chunk_hash)) {
            throw CorruptManifest("Manifest chunk " + std::to_string(i) + " hash is not a SHA-256 hex digest.");
        }
    }
}

std::string Manifest::serialize() const {
    // Size estimates serialize unvalidated names, which may not be valid UTF-8.
    return MARKER + "\n" + toJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool Manifest::hasMarker(const std::string& body) {
    return body.compare(0, MARKER.size(), MARKER) == 0;
}

Manifest Manifest::deserialize(const std::string& bytes) {
    if (!hasMarker(bytes)) {
        throw CorruptManifest("Message is not a ChannelStore manifest.");
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(bytes.begin() + static_cast<std::ptrdiff_t>(MARKER.size()), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw CorruptManifest(std::string("Error parsing manifest JSON: ") + e.what());
    }
    return fromJson(j);
}

std::vector<std::string> Manifest::chunkHashes() const {
    std::vector<std::string> hashes;
    hashes.reserve(chunks.size());
    for (const auto& entry : chunks) {
        hashes.push_back(entry.chunk_hash);
    }
    return hashes;
}

std::size_t Manifest::estimateSerializedSize(const std::string& file_name,
                                             std::uint64_t total_size,
                                             std::size_t chunk_size,
                                             std::size_t max_reference_length) {
    std::size_t count = Chunks::chunkCountFor(total_size, chunk_size);
    std::vector<ChunkEntry> entries(count);
    for (std::size_t i = 0; i < count; ++i) {
        entries[i].index = i;
        entries[i].reference = ChunkReference(std::string(max_reference_length, '9'));
        entries[i].chunk_hash = std::string(64, '0');
    }
    Manifest sized(file_name, total_size, chunk_size, std::string(64, '0'), std::move(entries));
    return sized.serialize().size();
}

std::string Manifest::manifestFileName(const std::string& file_name) {
    return file_name + ".manifest";
}

fs::path Manifest::save(const fs::path& dir) const {
    fs::path manifest_path = dir / manifestFileName(file_name);

    std::ofstream ofs(manifest_path, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        throw std::runtime_error("Failed to open file for writing manifest: " + manifest_path.string());
    }
    ofs << serialize();
    if (!ofs.good()) {
        throw std::runtime_error("Failed to write all data to manifest file: " + manifest_path.string());
    }
    return manifest_path;
}

Manifest Manifest::load(const fs::path& dir, const std::string& file_name) {
    fs::path manifest_path = dir / manifestFileName(file_name);

    if (!fs::exists(manifest_path)) {
        throw NotFound("Manifest file not found: " + manifest_path.string());
    }

    std::ifstream ifs(manifest_path, std::ios::binary);
    if (!ifs.is_open()) {
        throw std::runtime_error("Failed to open manifest file for reading: " + manifest_path.string());
    }
    std::string contents((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return deserialize(contents);
}

bool operator==(const Manifest& a, const Manifest& b) {
    return a.format_version == b.format_version && a.file_name == b.file_name &&
           a.total_size == b.total_size && a.chunk_size == b.chunk_size &&
           a.whole_file_hash == b.whole_file_hash && a.created_at == b.created_at &&
           a.chunks == b.chunks && a.extensions == b.extensions;
}

} // namespace Metadata
} // namespace ChannelStore
