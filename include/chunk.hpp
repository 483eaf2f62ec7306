// include/chunk.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "content_hash.hpp"

namespace ChannelStore {
namespace Chunks {

class Chunk {
public:
    std::size_t index = 0;   // Position in the file, 0-based
    std::vector<char> data;  // The actual content of the chunk
    std::string hash;        // SHA-256 of data, checked again on reassembly

    // Constructor to create a chunk from data and compute its hash
    Chunk(std::size_t chunk_index, std::vector<char> chunk_data)
        : index(chunk_index), data(std::move(chunk_data)) {
        hash = Hashing::ContentHash::sha256Hex(data);
    }

    Chunk() = default;

    // Local part file name: "<file_name>.part<index>"
    static std::string partFileName(const std::string& file_name, std::size_t index);

    // Write the chunk to dir as its part file. Returns the path written.
    std::filesystem::path save(const std::filesystem::path& dir, const std::string& file_name) const;

    // Read a part file back.
    static std::vector<char> loadData(const std::filesystem::path& part_path);
};

// Number of chunks a file of total_size bytes splits into (0 for an empty file).
std::size_t chunkCountFor(std::uint64_t total_size, std::size_t chunk_size);

// Lazily splits a stream into index-ordered chunks of at most chunk_size bytes.
// The whole-stream hash is accumulated during the same pass.
class ChunkReader {
public:
    // Reads from a file the reader opens itself.
    ChunkReader(const std::filesystem::path& path, std::size_t chunk_size);
    // Reads from a caller-owned stream, which must outlive the reader.
    // reset() needs the stream to be seekable.
    ChunkReader(std::istream& stream, std::size_t chunk_size);

    // Next chunk, or nullopt once the input is exhausted.
    std::optional<Chunk> next();

    // Start over from the first byte.
    void reset();

    std::size_t chunkSize() const { return chunk_size_; }
    std::uint64_t bytesRead() const { return bytes_read_; }
    std::size_t chunksRead() const { return next_index_; }
    bool finished() const { return finished_; }

    // Hash of everything read; only valid after next() returned nullopt.
    const std::string& wholeFileHash() const;

private:
    void init();

    std::unique_ptr<std::istream> owned_;
    std::istream* in_ = nullptr;
    std::streampos start_;
    std::size_t chunk_size_;
    std::size_t next_index_ = 0;
    std::uint64_t bytes_read_ = 0;
    bool finished_ = false;
    std::string whole_hash_;
    Hashing::ContentHash::Sha256Accumulator accumulator_;
};

// Reverse of ChunkReader: writes chunk blobs to out in index order, checking
// every blob against the hash recorded for its index.
class ChunkAssembler {
public:
    ChunkAssembler(std::ostream& out,
                   std::vector<std::string> expected_hashes,
                   std::optional<std::uint64_t> expected_size = std::nullopt,
                   std::optional<std::string> expected_whole_hash = std::nullopt);

    // Throws IntegrityError if index is not the next one or the hash differs.
    void append(std::size_t index, const std::vector<char>& blob);

    // Checks chunk count, total size and whole-file hash. Returns bytes written.
    std::uint64_t finish();

    std::size_t nextIndex() const { return next_index_; }

private:
    std::ostream& out_;
    std::vector<std::string> expected_hashes_;
    std::optional<std::uint64_t> expected_size_;
    std::optional<std::string> expected_whole_hash_;
    std::size_t next_index_ = 0;
    std::uint64_t bytes_written_ = 0;
    Hashing::ContentHash::Sha256Accumulator accumulator_;
};

// In-memory join: concatenates blobs after verifying each against hashes.
std::vector<char> join(const std::vector<std::vector<char>>& ordered_blobs,
                       const std::vector<std::string>& hashes);

} // namespace Chunks
} // namespace ChannelStore
