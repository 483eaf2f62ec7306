// src/chunk.cpp
#include "chunk.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "errors.hpp"

namespace fs = std::filesystem;

namespace ChannelStore
{
    namespace Chunks
    {

        std::string Chunk::partFileName(const std::string &file_name, std::size_t index)
        {
            return file_name + ".part" + std::to_string(index);
        }

        fs::path Chunk::save(const fs::path &dir, const std::string &file_name) const
        {
            fs::path chunk_path = dir / partFileName(file_name, index);

            std::ofstream ofs(chunk_path, std::ios::binary | std::ios::trunc);
            if (!ofs.is_open())
            {
                throw std::runtime_error("Failed to open file for writing chunk: " + chunk_path.string());
            }
            ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
            if (!ofs.good())
            {
                throw std::runtime_error("Failed to write all data to chunk file: " + chunk_path.string());
            }
            return chunk_path;
        }

        std::vector<char> Chunk::loadData(const fs::path &part_path)
        {
            if (!fs::exists(part_path))
            {
                throw NotFound("Chunk file not found: " + part_path.string());
            }

            std::ifstream ifs(part_path, std::ios::binary | std::ios::ate);
            if (!ifs.is_open())
            {
                throw std::runtime_error("Failed to open chunk file for reading: " + part_path.string());
            }

            std::streamsize size = ifs.tellg();
            if (size == -1)
            {
                throw std::runtime_error("Failed to get size of chunk file: " + part_path.string());
            }
            ifs.seekg(0, std::ios::beg);

            std::vector<char> buffer(static_cast<std::size_t>(size));
            if (size > 0 && !ifs.read(buffer.data(), size))
            {
                throw std::runtime_error("Failed to read chunk data from file: " + part_path.string());
            }
            return buffer;
        }

        std::size_t chunkCountFor(std::uint64_t total_size, std::size_t chunk_size)
        {
            if (chunk_size == 0)
            {
                throw ConfigError("Chunk size must be greater than zero.");
            }
            // Written so that sizes near the top of the range can't wrap around
            return static_cast<std::size_t>(total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0));
        }

        // --- ChunkReader ---

        ChunkReader::ChunkReader(const fs::path &path, std::size_t chunk_size)
            : owned_(std::make_unique<std::ifstream>(path, std::ios::binary)),
              in_(owned_.get()),
              chunk_size_(chunk_size)
        {
            if (!static_cast<std::ifstream *>(owned_.get())->is_open())
            {
                throw std::runtime_error("Failed to open input file: " + path.string());
            }
            init();
        }

        ChunkReader::ChunkReader(std::istream &stream, std::size_t chunk_size)
            : in_(&stream), chunk_size_(chunk_size)
        {
            init();
        }

        void ChunkReader::init()
        {
            if (chunk_size_ == 0)
            {
                throw ConfigError("Chunk size must be greater than zero.");
            }
            start_ = in_->tellg();
        }

        std::optional<Chunk> ChunkReader::next()
        {
            if (finished_)
            {
                return std::nullopt;
            }

            std::vector<char> buffer(chunk_size_);
            in_->read(buffer.data(), static_cast<std::streamsize>(chunk_size_));
            std::streamsize got = in_->gcount();
            if (in_->bad())
            {
                throw std::runtime_error("Read error while chunking input.");
            }
            if (got <= 0)
            {
                finished_ = true;
                whole_hash_ = accumulator_.hex();
                return std::nullopt;
            }

            buffer.resize(static_cast<std::size_t>(got));
            accumulator_.update(buffer.data(), buffer.size());
            bytes_read_ += static_cast<std::uint64_t>(got);
            return Chunk(next_index_++, std::move(buffer));
        }

        void ChunkReader::reset()
        {
            in_->clear();
            in_->seekg(start_);
            if (in_->fail())
            {
                throw std::runtime_error("Input stream cannot be rewound for chunking.");
            }
            accumulator_.reset();
            next_index_ = 0;
            bytes_read_ = 0;
            finished_ = false;
            whole_hash_.clear();
        }

        const std::string &ChunkReader::wholeFileHash() const
        {
            if (!finished_)
            {
                throw std::logic_error("Whole-file hash requested before the input was fully read.");
            }
            return whole_hash_;
        }

        // --- ChunkAssembler ---

        ChunkAssembler::ChunkAssembler(std::ostream &out,
                                       std::vector<std::string> expected_hashes,
                                       std::optional<std::uint64_t> expected_size,
                                       std::optional<std::string> expected_whole_hash)
            : out_(out),
              expected_hashes_(std::move(expected_hashes)),
              expected_size_(expected_size),
              expected_whole_hash_(std::move(expected_whole_hash))
        {
        }

        void ChunkAssembler::append(std::size_t index, const std::vector<char> &blob)
        {
            if (index != next_index_)
            {
                throw IntegrityError("Chunk " + std::to_string(index) + " arrived while chunk " +
                                     std::to_string(next_index_) + " was expected.");
            }
            if (index >= expected_hashes_.size())
            {
                throw IntegrityError("Unexpected extra chunk " + std::to_string(index) + ".");
            }
            std::string actual = Hashing::ContentHash::sha256Hex(blob);
            if (actual != expected_hashes_[index])
            {
                throw IntegrityError("Hash mismatch for chunk " + std::to_string(index) + ": expected " +
                                     expected_hashes_[index] + ", got " + actual + ".");
            }

            out_.write(blob.data(), static_cast<std::streamsize>(blob.size()));
            if (!out_.good())
            {
                throw std::runtime_error("Failed to write chunk " + std::to_string(index) + " to output.");
            }
            accumulator_.update(blob.data(), blob.size());
            bytes_written_ += blob.size();
            ++next_index_;
        }

        std::uint64_t ChunkAssembler::finish()
        {
            if (next_index_ != expected_hashes_.size())
            {
                throw IntegrityError("Only " + std::to_string(next_index_) + " of " +
                                     std::to_string(expected_hashes_.size()) + " chunks were assembled.");
            }
            if (expected_size_ && *expected_size_ != bytes_written_)
            {
                throw IntegrityError("Reassembled size " + std::to_string(bytes_written_) +
                                     " differs from the recorded size " + std::to_string(*expected_size_) + ".");
            }
            std::string whole = accumulator_.hex();
            if (expected_whole_hash_ && *expected_whole_hash_ != whole)
            {
                throw IntegrityError("Whole-file hash mismatch: expected " + *expected_whole_hash_ +
                                     ", got " + whole + ".");
            }
            out_.flush();
            return bytes_written_;
        }

        std::vector<char> join(const std::vector<std::vector<char>> &ordered_blobs,
                               const std::vector<std::string> &hashes)
        {
            std::ostringstream out(std::ios::binary);
            ChunkAssembler assembler(out, hashes);
            for (std::size_t i = 0; i < ordered_blobs.size(); ++i)
            {
                assembler.append(i, ordered_blobs[i]);
            }
            assembler.finish();
            const std::string bytes = out.str();
            return std::vector<char>(bytes.begin(), bytes.end());
        }

    } // namespace Chunks
} // namespace ChannelStore
