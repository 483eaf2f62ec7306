// tests/chunk_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include "chunk.hpp"
#include "content_hash.hpp"
#include "errors.hpp"
#include "test_util.hpp"

using namespace ChannelStore;
using ChannelStore::Chunks::Chunk;
using ChannelStore::Chunks::ChunkAssembler;
using ChannelStore::Chunks::ChunkReader;

namespace {

std::vector<Chunk> splitAll(const std::vector<char>& data, std::size_t chunk_size) {
    std::istringstream in(std::string(data.begin(), data.end()));
    ChunkReader reader(in, chunk_size);
    std::vector<Chunk> chunks;
    while (auto chunk = reader.next()) {
        chunks.push_back(std::move(*chunk));
    }
    return chunks;
}

std::vector<std::vector<char>> blobsOf(const std::vector<Chunk>& chunks) {
    std::vector<std::vector<char>> blobs;
    for (const auto& c : chunks) blobs.push_back(c.data);
    return blobs;
}

std::vector<std::string> hashesOf(const std::vector<Chunk>& chunks) {
    std::vector<std::string> hashes;
    for (const auto& c : chunks) hashes.push_back(c.hash);
    return hashes;
}

} // namespace

TEST(ChunkTest, ChunkCountIsCeilingDivision) {
    EXPECT_EQ(Chunks::chunkCountFor(0, 10), 0u);
    EXPECT_EQ(Chunks::chunkCountFor(1, 10), 1u);
    EXPECT_EQ(Chunks::chunkCountFor(10, 10), 1u);
    EXPECT_EQ(Chunks::chunkCountFor(11, 10), 2u);
    // No wrap-around at the top of the range
    const std::uint64_t largest = std::numeric_limits<std::uint64_t>::max();
    EXPECT_EQ(Chunks::chunkCountFor(largest, 2), static_cast<std::size_t>(largest / 2 + 1));
    EXPECT_EQ(Chunks::chunkCountFor(largest, 1), static_cast<std::size_t>(largest));
    EXPECT_THROW(Chunks::chunkCountFor(10, 0), ConfigError);
}

TEST(ChunkTest, SplitCoversInputOnceInIndexOrder) {
    auto data = Testing::randomBytes(1000);
    auto chunks = splitAll(data, 300);

    ASSERT_EQ(chunks.size(), 4u);
    std::size_t offset = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_LE(chunks[i].data.size(), 300u);
        EXPECT_TRUE(std::equal(chunks[i].data.begin(), chunks[i].data.end(), data.begin() + offset));
        EXPECT_EQ(chunks[i].hash, Hashing::ContentHash::sha256Hex(chunks[i].data));
        offset += chunks[i].data.size();
    }
    EXPECT_EQ(offset, data.size());
    EXPECT_EQ(chunks.back().data.size(), 100u);
}

TEST(ChunkTest, EmptyInputGivesNoChunks) {
    std::istringstream in("");
    ChunkReader reader(in, 16);
    EXPECT_FALSE(reader.next().has_value());
    EXPECT_TRUE(reader.finished());
    EXPECT_EQ(reader.wholeFileHash(), Hashing::ContentHash::sha256Hex(std::vector<char>{}));
}

TEST(ChunkTest, ZeroChunkSizeIsRejected) {
    std::istringstream in("abc");
    EXPECT_THROW(ChunkReader reader(in, 0), ConfigError);
}

TEST(ChunkTest, WholeFileHashOnlyAfterExhaustion) {
    auto data = Testing::randomBytes(64);
    std::istringstream in(std::string(data.begin(), data.end()));
    ChunkReader reader(in, 32);
    reader.next();
    EXPECT_THROW(reader.wholeFileHash(), std::logic_error);
    while (reader.next()) {
    }
    EXPECT_EQ(reader.wholeFileHash(), Hashing::ContentHash::sha256Hex(data));
    EXPECT_EQ(reader.bytesRead(), 64u);
    EXPECT_EQ(reader.chunksRead(), 2u);
}

TEST(ChunkTest, ResetRestartsFromTheBeginning) {
    auto data = Testing::randomBytes(100);
    std::istringstream in(std::string(data.begin(), data.end()));
    ChunkReader reader(in, 40);
    auto first = reader.next();
    while (reader.next()) {
    }
    reader.reset();
    auto again = reader.next();
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again->index, 0u);
    EXPECT_EQ(again->data, first->data);
}

TEST(ChunkTest, JoinReproducesInputForVariousSizes) {
    for (std::size_t size : {0u, 1u, 99u, 100u, 101u, 4096u}) {
        for (std::size_t chunk_size : {1u, 7u, 100u, 5000u}) {
            auto data = Testing::randomBytes(size, static_cast<unsigned>(size + chunk_size));
            auto chunks = splitAll(data, chunk_size);
            EXPECT_EQ(Chunks::join(blobsOf(chunks), hashesOf(chunks)), data)
                << "size " << size << ", chunk size " << chunk_size;
        }
    }
}

TEST(ChunkTest, JoinDetectsCorruptedChunk) {
    auto data = Testing::randomBytes(300);
    auto chunks = splitAll(data, 100);
    auto blobs = blobsOf(chunks);
    blobs[1][50] ^= 0x40;
    EXPECT_THROW(Chunks::join(blobs, hashesOf(chunks)), IntegrityError);
}

TEST(ChunkTest, AssemblerRejectsOutOfOrderAndMissingChunks) {
    auto data = Testing::randomBytes(300);
    auto chunks = splitAll(data, 100);

    std::ostringstream out;
    ChunkAssembler assembler(out, hashesOf(chunks));
    EXPECT_THROW(assembler.append(1, chunks[1].data), IntegrityError);

    assembler.append(0, chunks[0].data);
    EXPECT_THROW(assembler.finish(), IntegrityError);
}

TEST(ChunkTest, AssemblerChecksSizeAndWholeHash) {
    auto data = Testing::randomBytes(200);
    auto chunks = splitAll(data, 100);

    std::ostringstream wrong_size;
    ChunkAssembler sized(wrong_size, hashesOf(chunks), std::uint64_t{201});
    sized.append(0, chunks[0].data);
    sized.append(1, chunks[1].data);
    EXPECT_THROW(sized.finish(), IntegrityError);

    std::ostringstream wrong_hash;
    ChunkAssembler hashed(wrong_hash, hashesOf(chunks), std::uint64_t{200}, std::string(64, '0'));
    hashed.append(0, chunks[0].data);
    hashed.append(1, chunks[1].data);
    EXPECT_THROW(hashed.finish(), IntegrityError);

    std::ostringstream good;
    ChunkAssembler ok(good, hashesOf(chunks), std::uint64_t{200}, Hashing::ContentHash::sha256Hex(data));
    ok.append(0, chunks[0].data);
    ok.append(1, chunks[1].data);
    EXPECT_EQ(ok.finish(), 200u);
    EXPECT_EQ(good.str(), std::string(data.begin(), data.end()));
}

TEST(ChunkTest, PartFilesRoundTrip) {
    Testing::TempDir dir;
    Chunk chunk(3, Testing::randomBytes(50));
    EXPECT_EQ(Chunk::partFileName("movie.mkv", 3), "movie.mkv.part3");

    auto written = chunk.save(dir.path(), "movie.mkv");
    EXPECT_EQ(written, dir / "movie.mkv.part3");
    EXPECT_EQ(Chunk::loadData(written), chunk.data);
    EXPECT_THROW(Chunk::loadData(dir / "missing.part0"), NotFound);
}
