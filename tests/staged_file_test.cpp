// tests/staged_file_test.cpp
#include <gtest/gtest.h>

#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "staged_file.hpp"
#include "test_util.hpp"

using namespace ChannelStore;

TEST(StagedFileTest, CommitMovesTheDataIntoPlace) {
    Testing::TempDir dir;
    auto data = Testing::randomBytes(300);
    {
        StagedFile staged(dir / "out.bin");
        EXPECT_NE(staged.tempPath(), staged.finalPath());
        EXPECT_EQ(staged.tempPath().parent_path(), dir.path());
        staged.stream().write(data.data(), static_cast<std::streamsize>(data.size()));
        EXPECT_FALSE(std::filesystem::exists(dir / "out.bin"));
        staged.commit();
    }
    EXPECT_EQ(Testing::readFile(dir / "out.bin"), data);
    EXPECT_EQ(Testing::countEntries(dir.path()), 1u);
}

TEST(StagedFileTest, UncommittedFileLeavesNothing) {
    Testing::TempDir dir;
    {
        StagedFile staged(dir / "out.bin");
        staged.stream() << "half written";
    }
    EXPECT_EQ(Testing::countEntries(dir.path()), 0u);
}

TEST(StagedFileTest, TwoWritersToOneNameGetSeparateTempFiles) {
    Testing::TempDir dir;
    StagedFile first(dir / "same.bin");
    StagedFile second(dir / "same.bin");
    EXPECT_NE(first.tempPath(), second.tempPath());
}

TEST(ScratchDirectoryTest, DirectoriesAreDistinctAndRemovedIndependently) {
    std::vector<std::unique_ptr<ScratchDirectory>> scratches;
    std::set<std::filesystem::path> paths;
    for (int i = 0; i < 50; ++i) {
        scratches.push_back(std::make_unique<ScratchDirectory>());
        EXPECT_TRUE(std::filesystem::is_directory(scratches.back()->path()));
        paths.insert(scratches.back()->path());
    }
    EXPECT_EQ(paths.size(), 50u);

    std::filesystem::path kept = scratches[1]->path();
    Testing::writeFile(kept / "upload.bin", Testing::randomBytes(10));
    std::filesystem::path dropped = scratches[0]->path();
    Testing::writeFile(dropped / "upload.bin", Testing::randomBytes(10));

    scratches[0].reset();
    EXPECT_FALSE(std::filesystem::exists(dropped));
    EXPECT_TRUE(std::filesystem::exists(kept / "upload.bin"));
}

TEST(ScratchDirectoryTest, PrefixNamesTheDirectory) {
    ScratchDirectory scratch("channel-store-unit-");
    EXPECT_EQ(scratch.path().filename().string().rfind("channel-store-unit-", 0), 0u);
    EXPECT_EQ(scratch.path().parent_path(), std::filesystem::temp_directory_path());
}
