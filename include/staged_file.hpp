// include/staged_file.hpp
#pragma once

#include <filesystem>
#include <fstream>
#include <string>

namespace ChannelStore
{

    // Random hex, for names that concurrent users must not share.
    std::string randomSuffix();

    // Output file that only appears at its final path once commit() succeeds.
    // Data goes to a hidden temporary file in the same directory, which is
    // renamed into place on commit and removed if the object is destroyed first.
    class StagedFile
    {
    public:
        explicit StagedFile(const std::filesystem::path &final_path);
        ~StagedFile();

        StagedFile(const StagedFile &) = delete;
        StagedFile &operator=(const StagedFile &) = delete;

        std::ofstream &stream() { return out_; }

        const std::filesystem::path &finalPath() const { return final_path_; }
        const std::filesystem::path &tempPath() const { return temp_path_; }

        // Flushes, closes and atomically renames onto the final path.
        void commit();

    private:
        std::filesystem::path final_path_;
        std::filesystem::path temp_path_;
        std::ofstream out_;
        bool committed_ = false;
    };

    // Fresh directory under the system temp directory, removed with
    // everything in it on destruction.
    class ScratchDirectory
    {
    public:
        explicit ScratchDirectory(const std::string &prefix = "channel-store-");
        ~ScratchDirectory();

        ScratchDirectory(const ScratchDirectory &) = delete;
        ScratchDirectory &operator=(const ScratchDirectory &) = delete;

        const std::filesystem::path &path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

} // namespace ChannelStore
