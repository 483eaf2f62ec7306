// src/staged_file.cpp
#include "staged_file.hpp"
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

#include "store_config.hpp"

namespace fs = std::filesystem;

namespace ChannelStore
{

    std::string randomSuffix()
    {
        std::random_device rd;
        std::stringstream ss;
        ss << std::hex << rd() << rd();
        return ss.str();
    }

    StagedFile::StagedFile(const fs::path &final_path) : final_path_(final_path)
    {
        fs::path dir = final_path_.parent_path();
        if (dir.empty())
        {
            dir = fs::current_path();
        }
        Config::StoreConfig::ensureDirectoryExists(dir);

        temp_path_ = dir / ("." + final_path_.filename().string() + "." + randomSuffix() + ".partial");
        out_.open(temp_path_, std::ios::binary | std::ios::trunc);
        if (!out_.is_open())
        {
            throw std::runtime_error("Failed to open output file for writing: " + temp_path_.string());
        }
    }

    StagedFile::~StagedFile()
    {
        if (committed_)
        {
            return;
        }
        if (out_.is_open())
        {
            out_.close();
        }
        std::error_code ec;
        fs::remove(temp_path_, ec);
        if (ec)
        {
            std::cerr << "Warning: could not remove temporary file " << temp_path_ << ": " << ec.message() << std::endl;
        }
    }

    void StagedFile::commit()
    {
        out_.flush();
        out_.close();
        if (out_.fail())
        {
            throw std::runtime_error("Failed to write output file: " + temp_path_.string());
        }
        // rename() replaces the destination atomically on POSIX filesystems
        fs::rename(temp_path_, final_path_);
        committed_ = true;
    }

    ScratchDirectory::ScratchDirectory(const std::string &prefix)
    {
        const fs::path base = fs::temp_directory_path();
        // create_directory() is false when the name is taken, so a clash picks again
        for (int attempt = 0; attempt < 8; ++attempt)
        {
            fs::path candidate = base / (prefix + randomSuffix());
            if (fs::create_directory(candidate))
            {
                path_ = candidate;
                return;
            }
        }
        throw std::runtime_error("Could not create a scratch directory under " + base.string());
    }

    ScratchDirectory::~ScratchDirectory()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec)
        {
            std::cerr << "Warning: could not remove " << path_ << ": " << ec.message() << std::endl;
        }
    }

} // namespace ChannelStore
