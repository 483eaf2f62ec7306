// src/store_config.cpp
#include "store_config.hpp"
#include <cstdlib>   // For std::getenv
#include <stdexcept> // For std::runtime_error

#include "errors.hpp"

namespace fs = std::filesystem;

namespace ChannelStore
{
    namespace Config
    {

        const size_t StoreConfig::DEFAULT_CONCURRENCY;

        std::size_t BackendLimits::maxChunkSize() const
        {
            if (max_attachment_bytes <= framing_overhead_bytes)
            {
                return 0;
            }
            return max_attachment_bytes - framing_overhead_bytes;
        }

        void BackendLimits::validateChunkSize(std::size_t chunk_size) const
        {
            if (chunk_size == 0)
            {
                throw ConfigError("Chunk size must be greater than zero.");
            }
            if (chunk_size > maxChunkSize())
            {
                throw ConfigError("Chunk size " + std::to_string(chunk_size) +
                                  " leaves no room for framing: the backend accepts attachments of at most " +
                                  std::to_string(max_attachment_bytes) + " bytes, so chunks must not exceed " +
                                  std::to_string(maxChunkSize()) + " bytes.");
            }
        }

        void TransferSettings::validate() const
        {
            if (concurrency == 0)
            {
                throw ConfigError("Concurrency must be at least 1.");
            }
        }

        fs::path StoreConfig::defaultConfigBase()
        {
            if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg != nullptr && *xdg != '\0')
            {
                return fs::path(xdg);
            }
            if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0')
            {
                return fs::path(home) / ".config";
            }
            throw ConfigError("Config directory couldn't be found. Please specify one with --config-directory.");
        }

        fs::path StoreConfig::getSettingsFilePath(const std::optional<fs::path> &base)
        {
            fs::path root = base ? *base : defaultConfigBase();
            return ensureDirectoryExists(root / APP_DIR_NAME) / SETTINGS_FILE_NAME;
        }

        fs::path StoreConfig::ensureDirectoryExists(const fs::path &dir_path)
        {
            try
            {
                if (!fs::exists(dir_path))
                {
                    // create_directories returns false if another process won the
                    // race; that's fine as long as the directory exists now.
                    if (!fs::create_directories(dir_path) && !fs::exists(dir_path))
                    {
                        throw std::runtime_error("Failed to create directory: " + dir_path.string());
                    }
                }
            }
            catch (const fs::filesystem_error &e)
            {
                throw std::runtime_error("Filesystem error creating directory " + dir_path.string() + ": " + e.what());
            }
            return dir_path;
        }

    } // namespace Config
} // namespace ChannelStore
