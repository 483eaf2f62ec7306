// include/store_config.hpp
#pragma once

#include <string>
#include <cstddef>    // For size_t
#include <filesystem> // For std::filesystem::path
#include <optional>

#include "retry_policy.hpp"

namespace ChannelStore
{
    namespace Config
    {

        // Limits of the backend the chunks are published to. These are runtime
        // facts of the backend, so they are injected rather than hard-coded.
        struct BackendLimits
        {
            // Largest attachment the backend accepts, including request framing.
            std::size_t max_attachment_bytes = 10 * 1024 * 1024;
            // Room left for multipart framing and the message envelope.
            std::size_t framing_overhead_bytes = 256 * 1024;
            // Largest text body of a single message (the manifest lives there).
            std::size_t max_message_body_bytes = 2000;
            // Longest reference the backend hands out, used to estimate manifest size.
            std::size_t max_reference_length = 20;
            // Messages requested per history page.
            std::size_t history_page_size = 100;

            // Largest chunk that still fits an attachment.
            std::size_t maxChunkSize() const;

            // Chunk size used when the caller doesn't pick one.
            std::size_t defaultChunkSize() const { return maxChunkSize(); }

            // Throws ConfigError unless 0 < chunk_size <= maxChunkSize().
            void validateChunkSize(std::size_t chunk_size) const;
        };

        // Per-operation knobs for uploads and downloads.
        struct TransferSettings
        {
            // 0 selects BackendLimits::defaultChunkSize().
            std::size_t chunk_size = 0;
            // Worker pool size, i.e. the number of requests in flight.
            std::size_t concurrency = 4;
            Transfer::RetryPolicy retry;

            // Throws ConfigError on a zero concurrency.
            void validate() const;
        };

        class StoreConfig
        {
        public:
            static const size_t DEFAULT_CONCURRENCY = 4;

            // Directory under the user config dir that holds our settings
            inline static const std::string APP_DIR_NAME = "channel-store";
            inline static const std::string SETTINGS_FILE_NAME = "settings.json";

            // Base config directory: $XDG_CONFIG_HOME, else $HOME/.config.
            // Throws ConfigError if neither is set.
            static std::filesystem::path defaultConfigBase();

            // <base>/channel-store/settings.json, creating the directory.
            // base defaults to defaultConfigBase().
            static std::filesystem::path getSettingsFilePath(
                const std::optional<std::filesystem::path> &base = std::nullopt);

            // Create the directory if it doesn't exist yet
            static std::filesystem::path ensureDirectoryExists(const std::filesystem::path &dir_path);
        };

    } // namespace Config
} // namespace ChannelStore
