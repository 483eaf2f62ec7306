// include/downloader.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

#include "manifest.hpp"
#include "reference.hpp"
#include "store_config.hpp"
#include "transfer.hpp"
#include "transport.hpp"

namespace ChannelStore
{
    namespace Transfer
    {

        struct DownloadOptions
        {
            Config::TransferSettings transfer;
            ProgressCallback on_progress;
            // Caller-owned; setting it stops the download with Cancelled.
            const std::atomic<bool> *abort = nullptr;
        };

        struct DownloadResult
        {
            std::filesystem::path path;
            std::uint64_t bytes = 0;
            Metadata::Manifest manifest;
        };

        // Rebuilds a stored file from its root reference. The output only
        // appears once every chunk and the whole file have been verified.
        class Downloader
        {
        public:
            Downloader(Transport::MessageTransport &transport, std::string channel, Config::BackendLimits limits);

            // Returns the number of bytes written.
            std::uint64_t download(const RootReference &root, const std::filesystem::path &destination, std::size_t concurrency);

            DownloadResult downloadFile(const RootReference &root, const std::filesystem::path &destination,
                                        const DownloadOptions &options);

            // Fetches and decodes the manifest only.
            // Throws ManifestNotFound, CorruptManifest or UnsupportedVersion.
            Metadata::Manifest fetchManifest(const RootReference &root, const DownloadOptions &options);

            // Empty destination: current directory. Existing directory: the
            // manifest's file name inside it. Anything else is the file path.
            static std::filesystem::path resolveDestination(const std::filesystem::path &destination,
                                                            const std::string &file_name);

        private:
            Transport::MessageTransport &transport_;
            std::string channel_;
            Config::BackendLimits limits_;
        };

    } // namespace Transfer
} // namespace ChannelStore
