// include/uploader.hpp
#pragma once

#include <atomic>
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

        struct UploadOptions
        {
            Config::TransferSettings transfer;
            // Name recorded in the manifest. Empty means the input file's name.
            std::string file_name;
            ProgressCallback on_progress;
            // Caller-owned; setting it stops the upload with Cancelled.
            const std::atomic<bool> *abort = nullptr;
        };

        struct UploadResult
        {
            RootReference root;
            Metadata::Manifest manifest;
        };

        // Publishes a file as chunk messages followed by one manifest message.
        //
        // A failed or cancelled upload returns no root reference. Chunk messages
        // published before the failure stay in the channel as orphans: nothing
        // points at them and no cleanup is attempted.
        class Uploader
        {
        public:
            Uploader(Transport::MessageTransport &transport, std::string channel, Config::BackendLimits limits);

            RootReference upload(const std::filesystem::path &file_path, std::size_t chunk_size, std::size_t concurrency);

            UploadResult uploadFile(const std::filesystem::path &file_path, const UploadOptions &options);

            // Smallest chunk size >= requested (doubling, capped at the backend's
            // maximum) whose manifest still fits one message body.
            // Throws ConfigError for an invalid request and ManifestTooLarge when
            // even the largest chunk size is not enough.
            std::size_t selectChunkSize(const std::string &file_name, std::uint64_t total_size, std::size_t requested) const;

        private:
            RootReference publishManifest(const Metadata::Manifest &manifest, const UploadOptions &options);

            Transport::MessageTransport &transport_;
            std::string channel_;
            Config::BackendLimits limits_;
        };

    } // namespace Transfer
} // namespace ChannelStore
