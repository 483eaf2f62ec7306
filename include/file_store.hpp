// include/file_store.hpp
#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "catalogue.hpp"
#include "downloader.hpp"
#include "manifest.hpp"
#include "settings.hpp"
#include "store_config.hpp"
#include "transport.hpp"
#include "uploader.hpp"

namespace ChannelStore
{

    // One channel used as a file store. Front ends (CLI, HTTP service) go
    // through this class; it wires the transport, limits and transfer
    // settings into the uploader, downloader and catalogue.
    class FileStore
    {
    public:
        FileStore(std::shared_ptr<Transport::MessageTransport> transport,
                  std::string channel,
                  Config::BackendLimits limits,
                  Config::TransferSettings settings = Config::TransferSettings());

        // Discord-backed store for the given credentials.
        static FileStore connect(const Config::Credentials &credentials,
                                 Config::TransferSettings settings = Config::TransferSettings());

        // --- Remote operations ---

        // Corresponds to POST /files
        Transfer::UploadResult uploadFile(const std::filesystem::path &input_filepath,
                                          const std::string &file_name = "",
                                          const Transfer::ProgressCallback &on_progress = nullptr,
                                          const std::atomic<bool> *abort = nullptr);

        // Corresponds to GET /files/{root}
        Transfer::DownloadResult retrieveFile(const RootReference &root,
                                              const std::filesystem::path &destination,
                                              const Transfer::ProgressCallback &on_progress = nullptr,
                                              const std::atomic<bool> *abort = nullptr);

        // Corresponds to GET /files
        Catalogue::CatalogueScanner listFiles(const std::optional<MessageId> &cursor = std::nullopt) const;
        std::vector<Catalogue::CatalogueEntry> listAllFiles() const;

        // --- Local operations ---

        // Splits file into <name>.part<N> files plus <name>.manifest in out_dir.
        // The manifest's references are the part file names.
        static Metadata::Manifest disassemble(const std::filesystem::path &file,
                                              const std::filesystem::path &out_dir,
                                              std::size_t chunk_size);

        // Rebuilds <name> from the parts and manifest in parts_dir, verifying
        // every part. output defaults to parts_dir/<name>; a directory gets
        // <name> inside it. Returns the path written.
        static std::filesystem::path assemble(const std::string &file_name,
                                              const std::filesystem::path &parts_dir,
                                              const std::optional<std::filesystem::path> &output = std::nullopt);

        const std::string &channel() const { return channel_; }
        const Config::BackendLimits &limits() const { return limits_; }
        Config::TransferSettings &settings() { return settings_; }
        const Config::TransferSettings &settings() const { return settings_; }

    private:
        std::shared_ptr<Transport::MessageTransport> transport_;
        std::string channel_;
        Config::BackendLimits limits_;
        Config::TransferSettings settings_;
    };

} // namespace ChannelStore
