// src/file_store.cpp
#include "file_store.hpp"
#include <iostream>

#include "chunk.hpp"
#include "discord_transport.hpp"
#include "errors.hpp"
#include "staged_file.hpp"

namespace fs = std::filesystem;

namespace ChannelStore
{

    FileStore::FileStore(std::shared_ptr<Transport::MessageTransport> transport,
                         std::string channel,
                         Config::BackendLimits limits,
                         Config::TransferSettings settings)
        : transport_(std::move(transport)),
          channel_(std::move(channel)),
          limits_(limits),
          settings_(std::move(settings))
    {
        if (!transport_)
        {
            throw std::invalid_argument("FileStore needs a transport.");
        }
        if (channel_.empty())
        {
            throw ConfigError("No channel set.");
        }
        settings_.validate();
    }

    FileStore FileStore::connect(const Config::Credentials &credentials, Config::TransferSettings settings)
    {
        return FileStore(std::make_shared<Transport::DiscordTransport>(credentials.token),
                         credentials.channel,
                         Transport::DiscordTransport::defaultLimits(),
                         std::move(settings));
    }

    Transfer::UploadResult FileStore::uploadFile(const fs::path &input_filepath,
                                                 const std::string &file_name,
                                                 const Transfer::ProgressCallback &on_progress,
                                                 const std::atomic<bool> *abort)
    {
        Transfer::UploadOptions options;
        options.transfer = settings_;
        options.file_name = file_name;
        options.on_progress = on_progress;
        options.abort = abort;

        Transfer::Uploader uploader(*transport_, channel_, limits_);
        return uploader.uploadFile(input_filepath, options);
    }

    Transfer::DownloadResult FileStore::retrieveFile(const RootReference &root,
                                                     const fs::path &destination,
                                                     const Transfer::ProgressCallback &on_progress,
                                                     const std::atomic<bool> *abort)
    {
        Transfer::DownloadOptions options;
        options.transfer = settings_;
        options.on_progress = on_progress;
        options.abort = abort;

        Transfer::Downloader downloader(*transport_, channel_, limits_);
        return downloader.downloadFile(root, destination, options);
    }

    Catalogue::CatalogueScanner FileStore::listFiles(const std::optional<MessageId> &cursor) const
    {
        return Catalogue::Catalogue(*transport_, channel_, limits_, settings_.retry).list(cursor);
    }

    std::vector<Catalogue::CatalogueEntry> FileStore::listAllFiles() const
    {
        return Catalogue::Catalogue(*transport_, channel_, limits_, settings_.retry).listAll();
    }

    Metadata::Manifest FileStore::disassemble(const fs::path &file, const fs::path &out_dir, std::size_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw ConfigError("Chunk size must be greater than zero.");
        }
        if (!fs::is_regular_file(file))
        {
            throw ConfigError("Input file not found: " + file.string());
        }
        const std::string file_name = file.filename().string();
        if (!Metadata::isPlainFileName(file_name))
        {
            throw ConfigError("Cannot disassemble '" + file_name +
                              "': names must be valid UTF-8 without quotes or control characters.");
        }
        Config::StoreConfig::ensureDirectoryExists(out_dir);

        std::vector<Metadata::ChunkEntry> entries;

        Chunks::ChunkReader reader(file, chunk_size);
        while (std::optional<Chunks::Chunk> chunk = reader.next())
        {
            fs::path written = chunk->save(out_dir, file_name);
            entries.push_back(Metadata::ChunkEntry{chunk->index, ChunkReference(written.filename().string()), chunk->hash});
        }

        Metadata::Manifest manifest(file_name, reader.bytesRead(), chunk_size, reader.wholeFileHash(), std::move(entries));
        manifest.validate();
        manifest.save(out_dir);

        std::cout << "Disassembled " << file_name << " into " << manifest.chunks.size() << " parts in "
                  << out_dir.string() << std::endl;
        return manifest;
    }

    fs::path FileStore::assemble(const std::string &file_name,
                                 const fs::path &parts_dir,
                                 const std::optional<fs::path> &output)
    {
        Metadata::Manifest manifest = Metadata::Manifest::load(parts_dir, file_name);

        fs::path final_path = output ? *output : parts_dir / manifest.file_name;
        if (fs::is_directory(final_path))
        {
            final_path /= manifest.file_name;
        }

        StagedFile staged(final_path);
        Chunks::ChunkAssembler assembler(staged.stream(), manifest.chunkHashes(), manifest.total_size,
                                         manifest.whole_file_hash);
        for (const Metadata::ChunkEntry &entry : manifest.chunks)
        {
            // Local manifests reference part files by plain name only
            const fs::path part_name(entry.reference.str());
            if (part_name.filename() != part_name || part_name == "." || part_name == "..")
            {
                throw CorruptManifest("Part reference '" + entry.reference.str() + "' is not a plain file name.");
            }
            std::cout << "Writing " << (parts_dir / part_name).string() << std::endl;
            assembler.append(entry.index, Chunks::Chunk::loadData(parts_dir / part_name));
        }
        std::uint64_t bytes = assembler.finish();
        staged.commit();

        std::cout << "Assembled " << manifest.chunks.size() << " parts into " << final_path.string() << " ("
                  << bytes << " bytes)" << std::endl;
        return final_path;
    }

} // namespace ChannelStore
