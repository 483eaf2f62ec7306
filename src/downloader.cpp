// src/downloader.cpp
#include "downloader.hpp"
#include <algorithm>
#include <iostream>
#include <vector>

#include "chunk.hpp"
#include "errors.hpp"
#include "staged_file.hpp"
#include "thread_pool.hpp"

namespace fs = std::filesystem;

namespace ChannelStore
{
    namespace Transfer
    {

        Downloader::Downloader(Transport::MessageTransport &transport, std::string channel, Config::BackendLimits limits)
            : transport_(transport), channel_(std::move(channel)), limits_(limits)
        {
            if (channel_.empty())
            {
                throw ConfigError("No channel set.");
            }
        }

        fs::path Downloader::resolveDestination(const fs::path &destination, const std::string &file_name)
        {
            if (destination.empty())
            {
                return fs::current_path() / file_name;
            }
            if (fs::is_directory(destination))
            {
                return destination / file_name;
            }
            return destination;
        }

        std::uint64_t Downloader::download(const RootReference &root, const fs::path &destination, std::size_t concurrency)
        {
            DownloadOptions options;
            options.transfer.concurrency = concurrency;
            return downloadFile(root, destination, options).bytes;
        }

        Metadata::Manifest Downloader::fetchManifest(const RootReference &root, const DownloadOptions &options)
        {
            if (root.empty())
            {
                throw ConfigError("Root reference must not be empty.");
            }

            const StopCheck stop_requested = [&options]()
            { return options.abort != nullptr && options.abort->load(); };

            Transport::StoredMessage message;
            try
            {
                message = runWithRetry(options.transfer.retry, ErrorKind::DownloadFailed,
                                       "fetching manifest " + root.str(), stop_requested,
                                       [&]()
                                       { return transport_.fetch(channel_, MessageId(root.str())); });
            }
            catch (const NotFound &)
            {
                throw ManifestNotFound(root.str());
            }

            Metadata::Manifest manifest = Metadata::Manifest::deserialize(message.body);
            if (options.on_progress)
            {
                options.on_progress(ProgressEvent{ProgressStage::ManifestFetched, 0, manifest.chunks.size(),
                                                  message.body.size()});
            }
            return manifest;
        }

        DownloadResult Downloader::downloadFile(const RootReference &root, const fs::path &destination,
                                                const DownloadOptions &options)
        {
            options.transfer.validate();

            Metadata::Manifest manifest = fetchManifest(root, options);
            const std::size_t chunk_count = manifest.chunks.size();
            const std::size_t window = 2 * options.transfer.concurrency;
            const fs::path final_path = resolveDestination(destination, manifest.file_name);

            std::cout << "Retrieving file: " << manifest.file_name << " (" << manifest.total_size << " bytes, "
                      << chunk_count << " chunks)" << std::endl;

            std::atomic<bool> stop(false);
            const StopCheck stop_requested = [&stop, &options]()
            { return stopRequested(stop, options.abort); };

            StagedFile staged(final_path);
            Chunks::ChunkAssembler assembler(staged.stream(), manifest.chunkHashes(), manifest.total_size,
                                             manifest.whole_file_hash);

            auto fetch_chunk = [this, &options, &stop, &stop_requested, &manifest, chunk_count](std::size_t index)
            {
                const Metadata::ChunkEntry &entry = manifest.chunks[index];
                const std::string label = manifest.file_name + " [" + std::to_string(index + 1) + "/" +
                                          std::to_string(chunk_count) + "]";
                try
                {
                    Transport::StoredMessage message =
                        runWithRetry(options.transfer.retry, ErrorKind::DownloadFailed, "fetching chunk " + label,
                                     stop_requested,
                                     [&]()
                                     { return transport_.fetch(channel_, MessageId(entry.reference.str())); });
                    if (!message.attachment)
                    {
                        throw IntegrityError("Chunk " + label + " (message " + entry.reference.str() +
                                             ") has no attachment.");
                    }
                    return std::move(message.attachment->data);
                }
                catch (const std::exception &)
                {
                    stop = true;
                    throw;
                }
            };

            std::uint64_t bytes = 0;
            // One slot per chunk index; at most `window` of them hold data
            std::vector<std::future<std::vector<char>>> futures(chunk_count);
            {
                Concurrency::ThreadPool pool(options.transfer.concurrency);
                try
                {
                    std::size_t next_to_enqueue = 0;
                    for (; next_to_enqueue < std::min(window, chunk_count); ++next_to_enqueue)
                    {
                        futures[next_to_enqueue] = pool.enqueue(fetch_chunk, next_to_enqueue);
                    }

                    for (std::size_t i = 0; i < chunk_count; ++i)
                    {
                        if (!futures[i].valid())
                        {
                            // Stopped before this chunk was requested
                            break;
                        }
                        std::vector<char> blob;
                        try
                        {
                            blob = futures[i].get();
                        }
                        catch (const Cancelled &)
                        {
                            rethrowFirstRealFailure(futures, i + 1);
                            throw;
                        }

                        // Strictly in manifest order, whatever order the fetches finished in
                        assembler.append(i, blob);
                        if (options.on_progress)
                        {
                            options.on_progress(ProgressEvent{ProgressStage::ChunkFetched, i + 1, chunk_count, blob.size()});
                        }

                        if (next_to_enqueue < chunk_count && !stop_requested())
                        {
                            futures[next_to_enqueue] = pool.enqueue(fetch_chunk, next_to_enqueue);
                            ++next_to_enqueue;
                        }
                    }
                    if (assembler.nextIndex() < chunk_count || stop_requested())
                    {
                        throw Cancelled("Download of '" + manifest.file_name + "' cancelled.");
                    }
                    bytes = assembler.finish();
                }
                catch (const std::exception &)
                {
                    stop = true;
                    throw;
                }
            }

            staged.commit();
            if (options.on_progress)
            {
                options.on_progress(ProgressEvent{ProgressStage::Verified, chunk_count, chunk_count, bytes});
            }
            std::cout << "File '" << manifest.file_name << "' retrieved to '" << final_path.string()
                      << "' successfully." << std::endl;
            return DownloadResult{final_path, bytes, std::move(manifest)};
        }

    } // namespace Transfer
} // namespace ChannelStore
