// src/uploader.cpp
#include "uploader.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <vector>

#include "chunk.hpp"
#include "errors.hpp"
#include "thread_pool.hpp"

namespace fs = std::filesystem;

namespace ChannelStore
{
    namespace Transfer
    {

        Uploader::Uploader(Transport::MessageTransport &transport, std::string channel, Config::BackendLimits limits)
            : transport_(transport), channel_(std::move(channel)), limits_(limits)
        {
            if (channel_.empty())
            {
                throw ConfigError("No channel set.");
            }
        }

        std::size_t Uploader::selectChunkSize(const std::string &file_name, std::uint64_t total_size, std::size_t requested) const
        {
            limits_.validateChunkSize(requested);
            const std::size_t max_chunk = limits_.maxChunkSize();

            std::size_t size = requested;
            for (;;)
            {
                // More chunks than body bytes can never fit, skip building a manifest
                std::size_t count = Chunks::chunkCountFor(total_size, size);
                if (count <= limits_.max_message_body_bytes &&
                    Metadata::Manifest::estimateSerializedSize(file_name, total_size, size, limits_.max_reference_length) <=
                        limits_.max_message_body_bytes)
                {
                    return size;
                }
                if (size >= max_chunk)
                {
                    throw ManifestTooLarge("A manifest for '" + file_name + "' (" + std::to_string(total_size) +
                                           " bytes) does not fit in " + std::to_string(limits_.max_message_body_bytes) +
                                           " bytes even at the largest chunk size of " + std::to_string(max_chunk) + " bytes.");
                }
                size = std::min(size * 2, max_chunk);
            }
        }

        RootReference Uploader::upload(const fs::path &file_path, std::size_t chunk_size, std::size_t concurrency)
        {
            UploadOptions options;
            options.transfer.chunk_size = chunk_size;
            options.transfer.concurrency = concurrency;
            return uploadFile(file_path, options).root;
        }

        UploadResult Uploader::uploadFile(const fs::path &file_path, const UploadOptions &options)
        {
            options.transfer.validate();
            if (!fs::is_regular_file(file_path))
            {
                throw ConfigError("Input file not found: " + file_path.string());
            }

            const std::string file_name = options.file_name.empty() ? file_path.filename().string() : options.file_name;
            if (!Metadata::isPlainFileName(file_name))
            {
                throw ConfigError("Cannot store '" + file_name +
                                  "': names must be valid UTF-8 without path separators, quotes or control characters.");
            }
            const std::uint64_t file_size = fs::file_size(file_path);
            const std::size_t requested = options.transfer.chunk_size == 0 ? limits_.defaultChunkSize() : options.transfer.chunk_size;
            const std::size_t chunk_size = selectChunkSize(file_name, file_size, requested);
            if (chunk_size != requested)
            {
                std::cout << "Chunk size raised from " << requested << " to " << chunk_size
                          << " bytes so the manifest fits one message." << std::endl;
            }

            const std::size_t chunk_count = Chunks::chunkCountFor(file_size, chunk_size);
            const std::size_t window = 2 * options.transfer.concurrency;
            std::cout << "Uploading file: " << file_name << " (" << file_size << " bytes, "
                      << chunk_count << " chunks)" << std::endl;

            std::atomic<bool> stop(false);
            const StopCheck stop_requested = [&stop, &options]()
            { return stopRequested(stop, options.abort); };

            std::mutex progress_mutex;
            std::size_t published = 0;
            std::string whole_file_hash;

            // One slot per chunk index, each written by exactly one task
            std::vector<std::future<Metadata::ChunkEntry>> futures(chunk_count);
            {
                // Declared after everything the tasks capture, so its destructor
                // drains the workers before those go away
                Concurrency::ThreadPool pool(options.transfer.concurrency);

                try
                {
                    Chunks::ChunkReader reader(file_path, chunk_size);
                    for (std::size_t i = 0; i < chunk_count; ++i)
                    {
                        if (i >= window)
                        {
                            futures[i - window].wait();
                        }
                        if (stop_requested())
                        {
                            break;
                        }

                        std::optional<Chunks::Chunk> chunk = reader.next();
                        if (!chunk)
                        {
                            throw std::runtime_error("Input file shrank while it was being read: " + file_path.string());
                        }

                        futures[i] = pool.enqueue(
                            [this, &options, &stop, &stop_requested, &progress_mutex, &published, &file_name, chunk_count,
                             part = std::move(*chunk)]() -> Metadata::ChunkEntry
                            {
                                const std::string label = file_name + " [" + std::to_string(part.index + 1) + "/" +
                                                          std::to_string(chunk_count) + "]";
                                try
                                {
                                    MessageId id = runWithRetry(options.transfer.retry, ErrorKind::UploadFailed,
                                                                "publishing chunk " + label, stop_requested,
                                                                [&]()
                                                                {
                                                                    Transport::OutgoingMessage message;
                                                                    message.body = label;
                                                                    message.attachment = Transport::Attachment{
                                                                        Chunks::Chunk::partFileName(file_name, part.index), part.data};
                                                                    return transport_.publish(channel_, message);
                                                                });

                                    std::lock_guard<std::mutex> lock(progress_mutex);
                                    ++published;
                                    if (options.on_progress)
                                    {
                                        options.on_progress(ProgressEvent{ProgressStage::ChunkPublished, published, chunk_count,
                                                                          part.data.size()});
                                    }
                                    return Metadata::ChunkEntry{part.index, ChunkReference(id.str()), part.hash};
                                }
                                catch (const std::exception &)
                                {
                                    stop = true;
                                    throw;
                                }
                            });
                    }

                    if (!stop_requested())
                    {
                        if (reader.next())
                        {
                            throw std::runtime_error("Input file grew while it was being read: " + file_path.string());
                        }
                        whole_file_hash = reader.wholeFileHash();
                    }
                }
                catch (const std::exception &)
                {
                    // Queued chunks see the flag and bail out
                    stop = true;
                    throw;
                }
            }

            std::vector<Metadata::ChunkEntry> entries;
            entries.reserve(chunk_count);
            for (std::size_t i = 0; i < chunk_count; ++i)
            {
                if (!futures[i].valid())
                {
                    // Never enqueued because the upload was stopped
                    rethrowFirstRealFailure(futures, i + 1);
                    throw Cancelled("Upload of '" + file_name + "' cancelled after " + std::to_string(published) +
                                    " of " + std::to_string(chunk_count) + " chunks.");
                }
                try
                {
                    entries.push_back(futures[i].get());
                }
                catch (const Cancelled &)
                {
                    rethrowFirstRealFailure(futures, i + 1);
                    throw;
                }
            }
            if (stop_requested())
            {
                throw Cancelled("Upload of '" + file_name + "' cancelled.");
            }

            Metadata::Manifest manifest(file_name, file_size, chunk_size, whole_file_hash, std::move(entries));
            RootReference root = publishManifest(manifest, options);

            std::cout << "File '" << file_name << "' uploaded successfully as " << root << "." << std::endl;
            return UploadResult{std::move(root), std::move(manifest)};
        }

        RootReference Uploader::publishManifest(const Metadata::Manifest &manifest, const UploadOptions &options)
        {
            const std::string body = manifest.serialize();
            if (body.size() > limits_.max_message_body_bytes)
            {
                // The chunks are already published and are left behind as orphans
                throw ManifestTooLarge("Manifest for '" + manifest.file_name + "' is " + std::to_string(body.size()) +
                                       " bytes, over the " + std::to_string(limits_.max_message_body_bytes) + " byte limit.");
            }

            const StopCheck stop_requested = [&options]()
            { return options.abort != nullptr && options.abort->load(); };

            MessageId id = runWithRetry(options.transfer.retry, ErrorKind::UploadFailed,
                                        "publishing manifest of " + manifest.file_name, stop_requested,
                                        [&]()
                                        {
                                            Transport::OutgoingMessage message;
                                            message.body = body;
                                            return transport_.publish(channel_, message);
                                        });

            if (options.on_progress)
            {
                options.on_progress(ProgressEvent{ProgressStage::ManifestPublished, manifest.chunks.size(),
                                                  manifest.chunks.size(), body.size()});
            }
            return RootReference(id.str());
        }

    } // namespace Transfer
} // namespace ChannelStore
