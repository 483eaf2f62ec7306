// include/transfer.hpp
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <vector>

#include "errors.hpp"

namespace ChannelStore
{
    namespace Transfer
    {

        enum class ProgressStage
        {
            ChunkPublished,
            ManifestPublished,
            ManifestFetched,
            ChunkFetched,
            Verified
        };

        // "chunk N of M published/fetched". Front ends decide how to render it.
        struct ProgressEvent
        {
            ProgressStage stage;
            std::size_t completed = 0;
            std::size_t total = 0;
            std::uint64_t bytes = 0;
        };

        // Never called concurrently: uploads and downloads serialize their events.
        using ProgressCallback = std::function<void(const ProgressEvent &)>;

        // Caller-owned abort flag plus the operation's own stop flag.
        inline bool stopRequested(const std::atomic<bool> &operation_stop, const std::atomic<bool> *caller_abort)
        {
            return operation_stop.load() || (caller_abort != nullptr && caller_abort->load());
        }

        // After one task failed and the rest were told to stop, later tasks fail
        // with Cancelled. Waits for futures[from..] and rethrows the first failure
        // that is not a Cancelled, so the caller reports the real cause.
        template <class T>
        void rethrowFirstRealFailure(std::vector<std::future<T>> &futures, std::size_t from)
        {
            for (std::size_t i = from; i < futures.size(); ++i)
            {
                if (!futures[i].valid())
                {
                    continue;
                }
                try
                {
                    futures[i].get();
                }
                catch (const Cancelled &)
                {
                    // Knock-on effect of the stop, keep looking
                }
            }
        }

    } // namespace Transfer
} // namespace ChannelStore
