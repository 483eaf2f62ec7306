// include/catalogue.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "reference.hpp"
#include "retry_policy.hpp"
#include "store_config.hpp"
#include "transport.hpp"

namespace ChannelStore
{
    namespace Catalogue
    {

        // What a listing shows for one stored file. Built from the manifest
        // message on the fly, never persisted.
        struct CatalogueEntry
        {
            std::string file_name;
            std::uint64_t total_size = 0;
            RootReference root;
            std::string published_at;
            std::size_t chunk_count = 0;
            std::string whole_file_hash;
        };

        // Walks channel history newest first, one page at a time, yielding only
        // the messages that decode as manifests. Pages are fetched on demand.
        class CatalogueScanner
        {
        public:
            // start: resume after this message (a cursor() from an earlier scan).
            CatalogueScanner(Transport::MessageTransport &transport,
                             std::string channel,
                             Transfer::RetryPolicy retry,
                             std::size_t page_size,
                             std::optional<MessageId> start = std::nullopt);

            // Next stored file, or nullopt at the start of the channel.
            // Throws TransferFailed when a page can't be fetched within the retry budget.
            std::optional<CatalogueEntry> next();

            // The last history message examined. A scanner built with it as
            // `start` continues exactly where this one stopped.
            const std::optional<MessageId> &cursor() const { return cursor_; }

            // History messages that were not manifests (or not readable ones).
            std::size_t skipped() const { return skipped_; }

        private:
            bool fetchPage();

            Transport::MessageTransport &transport_;
            std::string channel_;
            Transfer::RetryPolicy retry_;
            std::size_t page_size_;

            std::vector<Transport::HistoryEntry> page_;
            std::size_t position_ = 0;
            std::optional<MessageId> before_;
            bool exhausted_ = false;

            std::optional<MessageId> cursor_;
            std::size_t skipped_ = 0;
        };

        class Catalogue
        {
        public:
            Catalogue(Transport::MessageTransport &transport, std::string channel, Config::BackendLimits limits,
                      Transfer::RetryPolicy retry = Transfer::RetryPolicy());

            CatalogueScanner list(const std::optional<MessageId> &cursor = std::nullopt) const;

            // Drains a scanner. Reads the whole channel history.
            std::vector<CatalogueEntry> listAll() const;

        private:
            Transport::MessageTransport &transport_;
            std::string channel_;
            Config::BackendLimits limits_;
            Transfer::RetryPolicy retry_;
        };

    } // namespace Catalogue
} // namespace ChannelStore
