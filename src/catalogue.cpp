// src/catalogue.cpp
#include "catalogue.hpp"
#include <iostream>

#include "errors.hpp"
#include "manifest.hpp"

namespace ChannelStore
{
    namespace Catalogue
    {

        CatalogueScanner::CatalogueScanner(Transport::MessageTransport &transport,
                                           std::string channel,
                                           Transfer::RetryPolicy retry,
                                           std::size_t page_size,
                                           std::optional<MessageId> start)
            : transport_(transport),
              channel_(std::move(channel)),
              retry_(std::move(retry)),
              page_size_(page_size),
              before_(start),
              cursor_(std::move(start))
        {
            if (channel_.empty())
            {
                throw ConfigError("No channel set.");
            }
            if (page_size_ == 0)
            {
                throw ConfigError("History page size must be at least 1.");
            }
        }

        bool CatalogueScanner::fetchPage()
        {
            if (exhausted_)
            {
                return false;
            }
            Transport::HistoryPage page = Transfer::runWithRetry(
                retry_, ErrorKind::Transport, "listing channel history", Transfer::StopCheck(),
                [&]()
                { return transport_.listRecent(channel_, before_, page_size_); });

            page_ = std::move(page.entries);
            position_ = 0;
            before_ = page.next_cursor;
            if (!before_)
            {
                exhausted_ = true;
            }
            return !page_.empty();
        }

        std::optional<CatalogueEntry> CatalogueScanner::next()
        {
            for (;;)
            {
                if (position_ >= page_.size() && !fetchPage())
                {
                    return std::nullopt;
                }

                const Transport::HistoryEntry &message = page_[position_++];
                cursor_ = message.id;

                if (!Metadata::Manifest::hasMarker(message.body))
                {
                    ++skipped_;
                    continue;
                }
                try
                {
                    Metadata::Manifest manifest = Metadata::Manifest::deserialize(message.body);
                    CatalogueEntry entry;
                    entry.file_name = manifest.file_name;
                    entry.total_size = manifest.total_size;
                    entry.root = RootReference(message.id.str());
                    entry.published_at = message.timestamp;
                    entry.chunk_count = manifest.chunks.size();
                    entry.whole_file_hash = manifest.whole_file_hash;
                    return entry;
                }
                catch (const CorruptManifest &)
                {
                    ++skipped_;
                }
                catch (const UnsupportedVersion &)
                {
                    ++skipped_;
                }
            }
        }

        Catalogue::Catalogue(Transport::MessageTransport &transport, std::string channel, Config::BackendLimits limits,
                             Transfer::RetryPolicy retry)
            : transport_(transport), channel_(std::move(channel)), limits_(limits), retry_(std::move(retry))
        {
        }

        CatalogueScanner Catalogue::list(const std::optional<MessageId> &cursor) const
        {
            return CatalogueScanner(transport_, channel_, retry_, limits_.history_page_size, cursor);
        }

        std::vector<CatalogueEntry> Catalogue::listAll() const
        {
            std::vector<CatalogueEntry> entries;
            CatalogueScanner scanner = list();
            while (std::optional<CatalogueEntry> entry = scanner.next())
            {
                entries.push_back(std::move(*entry));
            }
            if (scanner.skipped() > 0)
            {
                std::cout << "Skipped " << scanner.skipped() << " messages that are not stored files." << std::endl;
            }
            return entries;
        }

    } // namespace Catalogue
} // namespace ChannelStore
