// include/transport.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "reference.hpp"

namespace ChannelStore
{
    namespace Transport
    {

        struct Attachment
        {
            std::string file_name;
            std::vector<char> data;
        };

        struct OutgoingMessage
        {
            std::string body;
            std::optional<Attachment> attachment;
        };

        struct StoredMessage
        {
            MessageId id;
            std::string body;
            std::optional<Attachment> attachment;
            // Publish time as reported by the backend (ISO 8601)
            std::string timestamp;
        };

        // One message of a history page. Attachments are not downloaded.
        struct HistoryEntry
        {
            MessageId id;
            std::string body;
            std::string timestamp;
            std::size_t attachment_count = 0;
        };

        struct HistoryPage
        {
            // Newest first
            std::vector<HistoryEntry> entries;
            // Pass as `before` to get the next (older) page; empty at the end of history
            std::optional<MessageId> next_cursor;
        };

        // Everything the store needs from the messaging backend. Each call may be
        // slow, rate limited or transiently unavailable; implementations report
        // that with RateLimited / TransportError so the caller can retry.
        // Implementations must be safe to call from several worker threads.
        class MessageTransport
        {
        public:
            virtual ~MessageTransport() = default;

            // Sends a message and returns its id.
            // Throws RateLimited, PayloadTooLarge or TransportError.
            virtual MessageId publish(const std::string &channel, const OutgoingMessage &message) = 0;

            // Retrieves a message including its attachment bytes.
            // Throws NotFound, RateLimited or TransportError.
            virtual StoredMessage fetch(const std::string &channel, const MessageId &id) = 0;

            // Up to `limit` messages older than `before` (or the newest ones).
            // Throws RateLimited or TransportError.
            virtual HistoryPage listRecent(const std::string &channel,
                                           const std::optional<MessageId> &before,
                                           std::size_t limit) = 0;
        };

    } // namespace Transport
} // namespace ChannelStore
