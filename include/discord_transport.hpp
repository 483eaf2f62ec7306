// include/discord_transport.hpp
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp> // For Discord API payloads
#include "store_config.hpp"
#include "transport.hpp"

namespace ChannelStore
{
    namespace Transport
    {

        // MessageTransport over the Discord REST API, using a bot token.
        // Chunks are message attachments; manifests are message bodies.
        class DiscordTransport : public MessageTransport
        {
        public:
            struct Options
            {
                std::string api_base = "https://discord.com/api/v10";
                long timeout_seconds = 120;
                std::string user_agent = "DiscordBot (https://github.com/channel-store, 1.0)";
            };

            struct HttpResponse
            {
                long status = 0;
                std::string body;
                // Raw value of the Retry-After header, if any
                std::string retry_after_header;
            };

            explicit DiscordTransport(std::string token);
            DiscordTransport(std::string token, Options options);

            // Limits of a channel without server boosts.
            static Config::BackendLimits defaultLimits();

            MessageId publish(const std::string &channel, const OutgoingMessage &message) override;
            StoredMessage fetch(const std::string &channel, const MessageId &id) override;
            HistoryPage listRecent(const std::string &channel,
                                   const std::optional<MessageId> &before,
                                   std::size_t limit) override;

            // Maps a response to the store's exceptions. Returns normally on 2xx.
            static void checkStatus(const HttpResponse &response);

            // Delay asked for by a 429: JSON "retry_after" (seconds), else the
            // Retry-After header, else one second.
            static std::chrono::milliseconds parseRetryAfter(const HttpResponse &response);

            static HistoryEntry parseHistoryEntry(const nlohmann::json &message);

            // Message object without downloading its attachment. The attachment
            // URL is returned through attachment_url when present.
            static StoredMessage parseStoredMessage(const nlohmann::json &message, std::optional<std::string> *attachment_url);

        private:
            HttpResponse perform(const std::string &method,
                                 const std::string &url,
                                 const std::optional<std::string> &json_body,
                                 const Attachment *attachment,
                                 bool authorized) const;

            std::string channelUrl(const std::string &channel) const;

            std::string token_;
            Options options_;
        };

    } // namespace Transport
} // namespace ChannelStore
