// src/discord_transport.cpp
#include "discord_transport.hpp"
#include <cctype>
#include <cmath>
#include <memory>
#include <mutex>
#include <stdexcept>

#include <curl/curl.h> // For HTTP requests

#include "errors.hpp"

namespace ChannelStore
{
    namespace Transport
    {

        namespace
        {
            // Discord error code for "Request entity too large"
            constexpr int PAYLOAD_TOO_LARGE_CODE = 40005;

            std::once_flag curl_init_flag;

            struct EasyDeleter
            {
                void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
            };
            struct SlistDeleter
            {
                void operator()(curl_slist *list) const { curl_slist_free_all(list); }
            };
            struct MimeDeleter
            {
                void operator()(curl_mime *mime) const { curl_mime_free(mime); }
            };

            size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
            {
                auto *out = static_cast<std::string *>(userdata);
                out->append(ptr, size * nmemb);
                return size * nmemb;
            }

            size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
            {
                auto *response = static_cast<DiscordTransport::HttpResponse *>(userdata);
                std::string line(buffer, size * nitems);
                auto colon = line.find(':');
                if (colon != std::string::npos)
                {
                    std::string name = line.substr(0, colon);
                    for (char &c : name)
                    {
                        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                    }
                    if (name == "retry-after")
                    {
                        std::string value = line.substr(colon + 1);
                        auto first = value.find_first_not_of(" \t");
                        auto last = value.find_last_not_of(" \t\r\n");
                        response->retry_after_header =
                            first == std::string::npos ? "" : value.substr(first, last - first + 1);
                    }
                }
                return size * nitems;
            }

            nlohmann::json parseBody(const DiscordTransport::HttpResponse &response)
            {
                nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
                if (j.is_discarded())
                {
                    throw TransportError("Unreadable response from Discord (HTTP " + std::to_string(response.status) + ").");
                }
                return j;
            }

            std::string errorDetail(const DiscordTransport::HttpResponse &response)
            {
                nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
                if (j.is_object() && j.contains("message") && j["message"].is_string())
                {
                    return j["message"].get<std::string>();
                }
                return response.body.substr(0, 200);
            }
        } // namespace

        DiscordTransport::DiscordTransport(std::string token) : DiscordTransport(std::move(token), Options())
        {
        }

        DiscordTransport::DiscordTransport(std::string token, Options options)
            : token_(std::move(token)), options_(std::move(options))
        {
            if (token_.empty())
            {
                throw ConfigError("No token set.");
            }
            std::call_once(curl_init_flag, []()
                           { curl_global_init(CURL_GLOBAL_DEFAULT); });
        }

        Config::BackendLimits DiscordTransport::defaultLimits()
        {
            Config::BackendLimits limits;
            limits.max_attachment_bytes = 10 * 1024 * 1024;
            limits.framing_overhead_bytes = 256 * 1024;
            limits.max_message_body_bytes = 2000;
            // Snowflakes are 64-bit integers: at most 20 decimal digits
            limits.max_reference_length = 20;
            limits.history_page_size = 100;
            return limits;
        }

        void DiscordTransport::checkStatus(const HttpResponse &response)
        {
            if (response.status >= 200 && response.status < 300)
            {
                return;
            }
            if (response.status == 429)
            {
                throw RateLimited(parseRetryAfter(response), "Rate limited by Discord: " + errorDetail(response));
            }

            int code = 0;
            nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
            if (j.is_object() && j.contains("code") && j["code"].is_number_integer())
            {
                code = j["code"].get<int>();
            }

            if (response.status == 413 || code == PAYLOAD_TOO_LARGE_CODE)
            {
                throw PayloadTooLarge("Discord rejected the attachment as too large: " + errorDetail(response));
            }
            if (response.status == 404)
            {
                throw NotFound("Discord returned 404: " + errorDetail(response));
            }
            if (response.status == 401 || response.status == 403)
            {
                throw ConfigError("Discord refused the request (HTTP " + std::to_string(response.status) +
                                  "), check the token and channel: " + errorDetail(response));
            }
            throw TransportError("Discord returned HTTP " + std::to_string(response.status) + ": " + errorDetail(response));
        }

        std::chrono::milliseconds DiscordTransport::parseRetryAfter(const HttpResponse &response)
        {
            nlohmann::json j = nlohmann::json::parse(response.body, nullptr, false);
            if (j.is_object() && j.contains("retry_after") && j["retry_after"].is_number())
            {
                double seconds = j["retry_after"].get<double>();
                if (seconds >= 0)
                {
                    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
                }
            }
            if (!response.retry_after_header.empty())
            {
                try
                {
                    double seconds = std::stod(response.retry_after_header);
                    if (seconds >= 0)
                    {
                        return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
                    }
                }
                catch (const std::logic_error &)
                {
                    // HTTP-date form or out of range: use the default below
                }
            }
            return std::chrono::milliseconds(1000);
        }

        HistoryEntry DiscordTransport::parseHistoryEntry(const nlohmann::json &message)
        {
            if (!message.is_object() || !message.contains("id") || !message["id"].is_string())
            {
                throw TransportError("Discord message without an id.");
            }
            HistoryEntry entry;
            entry.id = MessageId(message["id"].get<std::string>());
            entry.body = message.value("content", "");
            entry.timestamp = message.value("timestamp", "");
            if (message.contains("attachments") && message["attachments"].is_array())
            {
                entry.attachment_count = message["attachments"].size();
            }
            return entry;
        }

        StoredMessage DiscordTransport::parseStoredMessage(const nlohmann::json &message,
                                                           std::optional<std::string> *attachment_url)
        {
            HistoryEntry entry = parseHistoryEntry(message);
            StoredMessage stored;
            stored.id = entry.id;
            stored.body = std::move(entry.body);
            stored.timestamp = std::move(entry.timestamp);

            if (message.contains("attachments") && message["attachments"].is_array() && !message["attachments"].empty())
            {
                const nlohmann::json &first = message["attachments"][0];
                Attachment attachment;
                attachment.file_name = first.value("filename", "");
                stored.attachment = std::move(attachment);
                if (attachment_url != nullptr && first.contains("url") && first["url"].is_string())
                {
                    *attachment_url = first["url"].get<std::string>();
                }
            }
            return stored;
        }

        std::string DiscordTransport::channelUrl(const std::string &channel) const
        {
            return options_.api_base + "/channels/" + channel + "/messages";
        }

        DiscordTransport::HttpResponse DiscordTransport::perform(const std::string &method,
                                                                 const std::string &url,
                                                                 const std::optional<std::string> &json_body,
                                                                 const Attachment *attachment,
                                                                 bool authorized) const
        {
            std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
            if (!curl)
            {
                throw TransportError("Cannot initialize curl");
            }

            HttpResponse response;
            curl_slist *raw_headers = nullptr;
            if (authorized)
            {
                raw_headers = curl_slist_append(raw_headers, ("Authorization: Bot " + token_).c_str());
            }
            if (json_body && attachment == nullptr)
            {
                raw_headers = curl_slist_append(raw_headers, "Content-Type: application/json");
            }
            std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);
            std::unique_ptr<curl_mime, MimeDeleter> mime;

            curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
            curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
            curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
            curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
            curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, headerCallback);
            curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response);
            if (headers)
            {
                curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
            }

            if (attachment != nullptr)
            {
                // multipart/form-data: payload_json describes the message, files[0] carries the bytes
                mime.reset(curl_mime_init(curl.get()));
                curl_mimepart *part = curl_mime_addpart(mime.get());
                curl_mime_name(part, "payload_json");
                const std::string payload = json_body ? *json_body : "{}";
                curl_mime_data(part, payload.c_str(), payload.size());
                curl_mime_type(part, "application/json");

                part = curl_mime_addpart(mime.get());
                curl_mime_name(part, "files[0]");
                curl_mime_data(part, attachment->data.data(), attachment->data.size());
                curl_mime_filename(part, attachment->file_name.c_str());
                curl_mime_type(part, "application/octet-stream");

                curl_easy_setopt(curl.get(), CURLOPT_MIMEPOST, mime.get());
            }
            else if (json_body)
            {
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, json_body->c_str());
                curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
            }
            else if (method != "GET")
            {
                curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
            }

            CURLcode res = curl_easy_perform(curl.get());
            if (res != CURLE_OK)
            {
                throw TransportError(std::string("Request to Discord failed: ") + curl_easy_strerror(res));
            }
            curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
            return response;
        }

        MessageId DiscordTransport::publish(const std::string &channel, const OutgoingMessage &message)
        {
            nlohmann::json payload;
            payload["content"] = message.body;
            if (message.attachment)
            {
                nlohmann::json attachment_info;
                attachment_info["id"] = 0;
                attachment_info["filename"] = message.attachment->file_name;
                payload["attachments"] = nlohmann::json::array();
                payload["attachments"].push_back(attachment_info);
            }

            HttpResponse response = perform("POST", channelUrl(channel), payload.dump(),
                                            message.attachment ? &*message.attachment : nullptr, true);
            checkStatus(response);

            nlohmann::json j = parseBody(response);
            if (!j.is_object() || !j.contains("id") || !j["id"].is_string())
            {
                throw TransportError("Discord accepted the message but returned no id.");
            }
            return MessageId(j["id"].get<std::string>());
        }

        StoredMessage DiscordTransport::fetch(const std::string &channel, const MessageId &id)
        {
            HttpResponse response = perform("GET", channelUrl(channel) + "/" + id.str(), std::nullopt, nullptr, true);
            checkStatus(response);

            std::optional<std::string> attachment_url;
            StoredMessage stored = parseStoredMessage(parseBody(response), &attachment_url);
            if (stored.attachment && attachment_url)
            {
                // CDN links are signed; no bot token needed
                HttpResponse file = perform("GET", *attachment_url, std::nullopt, nullptr, false);
                checkStatus(file);
                stored.attachment->data.assign(file.body.begin(), file.body.end());
            }
            return stored;
        }

        HistoryPage DiscordTransport::listRecent(const std::string &channel,
                                                 const std::optional<MessageId> &before,
                                                 std::size_t limit)
        {
            std::string url = channelUrl(channel) + "?limit=" + std::to_string(limit);
            if (before)
            {
                url += "&before=" + before->str();
            }
            HttpResponse response = perform("GET", url, std::nullopt, nullptr, true);
            checkStatus(response);

            nlohmann::json j = parseBody(response);
            if (!j.is_array())
            {
                throw TransportError("Discord returned something other than a message list.");
            }

            HistoryPage page;
            for (const auto &message : j)
            {
                page.entries.push_back(parseHistoryEntry(message));
            }
            // A short page means the start of the channel was reached
            if (!page.entries.empty() && page.entries.size() >= limit)
            {
                page.next_cursor = page.entries.back().id;
            }
            return page;
        }

    } // namespace Transport
} // namespace ChannelStore
