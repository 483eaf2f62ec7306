// tests/discord_transport_test.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <optional>
#include <string>

#include "discord_transport.hpp"
#include "errors.hpp"

using namespace ChannelStore;
using ChannelStore::Transport::DiscordTransport;

namespace {

DiscordTransport::HttpResponse response(long status, const std::string& body, const std::string& retry_after = "") {
    DiscordTransport::HttpResponse r;
    r.status = status;
    r.body = body;
    r.retry_after_header = retry_after;
    return r;
}

} // namespace

TEST(DiscordTransportTest, SuccessPassesThrough) {
    EXPECT_NO_THROW(DiscordTransport::checkStatus(response(200, "{}")));
    EXPECT_NO_THROW(DiscordTransport::checkStatus(response(204, "")));
}

TEST(DiscordTransportTest, StatusCodesMapToStoreErrors) {
    EXPECT_THROW(DiscordTransport::checkStatus(response(429, R"({"retry_after": 0.5})")), RateLimited);
    EXPECT_THROW(DiscordTransport::checkStatus(response(413, "request entity too large")), PayloadTooLarge);
    EXPECT_THROW(DiscordTransport::checkStatus(response(400, R"({"code": 40005, "message": "Request entity too large"})")),
                 PayloadTooLarge);
    EXPECT_THROW(DiscordTransport::checkStatus(response(404, R"({"code": 10008, "message": "Unknown Message"})")), NotFound);
    EXPECT_THROW(DiscordTransport::checkStatus(response(401, R"({"message": "401: Unauthorized"})")), ConfigError);
    EXPECT_THROW(DiscordTransport::checkStatus(response(403, R"({"message": "Missing Access"})")), ConfigError);
    EXPECT_THROW(DiscordTransport::checkStatus(response(500, "<html>oops</html>")), TransportError);
    EXPECT_THROW(DiscordTransport::checkStatus(response(502, "")), TransportError);
}

TEST(DiscordTransportTest, RateLimitCarriesTheRequestedDelay) {
    try {
        DiscordTransport::checkStatus(response(429, R"({"message": "You are being rate limited.", "retry_after": 1.25})"));
        FAIL() << "expected RateLimited";
    } catch (const RateLimited& e) {
        EXPECT_EQ(e.retryAfter(), std::chrono::milliseconds(1250));
    }
}

TEST(DiscordTransportTest, RetryAfterSources) {
    // Body wins over the header; fractions round up
    EXPECT_EQ(DiscordTransport::parseRetryAfter(response(429, R"({"retry_after": 0.0011})", "9")),
              std::chrono::milliseconds(2));
    EXPECT_EQ(DiscordTransport::parseRetryAfter(response(429, "", "3")), std::chrono::milliseconds(3000));
    EXPECT_EQ(DiscordTransport::parseRetryAfter(response(429, "not json", "")), std::chrono::milliseconds(1000));
    EXPECT_EQ(DiscordTransport::parseRetryAfter(response(429, "", "Wed, 21 Oct 2015 07:28:00 GMT")),
              std::chrono::milliseconds(1000));
}

TEST(DiscordTransportTest, ParsesHistoryEntries) {
    auto json = nlohmann::json::parse(R"({
        "id": "1180000000000000001",
        "content": "notes.txt [1/3]",
        "timestamp": "2024-05-01T10:00:00.000000+00:00",
        "attachments": [{"id": "1", "filename": "notes.txt.part0", "url": "https://cdn.example/1"}]
    })");
    auto entry = DiscordTransport::parseHistoryEntry(json);
    EXPECT_EQ(entry.id.str(), "1180000000000000001");
    EXPECT_EQ(entry.body, "notes.txt [1/3]");
    EXPECT_EQ(entry.timestamp, "2024-05-01T10:00:00.000000+00:00");
    EXPECT_EQ(entry.attachment_count, 1u);

    EXPECT_THROW(DiscordTransport::parseHistoryEntry(nlohmann::json::parse(R"({"content": "x"})")), TransportError);
    EXPECT_THROW(DiscordTransport::parseHistoryEntry(nlohmann::json::parse(R"({"id": 5})")), TransportError);
}

TEST(DiscordTransportTest, ParsesStoredMessagesAndAttachmentUrl) {
    auto with_file = nlohmann::json::parse(R"({
        "id": "42",
        "content": "c",
        "attachments": [{"filename": "f.part2", "url": "https://cdn.example/f.part2?sig=abc"}]
    })");
    std::optional<std::string> url;
    auto stored = DiscordTransport::parseStoredMessage(with_file, &url);
    EXPECT_EQ(stored.id.str(), "42");
    ASSERT_TRUE(stored.attachment.has_value());
    EXPECT_EQ(stored.attachment->file_name, "f.part2");
    EXPECT_TRUE(stored.attachment->data.empty());
    EXPECT_EQ(url, std::optional<std::string>("https://cdn.example/f.part2?sig=abc"));

    std::optional<std::string> no_url;
    auto text = DiscordTransport::parseStoredMessage(nlohmann::json::parse(R"({"id": "43", "content": "hi"})"), &no_url);
    EXPECT_FALSE(text.attachment.has_value());
    EXPECT_FALSE(no_url.has_value());
    EXPECT_TRUE(text.timestamp.empty());
}

TEST(DiscordTransportTest, MissingTokenIsAConfigError) {
    EXPECT_THROW(DiscordTransport transport(""), ConfigError);
}

TEST(DiscordTransportTest, DefaultLimitsMatchUnboostedChannels) {
    auto limits = DiscordTransport::defaultLimits();
    EXPECT_EQ(limits.max_message_body_bytes, 2000u);
    EXPECT_EQ(limits.history_page_size, 100u);
    EXPECT_LT(limits.maxChunkSize(), limits.max_attachment_bytes);
    EXPECT_GT(limits.maxChunkSize(), 0u);
}
