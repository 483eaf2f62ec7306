// tests/downloader_test.cpp
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <string>
#include <vector>

#include "downloader.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "manifest.hpp"
#include "test_util.hpp"
#include "uploader.hpp"

using namespace ChannelStore;
using ChannelStore::Metadata::Manifest;
using ChannelStore::Testing::FakeTransport;
using ChannelStore::Transfer::DownloadOptions;
using ChannelStore::Transfer::Downloader;
using ChannelStore::Transfer::UploadOptions;
using ChannelStore::Transfer::Uploader;

namespace {

const std::string kChannel = "4242";

Config::BackendLimits smallLimits() {
    Config::BackendLimits limits;
    limits.max_attachment_bytes = 1100;
    limits.framing_overhead_bytes = 100;
    limits.max_message_body_bytes = 100000;
    limits.max_reference_length = 20;
    return limits;
}

DownloadOptions downloadOptions(std::size_t concurrency) {
    DownloadOptions opts;
    opts.transfer.concurrency = concurrency;
    opts.transfer.retry = Testing::instantRetry();
    return opts;
}

// Stores data as `name` and returns the upload result
Transfer::UploadResult store(FakeTransport& transport, const Testing::TempDir& dir, const std::string& name,
                             const std::vector<char>& data, std::size_t chunk_size,
                             const Config::BackendLimits& limits = smallLimits()) {
    Testing::writeFile(dir / name, data);
    UploadOptions opts;
    opts.transfer.chunk_size = chunk_size;
    opts.transfer.concurrency = 4;
    opts.transfer.retry = Testing::instantRetry();
    return Uploader(transport, kChannel, limits).uploadFile(dir / name, opts);
}

} // namespace

TEST(DownloaderTest, RoundTripIsByteIdentical) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto data = Testing::randomBytes(7777);
    auto uploaded = store(transport, src, "photo.jpg", data, 1000);

    Downloader downloader(transport, kChannel, smallLimits());
    auto result = downloader.downloadFile(uploaded.root, out / "copy.jpg", downloadOptions(3));

    EXPECT_EQ(result.path, out / "copy.jpg");
    EXPECT_EQ(result.bytes, data.size());
    EXPECT_EQ(result.manifest, uploaded.manifest);
    EXPECT_EQ(Testing::readFile(out / "copy.jpg"), data);
    // Nothing but the final file is left behind
    EXPECT_EQ(Testing::countEntries(out.path()), 1u);
}

TEST(DownloaderTest, SixtyUnitsInTwentyFiveUnitChunks) {
    const std::size_t unit = 1024;
    Config::BackendLimits limits = smallLimits();
    limits.max_attachment_bytes = 25 * unit + 100;

    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto data = Testing::randomBytes(60 * unit, 7);
    auto uploaded = store(transport, src, "sixty.bin", data, 25 * unit, limits);

    ASSERT_EQ(uploaded.manifest.chunks.size(), 3u);
    std::vector<std::size_t> sizes;
    for (const auto& stored : transport.attachments()) {
        sizes.push_back(stored.attachment->data.size());
    }
    std::sort(sizes.begin(), sizes.end());
    EXPECT_EQ(sizes, (std::vector<std::size_t>{10 * unit, 25 * unit, 25 * unit}));

    Downloader downloader(transport, kChannel, limits);
    EXPECT_EQ(downloader.download(uploaded.root, out.path(), 2), data.size());
    EXPECT_EQ(Testing::readFile(out / "sixty.bin"), data);
}

TEST(DownloaderTest, ConcurrencyDoesNotChangeTheOutput) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto data = Testing::randomBytes(30 * 1000 + 1);
    auto uploaded = store(transport, src, "f.bin", data, 1000);

    Downloader downloader(transport, kChannel, smallLimits());
    downloader.downloadFile(uploaded.root, out / "one.bin", downloadOptions(1));
    downloader.downloadFile(uploaded.root, out / "eight.bin", downloadOptions(8));

    EXPECT_EQ(Testing::readFile(out / "one.bin"), data);
    EXPECT_EQ(Testing::readFile(out / "eight.bin"), data);
}

TEST(DownloaderTest, DirectoryDestinationUsesTheStoredName) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto data = Testing::randomBytes(1500);
    auto uploaded = store(transport, src, "report.pdf", data, 1000);

    Downloader downloader(transport, kChannel, smallLimits());
    auto result = downloader.downloadFile(uploaded.root, out.path(), downloadOptions(2));
    EXPECT_EQ(result.path, out / "report.pdf");
    EXPECT_EQ(Testing::readFile(out / "report.pdf"), data);

    EXPECT_EQ(Downloader::resolveDestination(out / "x.pdf", "report.pdf"), out / "x.pdf");
}

TEST(DownloaderTest, EmptyFileRoundTrips) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto uploaded = store(transport, src, "empty.txt", {}, 1000);

    Downloader downloader(transport, kChannel, smallLimits());
    auto result = downloader.downloadFile(uploaded.root, out.path(), downloadOptions(2));
    EXPECT_EQ(result.bytes, 0u);
    EXPECT_TRUE(std::filesystem::exists(out / "empty.txt"));
    EXPECT_EQ(std::filesystem::file_size(out / "empty.txt"), 0u);
}

TEST(DownloaderTest, CorruptedChunkLeavesNoOutput) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto uploaded = store(transport, src, "f.bin", Testing::randomBytes(5000), 1000);
    transport.corruptAttachment(uploaded.manifest.chunks[2].reference.str());

    Downloader downloader(transport, kChannel, smallLimits());
    EXPECT_THROW(downloader.downloadFile(uploaded.root, out / "f.bin", downloadOptions(3)), IntegrityError);
    EXPECT_EQ(Testing::countEntries(out.path()), 0u);
}

TEST(DownloaderTest, TransientFetchFailuresAreRetried) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto data = Testing::randomBytes(5000);
    auto uploaded = store(transport, src, "f.bin", data, 1000);
    transport.failFetches(uploaded.root.str(), 2);
    transport.failFetches(uploaded.manifest.chunks[1].reference.str(), 3);

    Downloader downloader(transport, kChannel, smallLimits());
    downloader.downloadFile(uploaded.root, out / "f.bin", downloadOptions(2));
    EXPECT_EQ(Testing::readFile(out / "f.bin"), data);
}

TEST(DownloaderTest, PersistentFetchFailureIsDownloadFailed) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto uploaded = store(transport, src, "f.bin", Testing::randomBytes(5000), 1000);
    transport.failFetches(uploaded.manifest.chunks[3].reference.str(), 100);

    Downloader downloader(transport, kChannel, smallLimits());
    try {
        downloader.downloadFile(uploaded.root, out / "f.bin", downloadOptions(2));
        FAIL() << "expected TransferFailed";
    } catch (const TransferFailed& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadFailed);
    }
    EXPECT_EQ(Testing::countEntries(out.path()), 0u);
}

TEST(DownloaderTest, UnknownRootIsManifestNotFound) {
    Testing::TempDir out;
    FakeTransport transport;
    Downloader downloader(transport, kChannel, smallLimits());
    EXPECT_THROW(downloader.downloadFile(RootReference("999"), out.path(), downloadOptions(1)), ManifestNotFound);
    EXPECT_THROW(downloader.downloadFile(RootReference(""), out.path(), downloadOptions(1)), ConfigError);
}

TEST(DownloaderTest, RootFromAnotherChannelIsNotFound) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto uploaded = store(transport, src, "f.bin", Testing::randomBytes(100), 1000);

    Downloader downloader(transport, "1717", smallLimits());
    EXPECT_THROW(downloader.downloadFile(uploaded.root, out.path(), downloadOptions(1)), ManifestNotFound);
}

TEST(DownloaderTest, PlainMessageIsNotAManifest) {
    Testing::TempDir out;
    FakeTransport transport;
    MessageId id = transport.postText(kChannel, "lunch at noon?");

    Downloader downloader(transport, kChannel, smallLimits());
    EXPECT_THROW(downloader.downloadFile(RootReference(id.str()), out.path(), downloadOptions(1)), CorruptManifest);
    EXPECT_EQ(Testing::countEntries(out.path()), 0u);
}

TEST(DownloaderTest, NewerManifestVersionIsRejected) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto uploaded = store(transport, src, "f.bin", Testing::randomBytes(100), 1000);

    nlohmann::json j = uploaded.manifest.toJson();
    j["formatVersion"] = Manifest::FORMAT_VERSION + 1;
    transport.replaceBody(uploaded.root.str(), Manifest::MARKER + "\n" + j.dump());

    Downloader downloader(transport, kChannel, smallLimits());
    EXPECT_THROW(downloader.downloadFile(uploaded.root, out.path(), downloadOptions(1)), UnsupportedVersion);
}

TEST(DownloaderTest, AbortFlagCancelsTheDownload) {
    Testing::TempDir src;
    Testing::TempDir out;
    FakeTransport transport;
    auto uploaded = store(transport, src, "f.bin", Testing::randomBytes(20 * 1000), 1000);

    std::atomic<bool> abort(false);
    auto opts = downloadOptions(2);
    opts.abort = &abort;
    opts.on_progress = [&](const Transfer::ProgressEvent& e) {
        if (e.stage == Transfer::ProgressStage::ChunkFetched && e.completed == 3) {
            abort = true;
        }
    };

    Downloader downloader(transport, kChannel, smallLimits());
    EXPECT_THROW(downloader.downloadFile(uploaded.root, out / "f.bin", opts), Cancelled);
    EXPECT_EQ(Testing::countEntries(out.path()), 0u);
}

TEST(DownloaderTest, FetchManifestOnly) {
    Testing::TempDir src;
    FakeTransport transport;
    auto uploaded = store(transport, src, "f.bin", Testing::randomBytes(2500), 1000);
    std::size_t fetches_before = transport.fetch_calls.load();

    Downloader downloader(transport, kChannel, smallLimits());
    Manifest m = downloader.fetchManifest(uploaded.root, downloadOptions(1));
    EXPECT_EQ(m, uploaded.manifest);
    EXPECT_EQ(transport.fetch_calls.load(), fetches_before + 1);
}
