// include/errors.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace ChannelStore
{

    enum class ErrorKind
    {
        Config,
        Transport,
        RateLimited,
        PayloadTooLarge,
        ManifestTooLarge,
        Integrity,
        CorruptManifest,
        UnsupportedVersion,
        NotFound,
        UploadFailed,
        DownloadFailed,
        Cancelled
    };

    // Base class for every failure the store reports to its callers.
    class StoreError : public std::runtime_error
    {
    public:
        StoreError(ErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    // Bad chunk size, missing credentials, unknown settings key...
    class ConfigError : public StoreError
    {
    public:
        explicit ConfigError(const std::string &message)
            : StoreError(ErrorKind::Config, message) {}
    };

    // Network or backend fault. Retried with backoff.
    class TransportError : public StoreError
    {
    public:
        explicit TransportError(const std::string &message)
            : StoreError(ErrorKind::Transport, message) {}
    };

    class RateLimited : public StoreError
    {
    public:
        RateLimited(std::chrono::milliseconds retry_after, const std::string &message)
            : StoreError(ErrorKind::RateLimited, message), retry_after_(retry_after) {}

        std::chrono::milliseconds retryAfter() const noexcept { return retry_after_; }

    private:
        std::chrono::milliseconds retry_after_;
    };

    class PayloadTooLarge : public StoreError
    {
    public:
        explicit PayloadTooLarge(const std::string &message)
            : StoreError(ErrorKind::PayloadTooLarge, message) {}
    };

    class ManifestTooLarge : public StoreError
    {
    public:
        explicit ManifestTooLarge(const std::string &message)
            : StoreError(ErrorKind::ManifestTooLarge, message) {}
    };

    class IntegrityError : public StoreError
    {
    public:
        explicit IntegrityError(const std::string &message)
            : StoreError(ErrorKind::Integrity, message) {}
    };

    class CorruptManifest : public StoreError
    {
    public:
        explicit CorruptManifest(const std::string &message)
            : StoreError(ErrorKind::CorruptManifest, message) {}
    };

    class UnsupportedVersion : public StoreError
    {
    public:
        UnsupportedVersion(std::uint64_t version, int supported)
            : StoreError(ErrorKind::UnsupportedVersion,
                         "Manifest format version " + std::to_string(version) +
                             " is newer than the supported version " + std::to_string(supported)),
              version_(version) {}

        std::uint64_t version() const noexcept { return version_; }

    private:
        std::uint64_t version_;
    };

    class NotFound : public StoreError
    {
    public:
        explicit NotFound(const std::string &message)
            : StoreError(ErrorKind::NotFound, message) {}
    };

    // NotFound raised for the root reference itself.
    class ManifestNotFound : public NotFound
    {
    public:
        explicit ManifestNotFound(const std::string &root)
            : NotFound("No stored file with root reference " + root) {}
    };

    // Retry budget exhausted for an upload or download. Carries the last cause.
    class TransferFailed : public StoreError
    {
    public:
        TransferFailed(ErrorKind kind, const std::string &message, int attempts)
            : StoreError(kind, message), attempts_(attempts) {}

        int attempts() const noexcept { return attempts_; }

    private:
        int attempts_;
    };

    class Cancelled : public StoreError
    {
    public:
        explicit Cancelled(const std::string &message)
            : StoreError(ErrorKind::Cancelled, message) {}
    };

    // Short name of the kind, e.g. "RateLimited".
    const char *errorKindName(ErrorKind kind);

    // One line a user can act on. Says whether the failure was already retried
    // or is a configuration problem.
    std::string describeError(ErrorKind kind);

    // Distinct process exit status for every kind.
    int exitCodeFor(ErrorKind kind);

} // namespace ChannelStore
