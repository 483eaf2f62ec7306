// src/errors.cpp
#include "errors.hpp"

namespace ChannelStore
{

    const char *errorKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Config:
            return "ConfigError";
        case ErrorKind::Transport:
            return "TransportError";
        case ErrorKind::RateLimited:
            return "RateLimited";
        case ErrorKind::PayloadTooLarge:
            return "PayloadTooLarge";
        case ErrorKind::ManifestTooLarge:
            return "ManifestTooLarge";
        case ErrorKind::Integrity:
            return "IntegrityError";
        case ErrorKind::CorruptManifest:
            return "CorruptManifest";
        case ErrorKind::UnsupportedVersion:
            return "UnsupportedVersion";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::UploadFailed:
            return "UploadFailed";
        case ErrorKind::DownloadFailed:
            return "DownloadFailed";
        case ErrorKind::Cancelled:
            return "Cancelled";
        }
        return "UnknownError";
    }

    std::string describeError(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Config:
            return "Configuration error (not retried): fix the settings or arguments and run again.";
        case ErrorKind::Transport:
            return "Backend or network failure.";
        case ErrorKind::RateLimited:
            return "The backend is rate limiting requests; try again later.";
        case ErrorKind::PayloadTooLarge:
            return "A chunk was rejected as too large (not retried): choose a smaller chunk size.";
        case ErrorKind::ManifestTooLarge:
            return "The file needs more chunks than one manifest can describe (not retried): "
                   "use a larger chunk size or split the file.";
        case ErrorKind::Integrity:
            return "Integrity check failed: downloaded data does not match the recorded hashes. "
                   "No output was written.";
        case ErrorKind::CorruptManifest:
            return "The referenced message is not a readable manifest.";
        case ErrorKind::UnsupportedVersion:
            return "The manifest was written by a newer version; upgrade to read it.";
        case ErrorKind::NotFound:
            return "No such stored file.";
        case ErrorKind::UploadFailed:
            return "Upload failed after all retries were used. Chunks already published "
                   "stay in the channel without a manifest.";
        case ErrorKind::DownloadFailed:
            return "Download failed after all retries were used. No output was written.";
        case ErrorKind::Cancelled:
            return "Operation cancelled.";
        }
        return "Unknown error.";
    }

    int exitCodeFor(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::Config:
            return 2;
        case ErrorKind::Transport:
            return 3;
        case ErrorKind::RateLimited:
            return 4;
        case ErrorKind::PayloadTooLarge:
            return 5;
        case ErrorKind::ManifestTooLarge:
            return 6;
        case ErrorKind::Integrity:
            return 7;
        case ErrorKind::CorruptManifest:
            return 8;
        case ErrorKind::UnsupportedVersion:
            return 9;
        case ErrorKind::NotFound:
            return 10;
        case ErrorKind::UploadFailed:
            return 11;
        case ErrorKind::DownloadFailed:
            return 12;
        case ErrorKind::Cancelled:
            return 130;
        }
        return 1;
    }

} // namespace ChannelStore
