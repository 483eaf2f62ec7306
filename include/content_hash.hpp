// include/content_hash.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// Forward declaration so callers don't pull in OpenSSL headers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace ChannelStore
{
    namespace Hashing
    {

        class ContentHash
        {
        public:
            // SHA-256 of data as a lower-case hex string.
            // Identical bytes always give identical hashes, so two uploads of
            // the same file describe their chunks the same way.
            static std::string sha256Hex(const std::vector<char> &data_buffer);
            static std::string sha256Hex(const char *data, std::size_t size);

            // Incremental SHA-256, used for the whole-file hash while the file
            // is being chunked.
            class Sha256Accumulator
            {
            public:
                Sha256Accumulator();
                ~Sha256Accumulator();

                Sha256Accumulator(const Sha256Accumulator &) = delete;
                Sha256Accumulator &operator=(const Sha256Accumulator &) = delete;

                void update(const char *data, std::size_t size);

                // Finalizes the digest. The accumulator starts over afterwards.
                std::string hex();

                void reset();

            private:
                struct CtxDeleter
                {
                    void operator()(EVP_MD_CTX *ctx) const;
                };
                std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
            };
        };

    } // namespace Hashing
} // namespace ChannelStore
