// src/content_hash.cpp
#include "content_hash.hpp"
#include <iomanip>   // For std::hex, std::setw, std::setfill
#include <sstream>   // For std::stringstream
#include <stdexcept> // For std::runtime_error

#include <openssl/evp.h>

namespace ChannelStore
{
    namespace Hashing
    {

        namespace
        {
            std::string toHex(const unsigned char *digest, unsigned int length)
            {
                std::stringstream ss;
                for (unsigned int i = 0; i < length; i++)
                {
                    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
                }
                return ss.str();
            }
        } // namespace

        std::string ContentHash::sha256Hex(const std::vector<char> &data_buffer)
        {
            return sha256Hex(data_buffer.data(), data_buffer.size());
        }

        std::string ContentHash::sha256Hex(const char *data, std::size_t size)
        {
            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int length = 0;
            // An empty buffer is fine: SHA256("") is a well-defined digest.
            if (!EVP_Digest(size == 0 ? "" : data, size, digest, &length, EVP_sha256(), nullptr))
            {
                throw std::runtime_error("Failed to compute SHA256 digest.");
            }
            return toHex(digest, length);
        }

        void ContentHash::Sha256Accumulator::CtxDeleter::operator()(EVP_MD_CTX *ctx) const
        {
            EVP_MD_CTX_free(ctx);
        }

        ContentHash::Sha256Accumulator::Sha256Accumulator() : ctx_(EVP_MD_CTX_new())
        {
            if (!ctx_)
            {
                throw std::runtime_error("Failed to allocate SHA256 context.");
            }
            reset();
        }

        ContentHash::Sha256Accumulator::~Sha256Accumulator() = default;

        void ContentHash::Sha256Accumulator::reset()
        {
            if (!EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr))
            {
                throw std::runtime_error("Failed to initialize SHA256 context.");
            }
        }

        void ContentHash::Sha256Accumulator::update(const char *data, std::size_t size)
        {
            if (data == nullptr || size == 0)
            {
                return;
            }
            if (!EVP_DigestUpdate(ctx_.get(), data, size))
            {
                throw std::runtime_error("Failed to update SHA256 context with data.");
            }
        }

        std::string ContentHash::Sha256Accumulator::hex()
        {
            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int length = 0;
            if (!EVP_DigestFinal_ex(ctx_.get(), digest, &length))
            {
                throw std::runtime_error("Failed to finalize SHA256 hash calculation.");
            }
            reset();
            return toHex(digest, length);
        }

    } // namespace Hashing
} // namespace ChannelStore
