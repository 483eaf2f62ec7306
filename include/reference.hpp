// include/reference.hpp
#pragma once

#include <ostream>
#include <string>
#include <utility>

namespace ChannelStore
{

    // Opaque backend identifier. The tag keeps a chunk reference from being
    // passed where a root reference (or a raw message id) is expected.
    template <class Tag>
    class Reference
    {
    public:
        Reference() = default;
        explicit Reference(std::string value) : value_(std::move(value)) {}

        const std::string &str() const noexcept { return value_; }
        bool empty() const noexcept { return value_.empty(); }

        friend bool operator==(const Reference &a, const Reference &b) { return a.value_ == b.value_; }
        friend bool operator!=(const Reference &a, const Reference &b) { return !(a == b); }
        friend bool operator<(const Reference &a, const Reference &b) { return a.value_ < b.value_; }

        friend std::ostream &operator<<(std::ostream &os, const Reference &ref) { return os << ref.value_; }

    private:
        std::string value_;
    };

    struct MessageIdTag;
    struct ChunkReferenceTag;
    struct RootReferenceTag;

    // Id of any message, as the transport hands it out
    using MessageId = Reference<MessageIdTag>;
    // Message carrying one chunk attachment
    using ChunkReference = Reference<ChunkReferenceTag>;
    // Message carrying a serialized manifest: the durable handle of a stored file
    using RootReference = Reference<RootReferenceTag>;

} // namespace ChannelStore
