/**
 * ChunkUp - Chained chunk digest.
 *
 * The running digest of an upload is not a streaming hash of the raw bytes. Each chunk is
 * hashed on its own and folded into the previous running digest as H(previous || chunk),
 * both sides in lowercase hex. The first chunk's digest is the initial running digest.
 * Client and server can therefore agree on the final digest from per-chunk digests alone.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "chunkup/crypto.hpp"

namespace chunkup
{

    struct VerifiedChunk
    {
        std::string chunk_digest;
        std::string running_digest;
    };

    class HashChain
    {
    public:
        explicit HashChain(crypto::HashFunction function, std::optional<std::string> running_digest = std::nullopt);

        // Returns nullopt when the chunk does not match the claimed digest. Does not mutate.
        std::optional<VerifiedChunk> verify(std::span<const std::byte> chunk, std::string_view claimed_digest) const;

        // Hashes the chunk, folds it in and returns the chunk's own digest.
        std::string append(std::span<const std::byte> chunk);

        void commit(std::string running_digest);

        const std::optional<std::string> &running_digest() const noexcept { return running_digest_; }

        crypto::HashFunction function() const noexcept { return function_; }

        static std::string fold(crypto::HashFunction function, const std::optional<std::string> &running_digest,
                                std::string_view chunk_digest);

    private:
        crypto::HashFunction function_;
        std::optional<std::string> running_digest_;
    };

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept;

} // namespace chunkup
