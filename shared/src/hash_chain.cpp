#include "chunkup/hash_chain.hpp"

#include <algorithm>
#include <cctype>

namespace chunkup
{

    namespace
    {

        std::optional<std::string> normalize_running(std::optional<std::string> running_digest)
        {
            if (running_digest && running_digest->empty())
            {
                return std::nullopt;
            }
            return running_digest;
        }

    } // namespace

    HashChain::HashChain(crypto::HashFunction function, std::optional<std::string> running_digest)
        : function_(function), running_digest_(normalize_running(std::move(running_digest))) {}

    std::optional<VerifiedChunk> HashChain::verify(std::span<const std::byte> chunk,
                                                   std::string_view claimed_digest) const
    {
        auto actual = crypto::hash_bytes(function_, chunk);
        if (!digests_equal(actual, claimed_digest))
        {
            return std::nullopt;
        }
        auto running = fold(function_, running_digest_, actual);
        return VerifiedChunk{.chunk_digest = std::move(actual), .running_digest = std::move(running)};
    }

    std::string HashChain::append(std::span<const std::byte> chunk)
    {
        auto chunk_digest = crypto::hash_bytes(function_, chunk);
        running_digest_ = fold(function_, running_digest_, chunk_digest);
        return chunk_digest;
    }

    void HashChain::commit(std::string running_digest)
    {
        running_digest_ = normalize_running(std::move(running_digest));
    }

    std::string HashChain::fold(crypto::HashFunction function, const std::optional<std::string> &running_digest,
                                std::string_view chunk_digest)
    {
        if (!running_digest || running_digest->empty())
        {
            return std::string(chunk_digest);
        }
        std::string combined;
        combined.reserve(running_digest->size() + chunk_digest.size());
        combined.append(*running_digest);
        combined.append(chunk_digest);
        return crypto::hash_text(function, combined);
    }

    bool digests_equal(std::string_view lhs, std::string_view rhs) noexcept
    {
        return lhs.size() == rhs.size() &&
               std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                          { return std::tolower(static_cast<unsigned char>(a)) ==
                                   std::tolower(static_cast<unsigned char>(b)); });
    }

} // namespace chunkup
