#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "chunkup/crypto.hpp"

namespace chunkup::client
{

    // Per-chunk digests of a local file and the chained digest after each chunk. An empty
    // file is planned as one empty chunk.
    struct ChunkPlan
    {
        crypto::HashFunction function{crypto::HashFunction::Md5};
        std::uint64_t chunk_size{};
        std::uint64_t file_size{};
        std::vector<std::string> chunk_digests;
        std::vector<std::string> running_digests;

        std::size_t chunk_count() const noexcept { return chunk_digests.size(); }

        const std::string &final_digest() const { return running_digests.back(); }

        // True when offset is a chunk boundary of this plan and the server's running digest
        // equals the one this file produces up to there.
        bool matches(std::uint64_t offset, const std::optional<std::string> &running_digest) const;
    };

    ChunkPlan plan_chunks(std::istream &input, crypto::HashFunction function, std::uint64_t chunk_size);

} // namespace chunkup::client
