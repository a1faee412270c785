#include "chunkup/client/chunk_plan.hpp"

#include <span>
#include <stdexcept>

#include "chunkup/hash_chain.hpp"

namespace chunkup::client
{

    bool ChunkPlan::matches(std::uint64_t offset, const std::optional<std::string> &running_digest) const
    {
        if (offset == 0)
        {
            return !running_digest || running_digest->empty();
        }
        if (offset > file_size || (offset % chunk_size != 0 && offset != file_size) || !running_digest)
        {
            return false;
        }
        const auto index = static_cast<std::size_t>((offset + chunk_size - 1) / chunk_size) - 1;
        return index < running_digests.size() && digests_equal(running_digests[index], *running_digest);
    }

    ChunkPlan plan_chunks(std::istream &input, crypto::HashFunction function, std::uint64_t chunk_size)
    {
        if (chunk_size == 0)
        {
            throw std::invalid_argument("Chunk size must be positive");
        }

        ChunkPlan plan;
        plan.function = function;
        plan.chunk_size = chunk_size;

        HashChain chain(function);
        std::vector<char> buffer(static_cast<std::size_t>(chunk_size));
        while (true)
        {
            input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (input.bad())
            {
                throw std::runtime_error("Failed to read file while hashing");
            }
            const auto count = static_cast<std::size_t>(input.gcount());
            if (count == 0 && !plan.chunk_digests.empty())
            {
                break;
            }
            plan.chunk_digests.push_back(chain.append(std::as_bytes(std::span(buffer.data(), count))));
            plan.running_digests.push_back(*chain.running_digest());
            plan.file_size += count;
            if (count < buffer.size())
            {
                break;
            }
        }
        return plan;
    }

} // namespace chunkup::client
