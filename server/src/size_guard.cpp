#include "chunkup/server/size_guard.hpp"

namespace chunkup::server::size_guard
{

    bool exceeds_maximum(std::uint64_t current_size, std::uint64_t chunk_length,
                         const std::optional<std::uint64_t> &max_file_size) noexcept
    {
        if (!max_file_size)
        {
            return false;
        }
        if (current_size > *max_file_size)
        {
            return true;
        }
        return chunk_length > *max_file_size - current_size;
    }

    Progress classify(std::uint64_t new_size, std::uint64_t original_file_size) noexcept
    {
        if (new_size == original_file_size)
        {
            return Progress::Complete;
        }
        if (new_size > original_file_size)
        {
            return Progress::Overrun;
        }
        return Progress::Partial;
    }

} // namespace chunkup::server::size_guard
