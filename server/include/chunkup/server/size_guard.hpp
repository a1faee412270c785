#pragma once

#include <cstdint>
#include <optional>

namespace chunkup::server::size_guard
{

    enum class Progress : std::uint8_t
    {
        Partial,
        Complete,
        Overrun
    };

    // True when appending chunk_length bytes would pass the configured ceiling.
    bool exceeds_maximum(std::uint64_t current_size, std::uint64_t chunk_length,
                         const std::optional<std::uint64_t> &max_file_size) noexcept;

    Progress classify(std::uint64_t new_size, std::uint64_t original_file_size) noexcept;

} // namespace chunkup::server::size_guard
