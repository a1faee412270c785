#pragma once

#include <cstdint>
#include <string>

namespace chunkup
{

    // "1.50 KB" style rendering in steps of 1024.
    std::string human_readable_size(std::uint64_t bytes);

} // namespace chunkup
