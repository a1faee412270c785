#include "chunkup/size_format.hpp"

#include <array>
#include <iomanip>
#include <sstream>
#include <string_view>

namespace chunkup
{

    std::string human_readable_size(std::uint64_t bytes)
    {
        static constexpr std::array<std::string_view, 8> kUnits{"B", "KB", "MB", "GB", "TB", "PB", "EB", "ZB"};

        auto size = static_cast<double>(bytes);
        std::string_view unit = "YB";
        for (const auto candidate : kUnits)
        {
            if (size < 1024.0)
            {
                unit = candidate;
                break;
            }
            size /= 1024.0;
        }

        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << size << ' ' << unit;
        return oss.str();
    }

} // namespace chunkup
