#include "peerdrop/client/progress.hpp"

#include <array>
#include <cmath>
#include <sstream>

namespace peerdrop::client
{

    std::string format_file_size(std::uint64_t bytes)
    {
        if (bytes == 0)
        {
            return "0 Bytes";
        }
        constexpr std::array<const char *, 4> kUnits{"Bytes", "KB", "MB", "GB"};
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size())
        {
            value /= 1024.0;
            ++unit;
        }
        std::ostringstream oss;
        if (unit == 0)
        {
            oss << bytes << ' ' << kUnits[unit];
        }
        else
        {
            oss << std::round(value * 100.0) / 100.0 << ' ' << kUnits[unit];
        }
        return oss.str();
    }

    std::string format_chunk_progress(std::uint64_t done, std::uint64_t total)
    {
        const auto percent = total == 0 ? 100 : static_cast<unsigned>((done * 100) / total);
        std::ostringstream oss;
        oss << done << " / " << total << " chunks (" << percent << "%)";
        return oss.str();
    }

} // namespace peerdrop::client
