#pragma once

#include <cstdint>
#include <string>

namespace peerdrop::client
{

    // "0 Bytes", "1.5 KB", "10 MB", ... in powers of 1024, rounded to at most two decimals.
    std::string format_file_size(std::uint64_t bytes);

    // "n / total chunks (p%)"
    std::string format_chunk_progress(std::uint64_t done, std::uint64_t total);

} // namespace peerdrop::client
