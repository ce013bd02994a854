#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace peerdrop::encoding
{

    std::string encode_base64(std::span<const std::uint8_t> data);

    // Throws std::invalid_argument on characters outside the alphabet.
    std::vector<std::uint8_t> decode_base64(std::string_view input);

} // namespace peerdrop::encoding
