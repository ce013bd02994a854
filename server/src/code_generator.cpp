#include "peerdrop/server/code_generator.hpp"

#include <algorithm>

namespace peerdrop::server
{

    namespace
    {
        constexpr std::uint64_t kMultiplier = 6364136223846793005ULL;
        constexpr std::uint64_t kIncrement = 1442695040888963407ULL;
        constexpr std::uint64_t kCounterStride = 0x9E3779B97F4A7C15ULL;
        constexpr std::uint64_t kCollisionPrime = 1000003ULL;
    } // namespace

    CodeGenerator::CodeGenerator(std::uint64_t salt) : salt_(salt) {}

    std::string CodeGenerator::next(Timestamp now, std::size_t attempt)
    {
        const auto nanos = static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count());
        std::uint64_t seed = nanos ^ salt_;
        seed += (counter_++) * kCounterStride;
        seed += static_cast<std::uint64_t>(attempt) * kCollisionPrime;

        std::string code;
        code.reserve(kCodeLength);
        for (std::size_t i = 0; i < kCodeLength; ++i)
        {
            seed = seed * kMultiplier + kIncrement;
            code.push_back(kAlphabet[(seed >> 33) % kAlphabet.size()]);
        }
        return code;
    }

    bool CodeGenerator::is_valid_code(std::string_view code) noexcept
    {
        return code.size() == kCodeLength && std::all_of(code.begin(), code.end(), [](char ch)
                                                         { return kAlphabet.find(ch) != std::string_view::npos; });
    }

} // namespace peerdrop::server
