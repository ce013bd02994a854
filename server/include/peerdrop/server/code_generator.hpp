#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "peerdrop/signaling.hpp"

namespace peerdrop::server
{

    class CodeSpaceExhausted : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * Produces 6-character rendezvous codes over [A-Z0-9].
     *
     * Each code comes from a linear congruential mixer seeded with the current time and a
     * monotonic counter. Retries after a collision pass a higher attempt number, which shifts
     * the seed by a prime offset.
     */
    class CodeGenerator
    {
    public:
        static constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
        static constexpr std::size_t kCodeLength = 6;

        explicit CodeGenerator(std::uint64_t salt = 0);

        std::string next(Timestamp now, std::size_t attempt);

        static bool is_valid_code(std::string_view code) noexcept;

    private:
        std::uint64_t salt_;
        std::uint64_t counter_{0};
    };

} // namespace peerdrop::server
