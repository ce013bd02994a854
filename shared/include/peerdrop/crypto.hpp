/**
 * PeerDrop - Randomness and content hashing built on libsodium.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace peerdrop::crypto
{

    void ensure_sodium_init();

    // Lowercase hex of `bytes` random bytes.
    std::string random_hex(std::size_t bytes);

    // `length` characters drawn uniformly from [a-z0-9].
    std::string random_base36(std::size_t length);

    std::uint64_t random_u64();

    // BLAKE2b (crypto_generichash) digest as lowercase hex.
    std::string hash_bytes(std::span<const std::uint8_t> data);

} // namespace peerdrop::crypto
