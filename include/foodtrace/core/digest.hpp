#pragma once

/**
 * @file digest.hpp
 * @brief SHA-256 digests used to chain ledger entries
 *
 * Each ledger entry's digest covers the previous entry's digest, so altering
 * or removing any committed entry changes every digest after it.
 */

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace foodtrace {

constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

// Digest preceding the first entry of a ledger
inline constexpr Digest GENESIS_DIGEST{};

// SHA-256(prev || flags_le32 || size_le32 || payload)
// Returns false if the crypto backend reports a failure.
[[nodiscard]] bool chainDigest(const Digest& prev, uint32_t flags,
                               std::span<const uint8_t> payload, Digest& out);

// Lowercase hex, 64 characters
[[nodiscard]] std::string toHex(const Digest& digest);

}  // namespace foodtrace
