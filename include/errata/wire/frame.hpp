#pragma once

/** \file frame.hpp
 *  \brief Sealed frame: wire form wrapped with length and CRC32C verification.
 *
 * For transports that do not already guarantee integrity (files, raw
 * sockets, shared memory). The wire form inside is unchanged.
 *
 *   magic:u32 ("ERRT") | len:u32 (total, header+payload+crc) | wire form | crc32c:u32
 *
 * CRC32C (Castagnoli, reflected) covers [magic..payload].
 *
 * Endianness: little-endian framing on all platforms.
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with errata::core::error.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "errata/classification.hpp"
#include "errata/error.hpp"
#include "errata/status.hpp"
#include "errata/wire/codec.hpp"

namespace errata::wire {

constexpr std::uint32_t SEAL_MAGIC = 0x54525245u; // "ERRT" in byte order
constexpr std::size_t SEAL_HEADER_SIZE = 4 + 4;   // magic + len
constexpr std::size_t SEAL_TRAILER_SIZE = 4;      // crc32c

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Wrap a wire form; fails with invalid_argument when the total length overflows 32 bits
auto seal(std::span<const std::uint8_t> wire_form)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Verify a sealed frame and return a view of the wire form inside it (no copy)
auto unseal(std::span<const std::uint8_t> frame)
    -> std::expected<std::span<const std::uint8_t>, core::error>;

auto encode_sealed(const status& s)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

auto decode_sealed(std::span<const std::uint8_t> frame, const classification_set& kinds,
                   const decode_options& options = {})
    -> std::expected<status, core::error>;

} // namespace errata::wire
