#pragma once

/** \file codec.hpp
 *  \brief Status wire form encode/decode (pure, in-memory).
 *
 * Format (v1), integers little-endian, strings are u32 length + bytes:
 *
 *   wire_form := version:u8 (=1)
 *                classification_id:string
 *                message_marker:u8 (0 absent, 1 present) [message:string]
 *                context_count:u32 { key:string value }*
 *                cause_marker:u8 (0 none, 1 public, 2 internal) [wire_form]
 *
 *   value     := tag:u8 payload
 *                1 boolean u8 (0|1)    2 integer i64     3 real f64 bits
 *                4 string  string      5 list u32 value* 6 record u32 {name:string value}*
 *
 * The classification travels as its stable identifier. An identifier the
 * decoding side does not know yields classification::unrecognized() and the
 * original identifier is kept in status::wire_id(), so decode followed by
 * encode reproduces the input byte for byte.
 *
 * Endianness: little-endian on all platforms.
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

namespace errata::wire {

constexpr std::uint8_t WIRE_VERSION = 1;

constexpr std::uint8_t MESSAGE_ABSENT = 0;
constexpr std::uint8_t MESSAGE_PRESENT = 1;

constexpr std::uint8_t CAUSE_NONE = 0;
constexpr std::uint8_t CAUSE_PUBLIC = 1;
constexpr std::uint8_t CAUSE_INTERNAL = 2;

/** \brief Limits applied while decoding untrusted bytes. */
struct decode_options {
  std::size_t max_depth{64};              /**< cause chain length and value nesting */
  std::size_t max_entries{65536};         /**< context entries, list items, record fields */
  std::size_t max_string_bytes{1u << 20}; /**< any single string */
  bool debug{false};                      /**< log decode failures to std::cerr */

  /** \brief Defaults overridden by ERRATA_WIRE_MAX_DEPTH, ERRATA_WIRE_MAX_ENTRIES,
   *  ERRATA_WIRE_MAX_STRING and ERRATA_WIRE_DEBUG. */
  static auto from_env() -> decode_options;
};

/** \brief Encode a status and its whole cause chain (internal causes included).
 *
 * Fails with invalid_argument when a classification id is not a valid
 * identifier (see classification::is_valid_id), or when a string or a count
 * does not fit its 32-bit length prefix.
 */
auto encode_status_expected(const status& s)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Convenience variant; returns an empty vector on failure. */
auto encode_status(const status& s) -> std::vector<std::uint8_t>;

/** \brief Decode a complete wire form.
 *
 * \param bytes exactly one wire form; trailing bytes are an error
 * \param kinds classifications known to this process
 * \param options decoding limits
 * \return the status, or truncated / version_mismatch / unknown_value_tag /
 *         invalid_marker / trailing_bytes / data_integrity / resource_exhausted.
 *         A partial status is never returned.
 */
auto decode_status(std::span<const std::uint8_t> bytes, const classification_set& kinds,
                   const decode_options& options = {})
    -> std::expected<status, core::error>;

} // namespace errata::wire
