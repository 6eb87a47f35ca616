#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling of the library's own failures
 *   (decode, framing, classification set validation).
 * - Human-readable message and originating component for diagnostics.
 *
 * This is distinct from errata::status, which is the value applications use to
 * report *their* failures. core::error is what the library returns when it
 * cannot do its own job, e.g. when wire bytes are malformed.
 */

#include <cstdint>
#include <string>
#include <string_view>

namespace errata::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  data_integrity = 3001,
  truncated = 3002,
  version_mismatch = 3003,
  unknown_value_tag = 3004,
  invalid_marker = 3005,
  trailing_bytes = 3006,
  length_mismatch = 3007,
  precondition_failed = 4001,
  resource_exhausted = 5001,
  internal = 9001,
  invalid_argument = 9002,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "wire.decode" */
};

/** \brief Stable lower-case token for a code ("truncated", "data_integrity", ...). */
auto to_string(error_code ec) noexcept -> std::string_view;

} // namespace errata::core
