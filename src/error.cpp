#include "errata/error.hpp"

namespace errata::core {

auto to_string(error_code ec) noexcept -> std::string_view {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::data_integrity: return "data_integrity";
    case error_code::truncated: return "truncated";
    case error_code::version_mismatch: return "version_mismatch";
    case error_code::unknown_value_tag: return "unknown_value_tag";
    case error_code::invalid_marker: return "invalid_marker";
    case error_code::trailing_bytes: return "trailing_bytes";
    case error_code::length_mismatch: return "length_mismatch";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
  }
  return "internal";
}

} // namespace errata::core
