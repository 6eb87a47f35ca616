#pragma once

/** \file classification.hpp
 *  \brief Failure classification and the closed set an application declares.
 *
 * A classification is identified by a short stable token ("not_found",
 * "config.load_failed"). The token, not a process-local enum discriminant, is
 * what crosses process boundaries, so two binaries built from the same set
 * agree on equality.
 *
 * Identifiers must have static storage duration (string literals); the
 * classification only keeps a view.
 *
 * Example:
 * ```cpp
 * namespace app::kinds {
 * inline constexpr errata::classification not_found{"not_found"};
 * inline constexpr errata::classification io_error{"io_error"};
 * }
 * auto set = errata::classification_set::make({app::kinds::not_found, app::kinds::io_error});
 * ```
 */

#include <compare>
#include <cstddef>
#include <expected>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "errata/error.hpp"

namespace errata {

class classification {
public:
  /** \brief Identifier reserved for the "unrecognized classification" sentinel. */
  static constexpr std::string_view unrecognized_id = "errata.unrecognized";

  /** \brief Default-constructed classifications are the sentinel; so is an empty id. */
  constexpr classification() noexcept = default;
  constexpr explicit classification(std::string_view id) noexcept
      : id_(id.empty() ? unrecognized_id : id) {}

  /** \brief Identifiers are non-empty printable ASCII without spaces. */
  static constexpr auto is_valid_id(std::string_view id) noexcept -> bool {
    if (id.empty()) return false;
    for (char ch : id) {
      const auto c = static_cast<unsigned char>(ch);
      if (c <= 0x20 || c >= 0x7F) return false;
    }
    return true;
  }

  /** \brief Sentinel used when decoding an identifier the local set does not know. */
  static constexpr auto unrecognized() noexcept -> classification { return classification{}; }

  constexpr auto id() const noexcept -> std::string_view { return id_; }
  constexpr auto recognized() const noexcept -> bool { return id_ != unrecognized_id; }

  friend constexpr auto operator==(const classification&, const classification&) noexcept -> bool = default;
  friend constexpr auto operator<=>(const classification&, const classification&) noexcept = default;

private:
  std::string_view id_{unrecognized_id};
};

/** \brief Closed set of classifications known to this process.
 *
 * Used by the wire decoder to map identifiers back to classifications.
 * Iteration follows declaration order.
 */
class classification_set {
public:
  using const_iterator = std::vector<classification>::const_iterator;

  classification_set() = default;

  /** \brief Validate and build a set.
   *
   * Fails with invalid_argument when an identifier is empty, contains
   * whitespace or control characters, is duplicated, or uses the reserved
   * sentinel identifier.
   */
  static auto make(std::initializer_list<classification> kinds)
      -> std::expected<classification_set, core::error>;
  static auto make(const std::vector<classification>& kinds)
      -> std::expected<classification_set, core::error>;

  auto find(std::string_view id) const -> std::optional<classification>;
  auto contains(classification kind) const -> bool;

  auto size() const noexcept -> std::size_t { return kinds_.size(); }
  auto empty() const noexcept -> bool { return kinds_.empty(); }
  auto begin() const noexcept -> const_iterator { return kinds_.begin(); }
  auto end() const noexcept -> const_iterator { return kinds_.end(); }

private:
  std::vector<classification> kinds_;
  std::unordered_map<std::string_view, std::size_t> index_;
};

} // namespace errata

template <>
struct std::hash<errata::classification> {
  auto operator()(const errata::classification& k) const noexcept -> std::size_t {
    return std::hash<std::string_view>{}(k.id());
  }
};
