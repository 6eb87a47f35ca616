#pragma once

/** \file value.hpp
 *  \brief Self-describing context value (closed type union).
 *
 * Every alternative maps to a stable wire tag, so heterogeneous values survive
 * an encode/decode round trip with their type intact (an integer never comes
 * back as a string).
 */

#include <concepts>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace errata {

class value;
struct field;

using value_list = std::vector<value>;
using value_record = std::vector<field>;

/** \brief Value alternatives; the numeric values are wire tags and never change. */
enum class value_type : std::uint8_t {
  boolean = 1,
  integer = 2,
  real = 3,
  string = 4,
  list = 5,
  record = 6,
};

constexpr auto is_known_value_tag(std::uint8_t tag) noexcept -> bool {
  return tag >= static_cast<std::uint8_t>(value_type::boolean) &&
         tag <= static_cast<std::uint8_t>(value_type::record);
}

auto to_string(value_type t) noexcept -> std::string_view;

class value {
public:
  // A template so that other arithmetic types never reach it through a narrowing conversion.
  template <std::same_as<bool> B>
  value(B b) : data_(static_cast<bool>(b)) {}

  // Only integers whose whole range fits int64; cast uint64_t/size_t explicitly.
  template <std::integral T>
    requires (!std::same_as<T, bool> &&
              (std::is_signed_v<T> ? sizeof(T) <= sizeof(std::int64_t)
                                   : sizeof(T) < sizeof(std::int64_t)))
  value(T i) : data_(static_cast<std::int64_t>(i)) {}

  template <std::floating_point T>
  value(T d) : data_(static_cast<double>(d)) {}

  value(const char* s) : data_(std::string(s)) {}
  value(std::string s) : data_(std::move(s)) {}
  value(std::string_view s) : data_(std::string(s)) {}
  value(value_list items) : data_(std::move(items)) {}
  value(value_record fields) : data_(std::move(fields)) {}

  auto type() const noexcept -> value_type {
    return static_cast<value_type>(data_.index() + 1);
  }

  auto is_boolean() const noexcept -> bool { return type() == value_type::boolean; }
  auto is_integer() const noexcept -> bool { return type() == value_type::integer; }
  auto is_real() const noexcept -> bool { return type() == value_type::real; }
  auto is_string() const noexcept -> bool { return type() == value_type::string; }
  auto is_list() const noexcept -> bool { return type() == value_type::list; }
  auto is_record() const noexcept -> bool { return type() == value_type::record; }

  // Typed access; nullptr when the alternative does not match.
  auto as_boolean() const noexcept -> const bool* { return std::get_if<bool>(&data_); }
  auto as_integer() const noexcept -> const std::int64_t* { return std::get_if<std::int64_t>(&data_); }
  auto as_real() const noexcept -> const double* { return std::get_if<double>(&data_); }
  auto as_string() const noexcept -> const std::string* { return std::get_if<std::string>(&data_); }
  auto as_list() const noexcept -> const value_list* { return std::get_if<value_list>(&data_); }
  auto as_record() const noexcept -> const value_record* { return std::get_if<value_record>(&data_); }

  /** \brief Exact equality; reals compare by bit pattern so NaN payloads match. */
  friend auto operator==(const value& a, const value& b) -> bool;

private:
  std::variant<bool, std::int64_t, double, std::string, value_list, value_record> data_;
};

/** \brief Named member of a record value. */
struct field {
  std::string name;
  value val;

  friend auto operator==(const field& a, const field& b) -> bool {
    return a.name == b.name && a.val == b.val;
  }
};

/** \brief Text used for template substitution: true, 42, 0.5, raw string, [a, b], {k: v}. */
auto to_string(const value& v) -> std::string;

} // namespace errata
