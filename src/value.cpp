#include "errata/value.hpp"

#include <bit>
#include <charconv>
#include <cmath>

namespace errata {

namespace {
  inline std::string real_to_string(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc()) return "nan";
    return std::string(buf, ptr);
  }

  void append_value(std::string& out, const value& v);

  inline void append_list(std::string& out, const value_list& items) {
    out += '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
      if (i) out += ", ";
      append_value(out, items[i]);
    }
    out += ']';
  }

  inline void append_record(std::string& out, const value_record& fields) {
    out += '{';
    for (std::size_t i = 0; i < fields.size(); ++i) {
      if (i) out += ", ";
      out += fields[i].name;
      out += ": ";
      append_value(out, fields[i].val);
    }
    out += '}';
  }

  void append_value(std::string& out, const value& v) {
    switch (v.type()) {
      case value_type::boolean: out += *v.as_boolean() ? "true" : "false"; break;
      case value_type::integer: out += std::to_string(*v.as_integer()); break;
      case value_type::real: out += real_to_string(*v.as_real()); break;
      case value_type::string: out += *v.as_string(); break;
      case value_type::list: append_list(out, *v.as_list()); break;
      case value_type::record: append_record(out, *v.as_record()); break;
    }
  }
}

auto to_string(value_type t) noexcept -> std::string_view {
  switch (t) {
    case value_type::boolean: return "boolean";
    case value_type::integer: return "integer";
    case value_type::real: return "real";
    case value_type::string: return "string";
    case value_type::list: return "list";
    case value_type::record: return "record";
  }
  return "unknown";
}

auto operator==(const value& a, const value& b) -> bool {
  if (a.type() != b.type()) return false;
  switch (a.type()) {
    case value_type::boolean: return *a.as_boolean() == *b.as_boolean();
    case value_type::integer: return *a.as_integer() == *b.as_integer();
    case value_type::real:
      return std::bit_cast<std::uint64_t>(*a.as_real()) == std::bit_cast<std::uint64_t>(*b.as_real());
    case value_type::string: return *a.as_string() == *b.as_string();
    case value_type::list: return *a.as_list() == *b.as_list();
    case value_type::record: return *a.as_record() == *b.as_record();
  }
  return false;
}

auto to_string(const value& v) -> std::string {
  std::string out;
  append_value(out, v);
  return out;
}

} // namespace errata
