#include "errata/wire/codec.hpp"

#include <bit>
#include <iostream>
#include <limits>
#include <string>
#include <utility>

#include "errata/core/platform_utils.hpp"
#include "byte_io.hpp"

namespace errata::wire {

namespace detail {

// Builds statuses from decoded parts; the only place allowed to set a foreign
// identifier or attach a cause with an explicit visibility.
class status_reader {
public:
  static auto make(classification kind, std::string wire_id) -> status {
    status s{kind};
    if (!kind.recognized()) s.foreign_id_ = std::move(wire_id);
    return s;
  }
  static void attach(status& outer, status inner, bool internal) {
    outer.attach_cause(std::move(inner), internal);
  }
};

} // namespace detail

namespace {

using core::error;
using core::error_code;
using detail::byte_reader;
using detail::byte_writer;

constexpr const char* kDecodeComponent = "wire.decode";
constexpr const char* kEncodeComponent = "wire.encode";

auto fits_u32(std::size_t n) -> bool { return n <= std::numeric_limits<std::uint32_t>::max(); }

auto encode_value(byte_writer& w, const value& v) -> bool {
  w.put_u8(static_cast<std::uint8_t>(v.type()));
  switch (v.type()) {
    case value_type::boolean:
      w.put_u8(*v.as_boolean() ? 1 : 0);
      return true;
    case value_type::integer:
      w.put_u64(static_cast<std::uint64_t>(*v.as_integer()));
      return true;
    case value_type::real:
      w.put_u64(std::bit_cast<std::uint64_t>(*v.as_real()));
      return true;
    case value_type::string:
      return w.put_string(*v.as_string());
    case value_type::list: {
      const auto& items = *v.as_list();
      if (!fits_u32(items.size())) return false;
      w.put_u32(static_cast<std::uint32_t>(items.size()));
      for (const auto& item : items) {
        if (!encode_value(w, item)) return false;
      }
      return true;
    }
    case value_type::record: {
      const auto& fields = *v.as_record();
      if (!fits_u32(fields.size())) return false;
      w.put_u32(static_cast<std::uint32_t>(fields.size()));
      for (const auto& f : fields) {
        if (!w.put_string(f.name)) return false;
        if (!encode_value(w, f.val)) return false;
      }
      return true;
    }
  }
  return false;
}

auto decode_value(byte_reader& r, const decode_options& opts, std::size_t depth)
    -> std::expected<value, error> {
  if (depth > opts.max_depth) {
    return std::unexpected(r.fail(error_code::resource_exhausted,
        "value nesting deeper than " + std::to_string(opts.max_depth), r.offset()));
  }
  const auto tag_at = r.offset();
  auto tag = r.read_u8("value tag");
  if (!tag) return std::unexpected(tag.error());
  if (!is_known_value_tag(*tag)) {
    return std::unexpected(r.fail(error_code::unknown_value_tag,
        "unknown value tag " + std::to_string(*tag), tag_at));
  }
  switch (static_cast<value_type>(*tag)) {
    case value_type::boolean: {
      const auto at = r.offset();
      auto b = r.read_u8("boolean");
      if (!b) return std::unexpected(b.error());
      if (*b > 1) {
        return std::unexpected(r.fail(error_code::invalid_marker,
            "boolean byte " + std::to_string(*b), at));
      }
      return value{*b == 1};
    }
    case value_type::integer: {
      auto i = r.read_u64("integer");
      if (!i) return std::unexpected(i.error());
      return value{static_cast<std::int64_t>(*i)};
    }
    case value_type::real: {
      auto bits = r.read_u64("real");
      if (!bits) return std::unexpected(bits.error());
      return value{std::bit_cast<double>(*bits)};
    }
    case value_type::string: {
      auto s = r.read_string("string value", opts.max_string_bytes);
      if (!s) return std::unexpected(s.error());
      return value{std::move(*s)};
    }
    case value_type::list: {
      const auto at = r.offset();
      auto count = r.read_u32("list count");
      if (!count) return std::unexpected(count.error());
      if (*count > opts.max_entries) {
        return std::unexpected(r.fail(error_code::resource_exhausted,
            "list of " + std::to_string(*count) + " items", at));
      }
      value_list items;
      for (std::uint32_t i = 0; i < *count; ++i) {
        auto item = decode_value(r, opts, depth + 1);
        if (!item) return std::unexpected(item.error());
        items.push_back(std::move(*item));
      }
      return value{std::move(items)};
    }
    case value_type::record: {
      const auto at = r.offset();
      auto count = r.read_u32("record count");
      if (!count) return std::unexpected(count.error());
      if (*count > opts.max_entries) {
        return std::unexpected(r.fail(error_code::resource_exhausted,
            "record of " + std::to_string(*count) + " fields", at));
      }
      value_record fields;
      for (std::uint32_t i = 0; i < *count; ++i) {
        auto name = r.read_string("field name", opts.max_string_bytes);
        if (!name) return std::unexpected(name.error());
        auto val = decode_value(r, opts, depth + 1);
        if (!val) return std::unexpected(val.error());
        fields.push_back(field{std::move(*name), std::move(*val)});
      }
      return value{std::move(fields)};
    }
  }
  return std::unexpected(r.fail(error_code::internal, "unreachable value tag", tag_at));
}

struct decoded_level {
  status s;
  std::uint8_t cause_marker;
};

auto decode_level(byte_reader& r, const classification_set& kinds, const decode_options& opts)
    -> std::expected<decoded_level, error> {
  const auto version_at = r.offset();
  auto version = r.read_u8("version");
  if (!version) return std::unexpected(version.error());
  if (*version != WIRE_VERSION) {
    return std::unexpected(r.fail(error_code::version_mismatch,
        "unsupported wire version " + std::to_string(*version), version_at));
  }

  const auto id_at = r.offset();
  auto id = r.read_string("classification id", opts.max_string_bytes);
  if (!id) return std::unexpected(id.error());
  if (!classification::is_valid_id(*id)) {
    return std::unexpected(r.fail(error_code::data_integrity,
        id->empty() ? std::string("empty classification id") : "malformed classification id", id_at));
  }
  const auto kind = kinds.find(*id).value_or(classification::unrecognized());
  status s = detail::status_reader::make(kind, std::move(*id));

  const auto marker_at = r.offset();
  auto has_message = r.read_u8("message marker");
  if (!has_message) return std::unexpected(has_message.error());
  if (*has_message == MESSAGE_PRESENT) {
    auto msg = r.read_string("message", opts.max_string_bytes);
    if (!msg) return std::unexpected(msg.error());
    s.with_message(std::move(*msg));
  } else if (*has_message != MESSAGE_ABSENT) {
    return std::unexpected(r.fail(error_code::invalid_marker,
        "message marker " + std::to_string(*has_message), marker_at));
  }

  const auto count_at = r.offset();
  auto count = r.read_u32("context length");
  if (!count) return std::unexpected(count.error());
  if (*count > opts.max_entries) {
    return std::unexpected(r.fail(error_code::resource_exhausted,
        "context of " + std::to_string(*count) + " entries", count_at));
  }
  for (std::uint32_t i = 0; i < *count; ++i) {
    auto key = r.read_string("context key", opts.max_string_bytes);
    if (!key) return std::unexpected(key.error());
    auto val = decode_value(r, opts, 1);
    if (!val) return std::unexpected(val.error());
    s.with_context(std::move(*key), std::move(*val));
  }

  const auto cause_at = r.offset();
  auto cause = r.read_u8("cause marker");
  if (!cause) return std::unexpected(cause.error());
  if (*cause > CAUSE_INTERNAL) {
    return std::unexpected(r.fail(error_code::invalid_marker,
        "cause marker " + std::to_string(*cause), cause_at));
  }
  return decoded_level{std::move(s), *cause};
}

auto decode_chain(std::span<const std::uint8_t> bytes, const classification_set& kinds,
                  const decode_options& opts) -> std::expected<status, error> {
  byte_reader r{bytes, kDecodeComponent};
  std::vector<decoded_level> levels;
  for (;;) {
    if (levels.size() >= opts.max_depth) {
      return std::unexpected(r.fail(error_code::resource_exhausted,
          "cause chain longer than " + std::to_string(opts.max_depth), r.offset()));
    }
    auto level = decode_level(r, kinds, opts);
    if (!level) return std::unexpected(level.error());
    const bool more = level->cause_marker != CAUSE_NONE;
    levels.push_back(std::move(*level));
    if (!more) break;
  }
  if (r.remaining() != 0) {
    return std::unexpected(r.fail(error_code::trailing_bytes,
        std::to_string(r.remaining()) + " trailing bytes", r.offset()));
  }

  // Link innermost first so every cause is complete before it is moved in.
  status inner = std::move(levels.back().s);
  for (std::size_t i = levels.size() - 1; i-- > 0;) {
    detail::status_reader::attach(levels[i].s, std::move(inner),
                                  levels[i].cause_marker == CAUSE_INTERNAL);
    inner = std::move(levels[i].s);
  }
  return inner;
}

} // namespace

auto decode_options::from_env() -> decode_options {
  decode_options opts;
  opts.max_depth = core::env_size("ERRATA_WIRE_MAX_DEPTH", opts.max_depth);
  opts.max_entries = core::env_size("ERRATA_WIRE_MAX_ENTRIES", opts.max_entries);
  opts.max_string_bytes = core::env_size("ERRATA_WIRE_MAX_STRING", opts.max_string_bytes);
  opts.debug = core::env_flag("ERRATA_WIRE_DEBUG");
  return opts;
}

auto encode_status_expected(const status& s)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  std::vector<std::uint8_t> out;
  byte_writer w{out};
  std::size_t level = 0;
  // Each cause is written inline after its parent's cause marker, so the
  // recursive format can be produced by walking the chain.
  for (const auto& cur : s.chain(chain_view::internal_view)) {
    auto overflow = [&](const char* what) {
      return std::unexpected(error{error_code::invalid_argument,
          std::string(what) + " too large at chain level " + std::to_string(level), kEncodeComponent});
    };
    if (!classification::is_valid_id(cur.wire_id())) {
      return std::unexpected(error{error_code::invalid_argument,
          "malformed classification id \"" + std::string(cur.wire_id()) + "\" at chain level " +
          std::to_string(level), kEncodeComponent});
    }
    w.put_u8(WIRE_VERSION);
    if (!w.put_string(cur.wire_id())) return overflow("classification id");
    if (cur.message()) {
      w.put_u8(MESSAGE_PRESENT);
      if (!w.put_string(*cur.message())) return overflow("message");
    } else {
      w.put_u8(MESSAGE_ABSENT);
    }
    const auto& ctx = cur.context();
    if (!fits_u32(ctx.size())) return overflow("context");
    w.put_u32(static_cast<std::uint32_t>(ctx.size()));
    for (const auto& e : ctx) {
      if (!w.put_string(e.key)) return overflow("context key");
      if (!encode_value(w, e.val)) return overflow("context value");
    }
    if (cur.cause() == nullptr) {
      w.put_u8(CAUSE_NONE);
    } else {
      w.put_u8(cur.cause_is_internal() ? CAUSE_INTERNAL : CAUSE_PUBLIC);
    }
    ++level;
  }
  return out;
}

auto encode_status(const status& s) -> std::vector<std::uint8_t> {
  auto enc = encode_status_expected(s);
  if (!enc) { return {}; }
  return std::move(*enc);
}

auto decode_status(std::span<const std::uint8_t> bytes, const classification_set& kinds,
                   const decode_options& options)
    -> std::expected<status, core::error> {
  auto dec = decode_chain(bytes, kinds, options);
  if (!dec && options.debug) {
    std::cerr << "[errata][wire] decode failed (" << core::to_string(dec.error().code) << "): "
              << dec.error().message << std::endl;
  }
  return dec;
}

} // namespace errata::wire
