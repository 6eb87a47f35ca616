#pragma once

// Little-endian cursor helpers shared by the codec and the sealed frame.
// Reads never go past the end of the span; every failure carries the offset.

#include <cstdint>
#include <cstring>
#include <expected>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "errata/error.hpp"

namespace errata::wire::detail {

inline auto load_le32(const std::uint8_t* p) -> std::uint32_t {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}
inline auto load_le64(const std::uint8_t* p) -> std::uint64_t {
  return static_cast<std::uint64_t>(load_le32(p)) | (static_cast<std::uint64_t>(load_le32(p + 4)) << 32);
}

class byte_writer {
public:
  explicit byte_writer(std::vector<std::uint8_t>& out) : out_(out) {}

  void put_u8(std::uint8_t v) { out_.push_back(v); }
  void put_u32(std::uint32_t v) {
    for (int i = 0; i < 4; ++i) out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  void put_u64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i) out_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
  }
  // False when the length does not fit the u32 prefix.
  auto put_string(std::string_view s) -> bool {
    if (s.size() > std::numeric_limits<std::uint32_t>::max()) return false;
    put_u32(static_cast<std::uint32_t>(s.size()));
    out_.insert(out_.end(), s.begin(), s.end());
    return true;
  }

private:
  std::vector<std::uint8_t>& out_;
};

class byte_reader {
public:
  byte_reader(std::span<const std::uint8_t> bytes, const char* component)
      : bytes_(bytes), component_(component) {}

  auto offset() const noexcept -> std::size_t { return pos_; }
  auto remaining() const noexcept -> std::size_t { return bytes_.size() - pos_; }

  auto read_u8(const char* what) -> std::expected<std::uint8_t, core::error> {
    if (remaining() < 1) return std::unexpected(truncated(what, 1));
    return bytes_[pos_++];
  }
  auto read_u32(const char* what) -> std::expected<std::uint32_t, core::error> {
    if (remaining() < 4) return std::unexpected(truncated(what, 4));
    const auto v = load_le32(bytes_.data() + pos_);
    pos_ += 4;
    return v;
  }
  auto read_u64(const char* what) -> std::expected<std::uint64_t, core::error> {
    if (remaining() < 8) return std::unexpected(truncated(what, 8));
    const auto v = load_le64(bytes_.data() + pos_);
    pos_ += 8;
    return v;
  }
  auto read_string(const char* what, std::size_t max_bytes) -> std::expected<std::string, core::error> {
    const auto at = pos_;
    auto len = read_u32(what);
    if (!len) return std::unexpected(len.error());
    if (*len > max_bytes) {
      return std::unexpected(fail(core::error_code::resource_exhausted,
          std::string(what) + " length " + std::to_string(*len) + " exceeds limit " +
          std::to_string(max_bytes), at));
    }
    if (remaining() < *len) return std::unexpected(truncated(what, *len));
    std::string s(reinterpret_cast<const char*>(bytes_.data() + pos_), *len);
    pos_ += *len;
    return s;
  }

  auto fail(core::error_code code, std::string what, std::size_t at) const -> core::error {
    return core::error{code, what + " at offset " + std::to_string(at), component_};
  }

private:
  auto truncated(const char* what, std::size_t need) const -> core::error {
    return fail(core::error_code::truncated,
                std::string("truncated ") + what + ": need " + std::to_string(need) + " bytes, have " +
                std::to_string(remaining()), pos_);
  }

  std::span<const std::uint8_t> bytes_;
  std::size_t pos_{0};
  const char* component_;
};

} // namespace errata::wire::detail
