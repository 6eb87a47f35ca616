#include "errata/wire/frame.hpp"

#include <array>
#include <limits>

#include "byte_io.hpp"

namespace errata::wire {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~0u;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

auto seal(std::span<const std::uint8_t> wire_form)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  const std::size_t max_payload =
      std::numeric_limits<std::uint32_t>::max() - SEAL_HEADER_SIZE - SEAL_TRAILER_SIZE;
  if (wire_form.size() > max_payload) {
    return std::unexpected(error{error_code::invalid_argument, "payload too large", "wire.frame"});
  }
  const auto len = static_cast<std::uint32_t>(SEAL_HEADER_SIZE + wire_form.size() + SEAL_TRAILER_SIZE);
  std::vector<std::uint8_t> out;
  out.reserve(len);
  detail::byte_writer w{out};
  w.put_u32(SEAL_MAGIC);
  w.put_u32(len);
  out.insert(out.end(), wire_form.begin(), wire_form.end());
  w.put_u32(crc32c(out));
  return out;
}

auto unseal(std::span<const std::uint8_t> frame)
    -> std::expected<std::span<const std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  if (frame.size() < SEAL_HEADER_SIZE + SEAL_TRAILER_SIZE) {
    return std::unexpected(error{error_code::truncated, "frame too short", "wire.frame"});
  }
  const std::uint32_t magic = detail::load_le32(frame.data());
  const std::uint32_t len = detail::load_le32(frame.data() + 4);
  if (magic != SEAL_MAGIC) {
    return std::unexpected(error{error_code::data_integrity, "bad magic", "wire.frame"});
  }
  if (len > frame.size()) {
    return std::unexpected(error{error_code::truncated, "frame shorter than declared length", "wire.frame"});
  }
  if (len != frame.size()) {
    return std::unexpected(error{error_code::length_mismatch, "len mismatch", "wire.frame"});
  }
  const std::size_t n = frame.size();
  const std::uint32_t expect = detail::load_le32(frame.data() + n - SEAL_TRAILER_SIZE);
  if (crc32c(frame.first(n - SEAL_TRAILER_SIZE)) != expect) {
    return std::unexpected(error{error_code::data_integrity, "crc mismatch", "wire.frame"});
  }
  return frame.subspan(SEAL_HEADER_SIZE, n - SEAL_HEADER_SIZE - SEAL_TRAILER_SIZE);
}

auto encode_sealed(const status& s)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  auto wire_form = encode_status_expected(s);
  if (!wire_form) return std::unexpected(wire_form.error());
  return seal(*wire_form);
}

auto decode_sealed(std::span<const std::uint8_t> frame, const classification_set& kinds,
                   const decode_options& options)
    -> std::expected<status, core::error> {
  auto payload = unseal(frame);
  if (!payload) return std::unexpected(payload.error());
  return decode_status(*payload, kinds, options);
}

} // namespace errata::wire
