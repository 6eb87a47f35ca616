#include "errata/context.hpp"

#include <algorithm>
#include <utility>

namespace errata {

void context::append(std::string key, value val) {
  entries_.push_back(entry{std::move(key), std::move(val)});
}

auto context::resolve(std::string_view key) const noexcept -> const value* {
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    if (it->key == key) return &it->val;
  }
  return nullptr;
}

auto context::history(std::string_view key) const -> std::vector<const value*> {
  std::vector<const value*> out;
  for (const auto& e : entries_) {
    if (e.key == key) out.push_back(&e.val);
  }
  return out;
}

auto context::keys() const -> std::vector<std::string_view> {
  std::vector<std::string_view> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    if (std::find(out.begin(), out.end(), std::string_view(e.key)) == out.end()) {
      out.emplace_back(e.key);
    }
  }
  return out;
}

auto to_string(const context& ctx) -> std::string {
  std::string out;
  for (const auto& e : ctx) {
    out += e.key;
    out += ": ";
    out += to_string(e.val);
    out += '\n';
  }
  return out;
}

} // namespace errata
