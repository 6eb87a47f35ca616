#pragma once

/** \file context.hpp
 *  \brief Ordered, append-only key/value metadata attached to a status.
 *
 * Keys may repeat: each frame that unwinds through a failure can refine a
 * field ("path" from the syscall, then "path" as the user typed it). Nothing
 * is ever removed, so iteration always yields the full history.
 * Resolving a single value for a key is a separate, explicit operation
 * (resolve) that returns the most recent entry.
 */

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "errata/value.hpp"

namespace errata {

struct entry {
  std::string key;
  value val;

  friend auto operator==(const entry& a, const entry& b) -> bool {
    return a.key == b.key && a.val == b.val;
  }
};

class context {
public:
  using const_iterator = std::vector<entry>::const_iterator;

  context() = default;

  /** \brief Append one entry; earlier entries are left untouched. */
  void append(std::string key, value val);

  /** \brief Last write wins: most recent value stored under key, or nullptr. */
  auto resolve(std::string_view key) const noexcept -> const value*;

  /** \brief Every value stored under key, oldest first. */
  auto history(std::string_view key) const -> std::vector<const value*>;

  /** \brief Distinct keys in order of first appearance. */
  auto keys() const -> std::vector<std::string_view>;

  auto contains(std::string_view key) const noexcept -> bool { return resolve(key) != nullptr; }

  auto entries() const noexcept -> const std::vector<entry>& { return entries_; }
  auto size() const noexcept -> std::size_t { return entries_.size(); }
  auto empty() const noexcept -> bool { return entries_.empty(); }
  auto begin() const noexcept -> const_iterator { return entries_.begin(); }
  auto end() const noexcept -> const_iterator { return entries_.end(); }

  friend auto operator==(const context& a, const context& b) -> bool = default;

private:
  std::vector<entry> entries_;
};

/** \brief One "key: value" line per entry, full history, insertion order. */
auto to_string(const context& ctx) -> std::string;

} // namespace errata
