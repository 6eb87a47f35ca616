/** \file classification.cpp
 *  \brief Classification set validation and lookup.
 */

#include "errata/classification.hpp"

#include <string>

namespace errata {

auto classification_set::make(std::initializer_list<classification> kinds)
    -> std::expected<classification_set, core::error> {
  return make(std::vector<classification>(kinds));
}

auto classification_set::make(const std::vector<classification>& kinds)
    -> std::expected<classification_set, core::error> {
  using core::error; using core::error_code;
  classification_set set;
  set.kinds_.reserve(kinds.size());
  for (const auto& k : kinds) {
    if (!classification::is_valid_id(k.id())) {
      return std::unexpected(error{error_code::invalid_argument,
          "invalid classification identifier \"" + std::string(k.id()) + "\"",
          "classification.set"});
    }
    if (k.id() == classification::unrecognized_id) {
      return std::unexpected(error{error_code::invalid_argument,
          "identifier \"" + std::string(k.id()) + "\" is reserved",
          "classification.set"});
    }
    auto [it, inserted] = set.index_.emplace(k.id(), set.kinds_.size());
    if (!inserted) {
      return std::unexpected(error{error_code::invalid_argument,
          "duplicate classification identifier \"" + std::string(k.id()) + "\"",
          "classification.set"});
    }
    set.kinds_.push_back(k);
  }
  return set;
}

auto classification_set::find(std::string_view id) const -> std::optional<classification> {
  auto it = index_.find(id);
  if (it == index_.end()) return std::nullopt;
  return kinds_[it->second];
}

auto classification_set::contains(classification kind) const -> bool {
  return index_.find(kind.id()) != index_.end();
}

} // namespace errata
