/** \file status.cpp
 *  \brief Status container: copying, accumulation and chain queries.
 */

#include "errata/status.hpp"

namespace errata {

status::status(const status& other) : kind_(other.kind_) {
  copy_level(other);
  status* tail = this;
  for (const status* src = other.cause_.get(); src != nullptr; src = src->cause_.get()) {
    tail->cause_ = std::make_unique<status>(src->kind_);
    tail = tail->cause_.get();
    tail->copy_level(*src);
  }
}

status::~status() {
  // Detach each level before it is destroyed so no destructor recurses.
  std::unique_ptr<status> next = std::move(cause_);
  while (next) {
    std::unique_ptr<status> after = std::move(next->cause_);
    next = std::move(after);
  }
}

void status::copy_level(const status& other) {
  foreign_id_ = other.foreign_id_;
  context_ = other.context_;
  message_ = other.message_;
  cause_internal_ = other.cause_internal_;
}

auto status::operator=(const status& other) -> status& {
  if (this != &other) {
    status tmp(other);
    *this = std::move(tmp);
  }
  return *this;
}

auto status::with_context(std::string key, value val) & -> status& {
  context_.append(std::move(key), std::move(val));
  return *this;
}

auto status::with_context(std::string key, value val) && -> status&& {
  context_.append(std::move(key), std::move(val));
  return std::move(*this);
}

auto status::with_message(std::string text) & -> status& {
  message_ = std::move(text);
  return *this;
}

auto status::with_message(std::string text) && -> status&& {
  message_ = std::move(text);
  return std::move(*this);
}

auto status::wrap(classification kind, status prior) -> status {
  status outer{kind};
  outer.attach_cause(std::move(prior), false);
  return outer;
}

auto status::wrap_internal(classification kind, status prior) -> status {
  status outer{kind};
  outer.attach_cause(std::move(prior), true);
  return outer;
}

void status::attach_cause(status prior, bool internal) {
  cause_ = std::make_unique<status>(std::move(prior));
  cause_internal_ = internal;
}

auto status::wire_id() const noexcept -> std::string_view {
  if (!kind_.recognized() && !foreign_id_.empty()) return foreign_id_;
  return kind_.id();
}

auto status::root_cause(chain_view view) const noexcept -> const status* {
  const status* last = nullptr;
  for (const auto& s : chain(view)) last = &s;
  return last == this ? nullptr : last;
}

auto status::find(classification kind, chain_view view) const noexcept -> const status* {
  for (const auto& s : chain(view)) {
    if (s.kind() == kind) return &s;
  }
  return nullptr;
}

auto operator==(const status& a, const status& b) -> bool {
  const status* x = &a;
  const status* y = &b;
  while (x != nullptr && y != nullptr) {
    if (x->kind_ != y->kind_ || x->wire_id() != y->wire_id()) return false;
    if (x->message_ != y->message_) return false;
    if (!(x->context_ == y->context_)) return false;
    if (x->cause_is_internal() != y->cause_is_internal()) return false;
    x = x->cause_.get();
    y = y->cause_.get();
  }
  return x == nullptr && y == nullptr;
}

} // namespace errata
