#pragma once

/**
 * \file status.hpp
 * \brief The status container: classification + context + message + cause.
 *
 * Lifecycle:
 * - Created at the failure site with a classification (never fails).
 * - Each frame that unwinds may append context or wrap the status as the cause
 *   of a new status with a different classification.
 * - At the boundary it is rendered (render.hpp) or encoded (wire/codec.hpp).
 *   Appending past that point is not prevented but is not expected.
 *
 * Thread-safety: a status is a plain value. Concurrent reads are fine;
 * concurrent appends need external synchronization.
 *
 * Example:
 * ```cpp
 * auto load(const std::string& path) -> errata::result<config> {
 *   auto raw = errata::into_source(read_file(path), kinds::config_load_failed);
 *   if (!raw) return errata::fail(std::move(raw.error()).with_context("config", path));
 *   ...
 * }
 * ```
 */

#include <cstddef>
#include <expected>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "errata/classification.hpp"
#include "errata/context.hpp"
#include "errata/value.hpp"

namespace errata {

namespace wire::detail { class status_reader; }

/** \brief Which causes a chain traversal may step into. */
enum class chain_view {
  public_view,    /**< stops before a cause attached with wrap_internal */
  internal_view,  /**< every cause, for debugging and transport */
};

class status;

/** \brief Lazy, restartable range over a causal chain, outermost first. */
class status_chain {
public:
  class iterator {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = status;
    using difference_type = std::ptrdiff_t;
    using pointer = const status*;
    using reference = const status&;

    iterator() = default;
    iterator(const status* cur, chain_view view) noexcept : cur_(cur), view_(view) {}

    auto operator*() const noexcept -> reference { return *cur_; }
    auto operator->() const noexcept -> pointer { return cur_; }
    auto operator++() noexcept -> iterator&;
    auto operator++(int) noexcept -> iterator { auto tmp = *this; ++*this; return tmp; }

    friend auto operator==(const iterator& a, const iterator& b) noexcept -> bool { return a.cur_ == b.cur_; }

  private:
    const status* cur_{nullptr};
    chain_view view_{chain_view::public_view};
  };

  status_chain(const status* head, chain_view view) noexcept : head_(head), view_(view) {}

  auto begin() const noexcept -> iterator { return iterator{head_, view_}; }
  auto end() const noexcept -> iterator { return iterator{nullptr, view_}; }
  auto size() const noexcept -> std::size_t;

private:
  const status* head_;
  chain_view view_;
};

class status {
public:
  /** \brief New status with empty context, no message and no cause. */
  explicit status(classification kind) noexcept : kind_(kind) {}

  // Copy and destruction walk the chain iteratively; depth is not bounded by the stack.
  status(const status& other);
  auto operator=(const status& other) -> status&;
  status(status&&) noexcept = default;
  auto operator=(status&&) noexcept -> status& = default;
  ~status();

  /** \brief Append one context entry; previous entries are preserved. */
  auto with_context(std::string key, value val) & -> status&;
  auto with_context(std::string key, value val) && -> status&&;

  /** \brief Set the literal message; rendering returns it verbatim. Context is kept. */
  auto with_message(std::string text) & -> status&;
  auto with_message(std::string text) && -> status&&;

  /** \brief Re-classify: new status whose cause is prior, with its own empty context. */
  static auto wrap(classification kind, status prior) -> status;

  /** \brief As wrap, but the cause is only visible through chain_view::internal_view.
   *
   * Use when the underlying failure is an implementation detail that should
   * not leak into user-facing text, but must still be available for debugging
   * and across the wire.
   */
  static auto wrap_internal(classification kind, status prior) -> status;

  auto kind() const noexcept -> classification { return kind_; }

  /** \brief Identifier written on the wire.
   *
   * Equals kind().id(), except for a status decoded from a peer with a larger
   * classification set: kind() is then the unrecognized sentinel and wire_id()
   * keeps the peer's identifier so relaying the status does not lose it.
   */
  auto wire_id() const noexcept -> std::string_view;

  auto context() const noexcept -> const errata::context& { return context_; }
  auto message() const noexcept -> const std::optional<std::string>& { return message_; }
  auto cause() const noexcept -> const status* { return cause_.get(); }
  auto cause_is_internal() const noexcept -> bool { return cause_ != nullptr && cause_internal_; }

  auto chain(chain_view view = chain_view::public_view) const noexcept -> status_chain {
    return status_chain{this, view};
  }

  /** \brief Innermost cause reachable in view, or nullptr when there is none. */
  auto root_cause(chain_view view = chain_view::public_view) const noexcept -> const status*;

  /** \brief First status in the chain (this included) with the given classification. */
  auto find(classification kind, chain_view view = chain_view::public_view) const noexcept
      -> const status*;

  /** \brief Deep equality: classification, wire id, context, message, cause chain. */
  friend auto operator==(const status& a, const status& b) -> bool;

private:
  friend class wire::detail::status_reader;

  void attach_cause(status prior, bool internal);
  void copy_level(const status& other);

  classification kind_;
  std::string foreign_id_;
  errata::context context_;
  std::optional<std::string> message_;
  std::unique_ptr<status> cause_;
  bool cause_internal_{false};
};

inline auto status_chain::iterator::operator++() noexcept -> iterator& {
  const status* next = cur_->cause();
  if (next != nullptr && view_ == chain_view::public_view && cur_->cause_is_internal()) {
    next = nullptr;
  }
  cur_ = next;
  return *this;
}

inline auto status_chain::size() const noexcept -> std::size_t {
  std::size_t n = 0;
  for (auto it = begin(); it != end(); ++it) ++n;
  return n;
}

/** \brief Value-or-status return type. */
template <typename T = void>
using result = std::expected<T, status>;

/** \brief Wrap a status for returning through a result. */
inline auto fail(status s) -> std::unexpected<status> {
  return std::unexpected<status>(std::move(s));
}

/** \brief Re-classify a failed result; the previous status becomes a public cause.
 *
 * A successful result passes through untouched.
 * ```cpp
 * auto text = errata::into_source(read_file(path), kinds::config_load_failed);
 * if (!text) return errata::fail(std::move(text.error()).with_context("config", name));
 * ```
 */
template <typename T>
auto into_source(result<T>&& r, classification kind) -> result<T> {
  return std::move(r).transform_error(
      [kind](status&& prior) { return status::wrap(kind, std::move(prior)); });
}

/** \brief As into_source, but the previous status becomes an internal cause. */
template <typename T>
auto into_internal(result<T>&& r, classification kind) -> result<T> {
  return std::move(r).transform_error(
      [kind](status&& prior) { return status::wrap_internal(kind, std::move(prior)); });
}

} // namespace errata

/** Return early with a fresh status of the given classification. */
#define ERRATA_BAIL(kind) return ::errata::fail(::errata::status{kind})

/** Return early with a fresh status when cond does not hold. */
#define ERRATA_ENSURE(cond, kind) \
  do { if (!(cond)) { ERRATA_BAIL(kind); } } while (0)
