#pragma once

/** \file render.hpp
 *  \brief Human-readable rendering of a status through a localization resolver.
 *
 * Rendering never fails: a missing template degrades to the resolver's
 * default locale, then to a generic "<id> (key=value, ...)" dump; a
 * placeholder naming an absent key renders as an "unknown" marker.
 *
 * Template syntax: `{key}` substitutes the most recent context value for key,
 * `{{` and `}}` are literal braces, an unterminated `{` is literal text.
 *
 * Thread-safety: functions are stateless; the resolver's own guarantees apply.
 */

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errata/classification.hpp"
#include "errata/context.hpp"
#include "errata/status.hpp"

namespace errata {

/** \brief Consumer-supplied message catalog keyed by (classification, locale). */
class message_resolver {
public:
  virtual ~message_resolver() = default;

  /** \brief Template for kind in locale, or nullopt when the catalog has none. */
  virtual auto lookup(classification kind, std::string_view locale) const
      -> std::optional<std::string> = 0;

  /** \brief Locale tried when the requested one has no template. */
  virtual auto default_locale() const -> std::string_view = 0;
};

/** \brief In-memory catalog; suitable for tests and small applications. */
class catalog_resolver final : public message_resolver {
public:
  explicit catalog_resolver(std::string default_locale = "en-US");

  /** \brief Register (or replace) the template for kind in locale. */
  auto add(classification kind, std::string locale, std::string message_template) -> catalog_resolver&;

  auto lookup(classification kind, std::string_view locale) const
      -> std::optional<std::string> override;
  auto default_locale() const -> std::string_view override { return default_locale_; }

  auto size() const noexcept -> std::size_t { return templates_.size(); }

private:
  std::string default_locale_;
  std::map<std::pair<std::string, std::string>, std::string> templates_;
};

/** \brief Rendering knobs. */
struct render_options {
  std::string unknown_marker{"<unknown>"};      /**< text for placeholders with no context entry */
  chain_view view{chain_view::public_view};     /**< causes visited by render_chain/render_report */
  bool debug{false};                            /**< trace template resolution to std::cerr */

  /** \brief Defaults overridden by ERRATA_RENDER_INTERNAL=1 (internal_view) and ERRATA_RENDER_DEBUG=1. */
  static auto from_env() -> render_options;
};

/** \brief Expand a template against a context (last write wins per key). */
auto substitute(std::string_view message_template, const context& ctx,
                std::string_view unknown_marker = "<unknown>") -> std::string;

/** \brief Structural fallback: "<wire id>" or "<wire id> (k1=v1, k2=v2)". */
auto render_generic(const status& s) -> std::string;

/** \brief Render a single status level (its cause is not included). */
auto render(const status& s, std::string_view locale, const message_resolver& resolver,
            const render_options& options = {}) -> std::string;

/** \brief One rendered line per level in options.view, outermost first. */
auto render_chain(const status& s, std::string_view locale, const message_resolver& resolver,
                  const render_options& options = {}) -> std::vector<std::string>;

/** \brief Diagnostic report: rendered status, its context, then "Caused by:" lines.
 *
 * Format:
 * ```
 * Could not load configuration
 *
 * config: app.toml
 *
 * Caused by: I/O failure on /etc/app.toml
 * ```
 */
auto render_report(const status& s, std::string_view locale, const message_resolver& resolver,
                   const render_options& options = {}) -> std::string;

} // namespace errata
