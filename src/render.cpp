/** \file render.cpp
 *  \brief Template resolution, substitution and chain rendering.
 */

#include "errata/render.hpp"

#include <iostream>

#include "errata/core/platform_utils.hpp"

namespace errata {

catalog_resolver::catalog_resolver(std::string default_locale)
    : default_locale_(std::move(default_locale)) {}

auto catalog_resolver::add(classification kind, std::string locale, std::string message_template)
    -> catalog_resolver& {
  std::pair<std::string, std::string> key{std::string(kind.id()), std::move(locale)};
  templates_.insert_or_assign(std::move(key), std::move(message_template));
  return *this;
}

auto catalog_resolver::lookup(classification kind, std::string_view locale) const
    -> std::optional<std::string> {
  const std::pair<std::string, std::string> key{std::string(kind.id()), std::string(locale)};
  auto it = templates_.find(key);
  if (it == templates_.end()) return std::nullopt;
  return it->second;
}

auto render_options::from_env() -> render_options {
  render_options opts;
  if (core::env_flag("ERRATA_RENDER_INTERNAL")) opts.view = chain_view::internal_view;
  opts.debug = core::env_flag("ERRATA_RENDER_DEBUG");
  return opts;
}

auto substitute(std::string_view message_template, const context& ctx,
                std::string_view unknown_marker) -> std::string {
  std::string out;
  out.reserve(message_template.size());
  std::size_t i = 0;
  const std::size_t n = message_template.size();
  while (i < n) {
    const char c = message_template[i];
    if (c == '{') {
      if (i + 1 < n && message_template[i + 1] == '{') { out += '{'; i += 2; continue; }
      const auto close = message_template.find('}', i + 1);
      if (close == std::string_view::npos) {
        // Unterminated placeholder: keep the remainder as literal text
        out.append(message_template.substr(i));
        break;
      }
      const auto key = message_template.substr(i + 1, close - i - 1);
      if (const value* v = ctx.resolve(key)) {
        out += to_string(*v);
      } else {
        out.append(unknown_marker);
      }
      i = close + 1;
      continue;
    }
    if (c == '}' && i + 1 < n && message_template[i + 1] == '}') { out += '}'; i += 2; continue; }
    out += c;
    ++i;
  }
  return out;
}

auto render_generic(const status& s) -> std::string {
  // Hand-built classifications are not validated; never print a blank name.
  const auto id = s.wire_id();
  std::string out(classification::is_valid_id(id) ? id : classification::unrecognized_id);
  const auto& ctx = s.context();
  if (ctx.empty()) return out;
  out += " (";
  bool first = true;
  for (auto key : ctx.keys()) {
    if (!first) out += ", ";
    first = false;
    out.append(key);
    out += '=';
    out += to_string(*ctx.resolve(key));
  }
  out += ')';
  return out;
}

auto render(const status& s, std::string_view locale, const message_resolver& resolver,
            const render_options& options) -> std::string {
  if (s.message() && !s.message()->empty()) return *s.message();

  const bool dbg = options.debug;
  auto tmpl = resolver.lookup(s.kind(), locale);
  if (!tmpl) {
    const auto fallback = resolver.default_locale();
    if (fallback != locale) {
      if (dbg) {
        std::cerr << "[errata][render] no template for " << s.wire_id() << " in " << locale
                  << ", trying " << fallback << std::endl;
      }
      tmpl = resolver.lookup(s.kind(), fallback);
    }
  }
  if (tmpl) {
    auto text = substitute(*tmpl, s.context(), options.unknown_marker);
    if (!text.empty()) return text;
  }
  if (dbg) {
    std::cerr << "[errata][render] using generic template for " << s.wire_id() << std::endl;
  }
  return render_generic(s);
}

auto render_chain(const status& s, std::string_view locale, const message_resolver& resolver,
                  const render_options& options) -> std::vector<std::string> {
  std::vector<std::string> lines;
  for (const auto& level : s.chain(options.view)) {
    lines.push_back(render(level, locale, resolver, options));
  }
  return lines;
}

auto render_report(const status& s, std::string_view locale, const message_resolver& resolver,
                   const render_options& options) -> std::string {
  std::string out = render(s, locale, resolver, options);
  out += '\n';
  if (!s.context().empty()) {
    out += '\n';
    out += to_string(s.context());
  }
  auto chain = s.chain(options.view);
  auto it = chain.begin();
  for (++it; it != chain.end(); ++it) {
    out += "\nCaused by: ";
    out += render(*it, locale, resolver, options);
    out += '\n';
  }
  return out;
}

} // namespace errata
