#include <catch2/catch_all.hpp>

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include <errata/render.hpp>
#include <tests/support/cerr_capture.hpp>
#include <tests/support/sample_kinds.hpp>

using errata::chain_view;
using errata::render;
using errata::render_options;
using errata::status;
namespace kinds = test_support;

namespace {

// Resolver with no templates at all
class empty_resolver final : public errata::message_resolver {
public:
  auto lookup(errata::classification, std::string_view) const -> std::optional<std::string> override {
    ++lookups;
    return std::nullopt;
  }
  auto default_locale() const -> std::string_view override { return "en-US"; }
  mutable int lookups{0};
};

} // namespace

TEST_CASE("template substitution uses the context", "[render]") {
  auto cat = kinds::sample_catalog();
  status s = status{kinds::not_found}.with_context("path", "/etc/x");
  REQUIRE(render(s, "en-US", cat) == "File /etc/x not found");
  REQUIRE(render(s, "de-DE", cat) == "Datei /etc/x nicht gefunden");
}

TEST_CASE("missing locale falls back to the resolver default", "[render]") {
  auto cat = kinds::sample_catalog();
  status s = status{kinds::io_error}.with_context("path", "/dev/sdb");
  REQUIRE(render(s, "fr-FR", cat) == "I/O failure on /dev/sdb");
}

TEST_CASE("no template anywhere degrades to the generic form", "[render]") {
  empty_resolver res;
  status s = status{kinds::permission_denied}
                 .with_context("path", "/root/secret")
                 .with_context("uid", 1000)
                 .with_context("path", "/root/secret.d");
  const auto text = render(s, "fr-FR", res);
  REQUIRE(text == "permission_denied (path=/root/secret.d, uid=1000)");
  REQUIRE(text.find("permission_denied") != std::string::npos);
  REQUIRE(text.find("path") != std::string::npos);
  REQUIRE(text.find("uid") != std::string::npos);
  REQUIRE(res.lookups == 2);
}

TEST_CASE("generic form without context is the identifier", "[render]") {
  empty_resolver res;
  REQUIRE(render(status{kinds::io_error}, "en-US", res) == "io_error");
  // Requested locale equals the default: only one lookup
  REQUIRE(res.lookups == 1);
}

TEST_CASE("literal message bypasses the catalog", "[render]") {
  auto cat = kinds::sample_catalog();
  status s = status{kinds::not_found}.with_context("path", "/etc/x").with_message("gone");
  REQUIRE(render(s, "en-US", cat) == "gone");
  REQUIRE(s.context().contains("path"));
}

TEST_CASE("absent placeholder key renders the unknown marker", "[render]") {
  auto cat = kinds::sample_catalog();
  status s{kinds::not_found};
  REQUIRE(render(s, "en-US", cat) == "File <unknown> not found");
  render_options opts;
  opts.unknown_marker = "?";
  REQUIRE(render(s, "en-US", cat, opts) == "File ? not found");
}

TEST_CASE("substitute handles braces and typed values", "[render][template]") {
  errata::context ctx;
  ctx.append("n", 3);
  ctx.append("ok", false);
  ctx.append("ratio", 0.25);
  ctx.append("span", errata::value_list{4, 7});
  using errata::substitute;
  REQUIRE(substitute("{n} items", ctx) == "3 items");
  REQUIRE(substitute("{ok}/{ratio}/{span}", ctx) == "false/0.25/[4, 7]");
  REQUIRE(substitute("{{n}} is {n}", ctx) == "{n} is 3");
  REQUIRE(substitute("}} and }", ctx) == "} and }");
  REQUIRE(substitute("open {n", ctx) == "open {n");
  REQUIRE(substitute("{}", ctx) == "<unknown>");
  REQUIRE(substitute("", ctx).empty());
}

TEST_CASE("template expanding to nothing falls back to the generic form", "[render]") {
  errata::catalog_resolver cat{"en-US"};
  cat.add(kinds::io_error, "en-US", "");
  REQUIRE(render(status{kinds::io_error}, "en-US", cat) == "io_error");
}

TEST_CASE("render_chain yields one line per level, outermost first", "[render][chain]") {
  auto cat = kinds::sample_catalog();
  status s = status::wrap(kinds::config_load_failed,
                          status{kinds::io_error}.with_context("path", "/etc/app.toml"))
                 .with_context("config", "app.toml");
  auto lines = errata::render_chain(s, "en-US", cat);
  REQUIRE(lines == std::vector<std::string>{"Could not load configuration app.toml",
                                            "I/O failure on /etc/app.toml"});
}

TEST_CASE("render_chain respects the internal view", "[render][chain]") {
  auto cat = kinds::sample_catalog();
  status s = status::wrap_internal(kinds::config_load_failed, status{kinds::io_error});
  REQUIRE(errata::render_chain(s, "en-US", cat).size() == 1);
  render_options opts;
  opts.view = chain_view::internal_view;
  REQUIRE(errata::render_chain(s, "en-US", cat, opts).size() == 2);
}

TEST_CASE("render_report lists context and causes", "[render][report]") {
  auto cat = kinds::sample_catalog();
  status s = status::wrap(kinds::config_load_failed,
                          status{kinds::io_error}.with_context("path", "/etc/app.toml"))
                 .with_context("config", "app.toml");
  const std::string expected =
      "Could not load configuration app.toml\n"
      "\n"
      "config: app.toml\n"
      "\n"
      "Caused by: I/O failure on /etc/app.toml\n";
  REQUIRE(errata::render_report(s, "en-US", cat) == expected);
  REQUIRE(errata::render_report(status{kinds::io_error}, "en-US", kinds::sample_catalog()) ==
          "I/O failure on <unknown>\n");
}

TEST_CASE("catalog_resolver replaces templates", "[render][catalog]") {
  errata::catalog_resolver cat;
  REQUIRE(cat.default_locale() == "en-US");
  cat.add(kinds::not_found, "en-US", "a");
  cat.add(kinds::not_found, "en-US", "b");
  REQUIRE(cat.size() == 1);
  REQUIRE(cat.lookup(kinds::not_found, "en-US") == std::optional<std::string>("b"));
  REQUIRE_FALSE(cat.lookup(kinds::io_error, "en-US").has_value());
}

TEST_CASE("render_options read from the environment", "[render][config]") {
#if !defined(_WIN32)
  unsetenv("ERRATA_RENDER_INTERNAL");
  REQUIRE(render_options::from_env().view == chain_view::public_view);
  setenv("ERRATA_RENDER_INTERNAL", "1", 1);
  REQUIRE(render_options::from_env().view == chain_view::internal_view);
  unsetenv("ERRATA_RENDER_INTERNAL");
#endif
  REQUIRE(render_options::from_env().unknown_marker == "<unknown>");
}

TEST_CASE("hand-built blank classifications still render text", "[render]") {
  const errata::catalog_resolver empty;
  REQUIRE(render(status{errata::classification{""}}, "en-US", empty) == "errata.unrecognized");
  REQUIRE(render(status{errata::classification{"  "}}, "en-US", empty) == "errata.unrecognized");
  status s = status{errata::classification{" "}}.with_context("path", "/tmp");
  REQUIRE(render(s, "en-US", empty) == "errata.unrecognized (path=/tmp)");
}

TEST_CASE("template resolution is traced only when debugging is enabled", "[render][logging]") {
  auto cat = kinds::sample_catalog();
  status s = status{kinds::permission_denied}.with_context("path", "/root");

  SECTION("flag set") {
    render_options opts;
    opts.debug = true;
    test_support::cerr_capture cap;
    REQUIRE(render(s, "fr-FR", cat, opts) == "permission_denied (path=/root)");
    const auto text = cap.text();
    REQUIRE(text.find("[errata][render] no template for permission_denied in fr-FR, trying en-US") !=
            std::string::npos);
    REQUIRE(text.find("[errata][render] using generic template for permission_denied") !=
            std::string::npos);
  }
  SECTION("flag unset") {
    test_support::cerr_capture cap;
    REQUIRE(render(s, "fr-FR", cat) == "permission_denied (path=/root)");
    REQUIRE(cap.text().empty());
  }
  SECTION("catalog hit stays quiet") {
    render_options opts;
    opts.debug = true;
    test_support::cerr_capture cap;
    REQUIRE(render(status{kinds::not_found}.with_context("path", "/x"), "en-US", cat, opts) ==
            "File /x not found");
    REQUIRE(cap.text().empty());
  }
#if !defined(_WIN32)
  SECTION("ERRATA_RENDER_DEBUG drives from_env") {
    setenv("ERRATA_RENDER_DEBUG", "1", 1);
    const auto on = render_options::from_env();
    {
      // The environment is consulted by from_env only, not by render itself
      test_support::cerr_capture cap;
      REQUIRE(render(s, "fr-FR", cat) == "permission_denied (path=/root)");
      REQUIRE(cap.text().empty());
    }
    unsetenv("ERRATA_RENDER_DEBUG");
    REQUIRE(on.debug);
    REQUIRE_FALSE(render_options::from_env().debug);
  }
#endif
}
