#include <catch2/catch_all.hpp>

#include <string>
#include <thread>
#include <vector>

#include <errata/errata.hpp>
#include <tests/support/sample_kinds.hpp>

using errata::status;
namespace kinds = test_support;

namespace {

// Low-level site: reports the failure with what it knows.
auto read_file(const std::string& path) -> errata::result<std::string> {
  return errata::fail(status{kinds::io_error}.with_context("path", path).with_context("errno", 5));
}

// Mid-level frame: wraps with its own classification and context.
auto load_config(const std::string& name) -> errata::result<int> {
  auto text = errata::into_source(read_file("/etc/" + name), kinds::config_load_failed);
  if (!text) return errata::fail(std::move(text.error()).with_context("config", name));
  return 0;
}

} // namespace

TEST_CASE("file not found renders through the catalog", "[e2e]") {
  const auto cat = kinds::sample_catalog();
  status s = status{kinds::not_found}.with_context("path", "/etc/x");
  REQUIRE(errata::render(s, "en-US", cat) == "File /etc/x not found");
}

TEST_CASE("wrapped failure crosses a process boundary and renders outermost first", "[e2e][wire]") {
  auto loaded = load_config("app.toml");
  REQUIRE_FALSE(loaded.has_value());
  const status& s = loaded.error();

  // Producer side
  auto frame = errata::wire::encode_sealed(s);
  REQUIRE(frame.has_value());

  // Consumer side, with its own classification set and catalog
  const auto set = kinds::sample_set();
  const auto cat = kinds::sample_catalog();
  auto received = errata::wire::decode_sealed(*frame, set);
  REQUIRE(received.has_value());
  REQUIRE(*received == s);

  auto lines = errata::render_chain(*received, "en-US", cat);
  REQUIRE(lines.size() == 2);
  REQUIRE(lines[0] == "Could not load configuration app.toml");
  REQUIRE(lines[1] == "I/O failure on /etc/app.toml");

  REQUIRE(received->find(kinds::io_error) != nullptr);
  REQUIRE(*received->root_cause()->context().resolve("errno")->as_integer() == 5);
}

TEST_CASE("internal detail travels but stays out of the public rendering", "[e2e][wire]") {
  status s = status::wrap_internal(kinds::permission_denied,
                                   status{kinds::io_error}.with_context("path", "/var/lib/secret"))
                 .with_message("access denied");
  auto bytes = errata::wire::encode_status(s);
  auto received = errata::wire::decode_status(bytes, kinds::sample_set());
  REQUIRE(received.has_value());

  const auto cat = kinds::sample_catalog();
  const auto report = errata::render_report(*received, "en-US", cat);
  REQUIRE(report == "access denied\n");
  REQUIRE(report.find("secret") == std::string::npos);

  errata::render_options opts;
  opts.view = errata::chain_view::internal_view;
  const auto full = errata::render_report(*received, "en-US", cat, opts);
  REQUIRE(full.find("Caused by: I/O failure on /var/lib/secret") != std::string::npos);
}

TEST_CASE("a shared status is read concurrently", "[e2e][concurrency]") {
  const auto loaded = load_config("app.toml");
  REQUIRE_FALSE(loaded.has_value());
  const status& s = loaded.error();
  const auto cat = kinds::sample_catalog();
  const auto set = kinds::sample_set();
  const auto expected_bytes = errata::wire::encode_status(s);

  std::vector<int> ok(8, 0);
  std::vector<std::thread> threads;
  for (std::size_t t = 0; t < ok.size(); ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 200; ++i) {
        auto bytes = errata::wire::encode_status(s);
        auto back = errata::wire::decode_status(bytes, set);
        if (bytes != expected_bytes || !back || errata::render_chain(*back, "en-US", cat).size() != 2) {
          return;
        }
      }
      ok[t] = 1;
    });
  }
  for (auto& th : threads) th.join();
  for (int v : ok) REQUIRE(v == 1);
}
