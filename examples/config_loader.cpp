/**
 * Config loading example using errata
 *
 * This example demonstrates:
 * - Reporting a failure at a low-level site
 * - Wrapping it with context at each frame
 * - Rendering the chain through a message catalog
 * - Shipping the status to a peer as a sealed frame
 */

#include <errata/errata.hpp>
#include <iostream>
#include <string>

namespace kinds {
constexpr errata::classification not_found{"not_found"};
constexpr errata::classification io_error{"io_error"};
constexpr errata::classification config_load_failed{"config_load_failed"};
}

// Pretend storage layer: every read fails
errata::result<std::string> read_file(const std::string& path) {
    return errata::fail(errata::status{kinds::io_error}
                            .with_context("path", path)
                            .with_context("errno", 5));
}

errata::result<int> load_config(const std::string& name) {
    ERRATA_ENSURE(!name.empty(), kinds::not_found);
    auto text = errata::into_source(read_file("/etc/" + name), kinds::config_load_failed);
    if (!text) {
        return errata::fail(std::move(text.error()).with_context("config", name));
    }
    return static_cast<int>(text->size());
}

int main(int argc, char** argv) {
    const std::string name = argc > 1 ? argv[1] : "app.toml";

    errata::catalog_resolver catalog{"en-US"};
    catalog.add(kinds::io_error, "en-US", "I/O failure on {path}")
           .add(kinds::config_load_failed, "en-US", "Could not load configuration {config}")
           .add(kinds::config_load_failed, "de-DE", "Konfiguration {config} konnte nicht geladen werden");

    auto loaded = load_config(name);
    if (loaded) {
        std::cout << "Loaded " << *loaded << " bytes" << std::endl;
        return 0;
    }
    const auto options = errata::render_options::from_env();
    std::cout << errata::render_report(loaded.error(), "en-US", catalog, options);

    // Hand the failure to another process
    auto frame = errata::wire::encode_sealed(loaded.error());
    if (!frame) {
        std::cerr << "encode failed: " << frame.error().message << std::endl;
        return 2;
    }
    auto kinds_known = errata::classification_set::make(
        {kinds::not_found, kinds::io_error, kinds::config_load_failed});
    if (!kinds_known) {
        std::cerr << "bad classification set: " << kinds_known.error().message << std::endl;
        return 2;
    }
    auto received = errata::wire::decode_sealed(*frame, *kinds_known);
    if (!received) {
        std::cerr << "decode failed: " << received.error().message << std::endl;
        return 2;
    }
    std::cout << "\nPeer (" << frame->size() << " bytes on the wire):\n";
    for (const auto& line : errata::render_chain(*received, "de-DE", catalog, options)) {
        std::cout << "  " << line << "\n";
    }
    return 1;
}
