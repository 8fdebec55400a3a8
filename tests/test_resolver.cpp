#include <catch2/catch.hpp>
#include <adocref/resolver.hpp>
#include "temp_dir.hpp"

#include <atomic>
#include <thread>

using namespace adocref;
namespace fs = std::filesystem;

static void setup_project(TempDir& td) {
    td.write_file(CONFIG_FILE_NAME, "[resolve]\nmax-substitutions = 3\n");
    td.write_file("docs/antora.yml", "name: guide\nversion: '1.0'\ntitle: Guide\n");
    td.write_file("docs/modules/ROOT/pages/index.adoc",
        "= Index\n:doc-title: {page-component-title} Index\n\n[[top]]\n== Top\n");
    td.write_file("docs/modules/ROOT/images/logo.png", "png");
    td.write_file("docs/modules/ROOT/pages/loop.adoc", ":self: x{self}\n");
}

TEST_CASE("ResolveOptions from configuration", "[resolver]") {
    Config cfg;
    cfg.resolve.max_substitutions = 12;
    REQUIRE(ResolveOptions::from_config(cfg).max_substitutions == 12);
    REQUIRE(ResolveOptions{}.max_substitutions == 64);
}

TEST_CASE("ReferenceResolver end to end", "[resolver]") {
    TempDir td("adocref_resolver");
    setup_project(td);

    auto opened = WorkspaceIndex::open(td.path);
    REQUIRE(opened.is_ok());
    auto& index = *opened.value();
    ReferenceResolver resolver(index, ResolveOptions::from_config(index.config()));
    REQUIRE(resolver.options().max_substitutions == 3);

    auto page = td.path / "docs/modules/ROOT/pages/index.adoc";

    SECTION("keys") {
        REQUIRE(resolver.resolve_key(page, "image$logo.png") ==
                std::vector<std::string>{td.slash("docs/modules/ROOT/images/logo.png")});
        REQUIRE(resolver.resolve_key(page, "logo.png", Family::Image) ==
                std::vector<std::string>{td.slash("docs/modules/ROOT/images/logo.png")});
        REQUIRE(resolver.resolve_key(td.path, "image$logo.png") ==
                std::vector<std::string>{"image$logo.png"});
        REQUIRE(resolver.resolve_key_in_module(td.path / "docs/modules/ROOT", "page$index.adoc") ==
                std::vector<std::string>{td.slash("docs/modules/ROOT/pages/index.adoc")});
    }

    SECTION("modules") {
        auto root = resolver.module_root(page);
        REQUIRE(root.has_value());
        REQUIRE(*root == td.path / "docs/modules/ROOT");
        REQUIRE_FALSE(resolver.module_root(td.path / "docs").has_value());

        auto prefixes = resolver.collect_prefixes(*root);
        REQUIRE(prefixes.size() == 3);
        REQUIRE(prefixes[0].prefix == "ROOT:");

        REQUIRE(resolver.resolve_prefix(*root, "guide::") ==
                std::vector<fs::path>{td.path / "docs/modules/ROOT"});
        REQUIRE(resolver.descriptors().size() == 1);
    }

    SECTION("attributes") {
        REQUIRE(resolver.expand_attributes(page, "{doc-title}") ==
                std::optional<std::string>("Guide Index"));
        // Bound from adocref.toml
        REQUIRE_FALSE(resolver.expand_attributes(page, "{self}").has_value());

        REQUIRE(resolver.find_attributes(page, "doc-title").size() == 1);
        REQUIRE_FALSE(resolver.collect_attributes(page).empty());
    }

    SECTION("block ids") {
        auto ids = resolver.find_block_ids("top");
        REQUIRE(ids.size() == 1);
        REQUIRE(ids[0].pos.line == 4);
    }
}

TEST_CASE("ReferenceResolver calls may run concurrently", "[resolver]") {
    TempDir td("adocref_resolver");
    setup_project(td);

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());
    ReferenceResolver resolver(index);
    auto page = td.path / "docs/modules/ROOT/pages/index.adoc";
    std::string expected = td.slash("docs/modules/ROOT/images/logo.png");

    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto r = resolver.resolve_key(page, "image$logo.png");
                if (r.size() != 1 || r[0] != expected) ++failures;
            }
        });
    }
    // Rescans take the exclusive lock and interleave with the readers
    for (int i = 0; i < 5; ++i) {
        REQUIRE(index.scan().is_ok());
    }
    for (auto& th : threads) th.join();
    REQUIRE(failures == 0);
}
