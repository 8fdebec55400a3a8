#include <catch2/catch.hpp>
#include <adocref/antora/xref.hpp>
#include <adocref/project_index.hpp>
#include "temp_dir.hpp"

using namespace adocref;
namespace fs = std::filesystem;

using Paths = std::vector<std::string>;

// ===== Key grammar =====

TEST_CASE("parse fully qualified key", "[xref]") {
    auto k = parse_symbolic_key("2.0@lib:api:page$index.adoc");
    REQUIRE(k.version == std::optional<std::string>("2.0"));
    REQUIRE(k.component == std::optional<std::string>("lib"));
    REQUIRE(k.module == std::optional<std::string>("api"));
    REQUIRE(k.family == std::optional<std::string>("page"));
    REQUIRE(k.remainder == "index.adoc");
}

TEST_CASE("parse module-only key", "[xref]") {
    auto k = parse_symbolic_key("admin:setup.adoc");
    REQUIRE_FALSE(k.version.has_value());
    REQUIRE_FALSE(k.component.has_value());
    REQUIRE(k.module == std::optional<std::string>("admin"));
    REQUIRE_FALSE(k.family.has_value());
    REQUIRE(k.remainder == "setup.adoc");
}

TEST_CASE("parse root module shorthand", "[xref]") {
    auto k = parse_symbolic_key("lib::partial$nav.adoc");
    REQUIRE(k.component == std::optional<std::string>("lib"));
    REQUIRE(k.module == std::optional<std::string>(""));
    REQUIRE(k.family == std::optional<std::string>("partial"));
    REQUIRE(k.remainder == "nav.adoc");
}

TEST_CASE("parse family-only and plain keys", "[xref]") {
    auto image = parse_symbolic_key("image$logo.png");
    REQUIRE(image.family == std::optional<std::string>("image"));
    REQUIRE(image.remainder == "logo.png");

    auto plain = parse_symbolic_key("chapter/intro.adoc");
    REQUIRE_FALSE(plain.module.has_value());
    REQUIRE_FALSE(plain.family.has_value());
    REQUIRE(plain.remainder == "chapter/intro.adoc");
}

TEST_CASE("parse unknown family stays in the remainder", "[xref]") {
    auto k = parse_symbolic_key("video$clip.mp4");
    REQUIRE_FALSE(k.family.has_value());
    REQUIRE(k.remainder == "video$clip.mp4");

    auto later = parse_symbolic_key("dir/page$x.adoc");
    REQUIRE_FALSE(later.family.has_value());
    REQUIRE(later.remainder == "dir/page$x.adoc");
}

TEST_CASE("parse consumes prefixes left to right only once", "[xref]") {
    auto k = parse_symbolic_key("a:b:c:d");
    REQUIRE(k.component == std::optional<std::string>("a"));
    REQUIRE(k.module == std::optional<std::string>("b"));
    REQUIRE(k.remainder == "c:d");

    auto v = parse_symbolic_key("@x.adoc");
    REQUIRE(v.version == std::optional<std::string>(""));
    REQUIRE(v.remainder == "x.adoc");
}

TEST_CASE("is_url recognizes supported schemes", "[xref]") {
    REQUIRE(is_url("https://example.org/a.png"));
    REQUIRE(is_url("http://example.org"));
    REQUIRE(is_url("file:///tmp/x"));
    REQUIRE(is_url("ftp://host/x"));
    REQUIRE(is_url("irc://irc.libera.chat/asciidoc"));
    REQUIRE_FALSE(is_url("mailto:someone@example.org"));
    REQUIRE_FALSE(is_url("https:/missing-slash"));
    REQUIRE_FALSE(is_url("image$https.png"));
}

// ===== Resolution =====

static void setup_project(TempDir& td) {
    td.write_file("docs/antora.yml", "name: guide\nversion: '1.0'\n");
    td.write_file("docs/modules/ROOT/pages/index.adoc", "= Index\n");
    td.write_file("docs/modules/ROOT/assets/images/logo.png", "png");
    td.write_file("docs/modules/ROOT/partials/nav.adoc", "* item\n");
    td.write_file("docs/modules/admin/pages/setup.adoc", "= Setup\n");
    td.make_dir("docs/modules/admin/images");

    td.write_file("lib/antora.yml", "name: lib\nversion: '2.0'\n");
    td.write_file("lib/modules/ROOT/pages/api.adoc", "= API\n");
    td.write_file("lib/modules/ROOT/examples/demo.java", "class Demo {}\n");

    td.write_file("lib-v1/antora.yml", "name: lib\nversion: '1.0'\n");
    td.make_dir("lib-v1/modules/ROOT/examples");
}

struct Fixture {
    TempDir td{"adocref_xref"};
    std::unique_ptr<WorkspaceIndex> index;

    Fixture() {
        setup_project(td);
        index = std::make_unique<WorkspaceIndex>(td.path, Config{});
        REQUIRE(index->scan().is_ok());
    }

    fs::path module(const std::string& rel) const { return td.path / rel; }
};

TEST_CASE("resolve family key in the anchor module", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_symbolic_key(*fx.index, root, "image$logo.png", std::nullopt) ==
            Paths{fx.td.slash("docs/modules/ROOT/assets/images/logo.png")});
    REQUIRE(resolve_symbolic_key(*fx.index, root, "partial$nav.adoc", std::nullopt) ==
            Paths{fx.td.slash("docs/modules/ROOT/partials/nav.adoc")});
}

TEST_CASE("resolve uses the default family", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_symbolic_key(*fx.index, root, "logo.png", Family::Image) ==
            Paths{fx.td.slash("docs/modules/ROOT/assets/images/logo.png")});
    // Explicit family wins over the default
    REQUIRE(resolve_symbolic_key(*fx.index, root, "partial$nav.adoc", Family::Image) ==
            Paths{fx.td.slash("docs/modules/ROOT/partials/nav.adoc")});
}

TEST_CASE("resolve returns the key when no family applies", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_symbolic_key(*fx.index, root, "logo.png", std::nullopt) == Paths{"logo.png"});
}

TEST_CASE("resolve returns URLs unchanged", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_symbolic_key(*fx.index, root, "https://example.org/x.png", Family::Image) ==
            Paths{"https://example.org/x.png"});
    // Even without any module context
    REQUIRE(resolve_symbolic_key(*fx.index, fx.td.path, "https://example.org/x.png", Family::Image) ==
            Paths{"https://example.org/x.png"});
}

TEST_CASE("resolve inherits component and version", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_symbolic_key(*fx.index, root, "admin:image$new.png", std::nullopt) ==
            Paths{fx.td.slash("docs/modules/admin/images/new.png")});
    REQUIRE(resolve_symbolic_key(*fx.index, root, "admin:page$setup.adoc", std::nullopt) ==
            Paths{fx.td.slash("docs/modules/admin/pages/setup.adoc")});
}

TEST_CASE("resolve across components and versions", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_symbolic_key(*fx.index, root, "2.0@lib::example$demo.java", std::nullopt) ==
            Paths{fx.td.slash("lib/modules/ROOT/examples/demo.java")});
    // Version defaults to the anchor's (1.0): the file does not exist there
    REQUIRE(resolve_symbolic_key(*fx.index, root, "lib::example$demo.java", std::nullopt) ==
            Paths{fx.td.slash("lib-v1/modules/ROOT/examples/demo.java")});
    REQUIRE(resolve_symbolic_key(*fx.index, root, "2.0@lib:ROOT:page$api.adoc", std::nullopt) ==
            Paths{fx.td.slash("lib/modules/ROOT/pages/api.adoc")});
}

TEST_CASE("resolve returns the key when nothing matches", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_symbolic_key(*fx.index, root, "nosuch::page$a.adoc", std::nullopt) ==
            Paths{"nosuch::page$a.adoc"});
    // Module exists but has no attachments directory
    REQUIRE(resolve_symbolic_key(*fx.index, root, "attachment$a.zip", std::nullopt) ==
            Paths{"attachment$a.zip"});
    REQUIRE(resolve_symbolic_key(*fx.index, fx.td.path / "docs", "image$logo.png", std::nullopt) ==
            Paths{"image$logo.png"});
}

TEST_CASE("resolve lists existing files first", "[xref]") {
    TempDir td("adocref_xref");
    td.write_file("docs/antora.yml", "name: guide\nversion: '1.0'\n");
    td.make_dir("docs/modules/ROOT/pages");
    td.write_file("x/antora.yml", "name: dup\nversion: '1.0'\n");
    td.make_dir("x/modules/ROOT/pages");
    td.write_file("y/antora.yml", "name: dup\nversion: '1.0'\n");
    td.write_file("y/modules/ROOT/pages/only-y.adoc", "y\n");
    td.write_file("y/modules/ROOT/pages/both.adoc", "y\n");
    td.write_file("x/modules/ROOT/pages/both.adoc", "x\n");

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());
    auto lock = index.read_lock();
    auto root = td.path / "docs/modules/ROOT";

    REQUIRE(resolve_symbolic_key(index, root, "dup::page$only-y.adoc", std::nullopt) == Paths{
        td.slash("y/modules/ROOT/pages/only-y.adoc"),
        td.slash("x/modules/ROOT/pages/only-y.adoc")});
    REQUIRE(resolve_symbolic_key(index, root, "dup::page$both.adoc", std::nullopt) == Paths{
        td.slash("x/modules/ROOT/pages/both.adoc"),
        td.slash("y/modules/ROOT/pages/both.adoc")});
    REQUIRE(resolve_symbolic_key(index, root, "dup::page$none.adoc", std::nullopt) == Paths{
        td.slash("x/modules/ROOT/pages/none.adoc"),
        td.slash("y/modules/ROOT/pages/none.adoc")});
}

TEST_CASE("resolve from an unnamed component", "[xref]") {
    TempDir td("adocref_xref");
    td.write_file("docs/antora.yml", "title: No Name\n");
    td.write_file("docs/modules/ROOT/pages/a.adoc", "= A\n");
    td.write_file("other/antora.yml", "name: other\n");
    td.make_dir("other/modules/ROOT/pages");

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());
    auto lock = index.read_lock();
    auto root = td.path / "docs/modules/ROOT";

    REQUIRE(resolve_symbolic_key(index, root, "page$a.adoc", std::nullopt) ==
            Paths{td.slash("docs/modules/ROOT/pages/a.adoc")});
    REQUIRE(resolve_symbolic_key(index, root, "ROOT:page$b.adoc", std::nullopt) ==
            Paths{td.slash("docs/modules/ROOT/pages/b.adoc")});
    // A named component does not match the unnamed one
    REQUIRE(resolve_symbolic_key(index, root, "other::page$a.adoc", std::nullopt) ==
            Paths{"other::page$a.adoc"});
}

TEST_CASE("resolve_symbolic_key_at finds the module from a file", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();

    auto page = fx.td.path / "docs/modules/admin/pages/setup.adoc";
    REQUIRE(resolve_symbolic_key_at(*fx.index, page, "page$setup.adoc", std::nullopt) ==
            Paths{fx.td.slash("docs/modules/admin/pages/setup.adoc")});
    REQUIRE(resolve_symbolic_key_at(*fx.index, fx.td.path / "docs/antora.yml",
                                    "page$setup.adoc", std::nullopt) == Paths{"page$setup.adoc"});
}

TEST_CASE("resolve_prefix returns module directories", "[xref]") {
    Fixture fx;
    auto lock = fx.index->read_lock();
    auto root = fx.module("docs/modules/ROOT");

    REQUIRE(resolve_prefix(*fx.index, root, "2.0@lib::") ==
            std::vector<fs::path>{fx.td.path / "lib/modules/ROOT"});
    REQUIRE(resolve_prefix(*fx.index, root, "admin:") ==
            std::vector<fs::path>{fx.td.path / "docs/modules/admin"});
    // No prefix: the anchor module itself
    REQUIRE(resolve_prefix(*fx.index, root, "page$index.adoc") ==
            std::vector<fs::path>{fx.td.path / "docs/modules/ROOT"});
    REQUIRE(resolve_prefix(*fx.index, root, "missing:").empty());
    REQUIRE(resolve_prefix(*fx.index, fx.td.path, "admin:").empty());
}
