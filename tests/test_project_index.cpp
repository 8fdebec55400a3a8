#include <catch2/catch.hpp>
#include <adocref/project_index.hpp>
#include <adocref/descriptor_cache.hpp>
#include "temp_dir.hpp"

using namespace adocref;
namespace fs = std::filesystem;

static std::vector<std::string> values_of(const std::vector<AttributeDeclaration>& decls) {
    std::vector<std::string> out;
    for (auto& d : decls) out.push_back(d.value().value_or("<unset>"));
    return out;
}

TEST_CASE("to_lower", "[project_index]") {
    REQUIRE(to_lower("Page-Component-NAME_1") == "page-component-name_1");
    REQUIRE(to_lower("") == "");
}

TEST_CASE("scan records files by name", "[project_index]") {
    TempDir td("adocref_index");
    td.write_file("a/antora.yml", "name: a\n");
    td.write_file("b/c/antora.yml", "name: c\n");
    td.write_file("b/readme.adoc", "text\n");

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());
    auto lock = index.read_lock();

    REQUIRE(index.files_named("antora.yml") == std::vector<fs::path>{
        td.path / "a/antora.yml", td.path / "b/c/antora.yml"});
    REQUIRE(index.files_named("nothing.yml").empty());
    REQUIRE(index.document_count() == 1);
}

TEST_CASE("scan skips hidden directories and exclusions", "[project_index]") {
    TempDir td("adocref_index");
    td.write_file(".git/antora.yml", "name: hidden\n");
    td.write_file("build/site/antora.yml", "name: built\n");
    td.write_file("drafts/x.adoc", ":draft: yes\n");
    td.write_file("docs/antora.yml", "name: docs\n");

    Config cfg;
    cfg.index.exclude = {"build/**", "drafts"};
    WorkspaceIndex index(td.path, cfg);
    REQUIRE(index.scan().is_ok());
    auto lock = index.read_lock();

    REQUIRE(index.files_named("antora.yml") == std::vector<fs::path>{
        td.path / "docs/antora.yml"});
    REQUIRE(index.attribute_declarations("draft").empty());
    REQUIRE(index.document_count() == 0);
}

TEST_CASE("scan indexes attribute entries", "[project_index]") {
    TempDir td("adocref_index");
    auto doc = td.write_file("doc.adoc",
        "= Title\n"
        ":Product: Widget\n"
        ":version:   2.0  \n"
        ":empty:\n"
        ":gone!:\n"
        ":!also-gone:\n"
        "not :an: entry\n"
        ":bad name: x\n"
        ":noseparator:x\n"
        "----\n"
        ":in-listing: ignored\n"
        "----\n");

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());
    auto lock = index.read_lock();

    auto product = index.attribute_declarations("PRODUCT");
    REQUIRE(product.size() == 1);
    REQUIRE(product[0].name() == "product");
    REQUIRE(product[0].value() == std::optional<std::string>("Widget"));
    REQUIRE(product[0].origin() == AttributeDeclaration::Origin::Indexed);
    REQUIRE(product[0].pos().has_value());
    REQUIRE(product[0].pos()->line == 2);
    REQUIRE(product[0].pos()->file == doc.string());

    REQUIRE(values_of(index.attribute_declarations("version")) == std::vector<std::string>{"2.0"});
    REQUIRE(values_of(index.attribute_declarations("empty")) == std::vector<std::string>{""});
    REQUIRE(values_of(index.attribute_declarations("gone")) == std::vector<std::string>{"<unset>"});
    REQUIRE(values_of(index.attribute_declarations("also-gone")) == std::vector<std::string>{"<unset>"});
    REQUIRE(index.attribute_declarations("an").empty());
    REQUIRE(index.attribute_declarations("bad").empty());
    REQUIRE(index.attribute_declarations("noseparator").empty());
    REQUIRE(index.attribute_declarations("in-listing").empty());
}

TEST_CASE("all_attribute_declarations is sorted by name", "[project_index]") {
    TempDir td("adocref_index");
    td.write_file("a.adoc", ":zeta: 1\n:alpha: 2\n");
    td.write_file("b.adoc", ":alpha: 3\n");

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());
    auto lock = index.read_lock();

    auto all = index.all_attribute_declarations();
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].name() == "alpha");
    REQUIRE(all[1].name() == "alpha");
    REQUIRE(all[2].name() == "zeta");
    // Documents are indexed in path order
    REQUIRE(values_of({all[0], all[1]}) == std::vector<std::string>{"2", "3"});
}

TEST_CASE("scan indexes block ids", "[project_index]") {
    TempDir td("adocref_index");
    td.write_file("a.adoc",
        "[[install]]\n"
        "== Install\n"
        "\n"
        "[#usage.lead%collapsible]\n"
        "== Usage\n"
        "\n"
        "[[with-text,Reference Text]]\n"
        "para\n");
    td.write_file("b.adoc", "[[install]]\n== Again\n");

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());
    auto lock = index.read_lock();

    auto install = index.block_ids("install");
    REQUIRE(install.size() == 2);
    REQUIRE(install[0].pos.line == 1);
    REQUIRE(install[0].pos.file == (td.path / "a.adoc").string());

    REQUIRE(index.block_ids("usage").size() == 1);
    REQUIRE(index.block_ids("usage")[0].pos.line == 4);
    REQUIRE(index.block_ids("with-text").size() == 1);
    REQUIRE(index.block_ids("source").empty());
}

TEST_CASE("rescan replaces previous results", "[project_index]") {
    TempDir td("adocref_index");
    td.write_file("a.adoc", ":one: 1\n");

    WorkspaceIndex index(td.path, Config{});
    REQUIRE(index.scan().is_ok());

    fs::remove(td.path / "a.adoc");
    td.write_file("b.adoc", ":two: 2\n");
    REQUIRE(index.scan().is_ok());

    auto lock = index.read_lock();
    REQUIRE(index.attribute_declarations("one").empty());
    REQUIRE(index.attribute_declarations("two").size() == 1);
}

TEST_CASE("open loads configuration and enables the cache", "[project_index]") {
    TempDir td("adocref_index");
    td.write_file(CONFIG_FILE_NAME, R"(
[index]
exclude = ["skip/**"]
[resolve]
max-substitutions = 8
[cache]
enabled = true
)");
    td.write_file("skip/x.adoc", ":skipped: yes\n");
    td.write_file("doc.adoc", ":kept: yes\n");

    auto r = WorkspaceIndex::open(td.path);
    REQUIRE(r.is_ok());
    auto& index = *r.value();
    REQUIRE(index.config().resolve.max_substitutions == 8);
    REQUIRE(index.descriptor_cache() != nullptr);
    REQUIRE(index.descriptor_cache()->is_open());
    REQUIRE(fs::exists(td.path / ".adocref" / "cache.db"));

    auto lock = index.read_lock();
    REQUIRE(index.attribute_declarations("kept").size() == 1);
    REQUIRE(index.attribute_declarations("skipped").empty());
}

TEST_CASE("open fails on a missing directory", "[project_index]") {
    auto r = WorkspaceIndex::open("/nonexistent/adocref/project");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RefError::NotFound);
}

TEST_CASE("open propagates configuration errors", "[project_index]") {
    TempDir td("adocref_index");
    td.write_file(CONFIG_FILE_NAME, "[log]\nlevel = \"chatty\"\n");

    auto r = WorkspaceIndex::open(td.path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RefError::Config);
    REQUIRE(r.error().file == (td.path / CONFIG_FILE_NAME).string());
}

TEST_CASE("base_dir is normalized", "[project_index]") {
    TempDir td("adocref_index");
    WorkspaceIndex index(td.path / "sub" / "..", Config{});
    REQUIRE(index.base_dir() == td.path);
}
