#include <adocref/antora/layout.hpp>
#include <adocref/log.hpp>
#include <array>
#include <functional>

namespace adocref {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Families
// ---------------------------------------------------------------------------

namespace {

struct FamilyEntry {
    Family family;
    const char* name;
};

const std::array<FamilyEntry, 5> FAMILY_TABLE = {{
    {Family::Example,    "example"},
    {Family::Attachment, "attachment"},
    {Family::Partial,    "partial"},
    {Family::Image,      "image"},
    {Family::Page,       "page"},
}};

} // anonymous namespace

const char* family_name(Family f) {
    for (const auto& e : FAMILY_TABLE) {
        if (e.family == f) return e.name;
    }
    return "";
}

std::optional<Family> parse_family(const std::string& name) {
    for (const auto& e : FAMILY_TABLE) {
        if (name == e.name) return e.family;
    }
    return std::nullopt;
}

const std::vector<Family>& all_families() {
    static const std::vector<Family> families = {
        Family::Example, Family::Attachment, Family::Partial,
        Family::Image, Family::Page};
    return families;
}

std::string to_slash_path(const fs::path& p) {
    std::string s = p.string();
    for (char& c : s) {
        if (c == '\\') c = '/';
    }
    return s;
}

// ---------------------------------------------------------------------------
// Walking
// ---------------------------------------------------------------------------

static fs::path normalized(const fs::path& p) {
    fs::path n = p.lexically_normal();
    // "a/b/" and "a/b" must compare equal
    if (!n.has_filename() && n.has_parent_path() && n != n.root_path()) {
        n = n.parent_path();
    }
    return n;
}

static bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

bool is_module_root(const fs::path& dir) {
    fs::path d = normalized(dir);
    fs::path parent = d.parent_path();
    if (parent.empty() || parent == d || parent.filename() != "modules") {
        return false;
    }
    std::error_code ec;
    return fs::exists(parent.parent_path() / ANTORA_YML, ec);
}

// Visit start_dir and its ancestors up to and including project_root.
// visit(dir, depth) returns true to stop the walk.
static void walk_up(const fs::path& project_root, const fs::path& start_dir,
                    const std::function<bool(const fs::path&, int)>& visit) {
    fs::path root = normalized(project_root);
    fs::path dir = normalized(start_dir);
    int depth = 0;
    while (!dir.empty()) {
        if (visit(dir, depth)) return;
        if (dir == root) return;
        fs::path parent = dir.parent_path();
        if (parent == dir) return;
        dir = parent;
        ++depth;
    }
}

// Directory of a family relative to a module root, if present
static std::optional<std::string> family_subdir(const fs::path& module_dir,
                                                Family family) {
    std::string plural = std::string(family_name(family)) + "s";
    switch (family) {
    case Family::Image:
    case Family::Attachment:
        if (is_dir(module_dir / "assets" / plural)) return "assets/" + plural;
        if (is_dir(module_dir / plural)) return plural;
        return std::nullopt;
    case Family::Example:
    case Family::Page:
        if (is_dir(module_dir / plural)) return plural;
        return std::nullopt;
    case Family::Partial:
        if (is_dir(module_dir / "partials")) return std::string("partials");
        if (is_dir(module_dir / "pages" / "_partials")) return std::string("pages/_partials");
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<fs::path> find_module_root(const fs::path& project_root,
                                         const fs::path& start_dir) {
    std::optional<fs::path> found;
    walk_up(project_root, start_dir, [&](const fs::path& dir, int) {
        if (is_module_root(dir)) {
            found = dir;
            return true;
        }
        return false;
    });
    return found;
}

std::optional<fs::path> find_convention_dir(const fs::path& project_root,
                                            const fs::path& start_dir,
                                            Family family) {
    std::optional<fs::path> found;
    walk_up(project_root, start_dir, [&](const fs::path& dir, int) {
        if (!is_module_root(dir)) return false;
        auto sub = family_subdir(dir, family);
        if (!sub) return false;
        found = dir / *sub;
        return true;
    });
    if (!found) {
        log::trace("no %ss directory above %s", family_name(family),
                   start_dir.string().c_str());
    }
    return found;
}

std::optional<std::string> find_convention_dir_relative(
    const fs::path& project_root, const fs::path& start_dir, Family family) {
    std::optional<std::string> found;
    walk_up(project_root, start_dir, [&](const fs::path& dir, int depth) {
        if (!is_module_root(dir)) return false;
        auto sub = family_subdir(dir, family);
        if (!sub) return false;
        std::string rel;
        for (int i = 0; i < depth; ++i) rel += "../";
        found = rel + *sub;
        return true;
    });
    return found;
}

std::optional<fs::path> find_snippets_dir(const fs::path& project_root,
                                          const fs::path& start_dir) {
    std::error_code ec;
    std::optional<fs::path> found;
    walk_up(project_root, start_dir, [&](const fs::path& dir, int) {
        if (fs::exists(dir / "pom.xml", ec) &&
            is_dir(dir / "target" / "generated-snippets")) {
            found = dir / "target" / "generated-snippets";
            return true;
        }
        if ((fs::exists(dir / "build.gradle", ec) ||
             fs::exists(dir / "build.gradle.kts", ec)) &&
            is_dir(dir / "build" / "generated-snippets")) {
            found = dir / "build" / "generated-snippets";
            return true;
        }
        return false;
    });
    return found;
}

std::vector<std::pair<std::string, std::string>> convention_attributes(
    const fs::path& project_root, const fs::path& start_dir) {
    std::vector<std::pair<std::string, std::string>> attrs;
    for (Family f : {Family::Partial, Family::Image, Family::Attachment, Family::Example}) {
        auto dir = find_convention_dir(project_root, start_dir, f);
        if (dir) {
            attrs.emplace_back(std::string(family_name(f)) + "sdir",
                               to_slash_path(*dir));
        }
    }
    return attrs;
}

} // namespace adocref
