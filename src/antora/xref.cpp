#include <adocref/antora/xref.hpp>
#include <adocref/project_index.hpp>
#include <adocref/log.hpp>

#include <cctype>

namespace adocref {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Key grammar
// ---------------------------------------------------------------------------

static bool is_segment_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == '.' || c == '-';
}

// Length of the run of segment characters starting at pos
static size_t segment_end(const std::string& s, size_t pos) {
    while (pos < s.size() && is_segment_char(s[pos])) ++pos;
    return pos;
}

SymbolicKey parse_symbolic_key(const std::string& key) {
    SymbolicKey result;
    size_t pos = 0;

    // version@
    size_t end = segment_end(key, pos);
    if (end < key.size() && key[end] == '@') {
        result.version = key.substr(pos, end - pos);
        pos = end + 1;
    }

    // component:module: or module:
    end = segment_end(key, pos);
    if (end < key.size() && key[end] == ':') {
        size_t second = segment_end(key, end + 1);
        if (second < key.size() && key[second] == ':') {
            result.component = key.substr(pos, end - pos);
            result.module = key.substr(end + 1, second - end - 1);
            pos = second + 1;
        } else {
            result.module = key.substr(pos, end - pos);
            pos = end + 1;
        }
    }

    // family$
    size_t dollar = key.find('$', pos);
    if (dollar != std::string::npos) {
        std::string family = key.substr(pos, dollar - pos);
        if (parse_family(family)) {
            result.family = family;
            pos = dollar + 1;
        }
    }

    result.remainder = key.substr(pos);
    return result;
}

bool is_url(const std::string& key) {
    static const char* const schemes[] = {"http", "https", "file", "ftp", "irc"};
    for (const char* scheme : schemes) {
        std::string prefix = std::string(scheme) + "://";
        if (key.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

std::vector<fs::path> target_module_dirs(const ProjectIndex& index,
                                         const fs::path& anchor_module_dir,
                                         const ModuleDescriptor& anchor,
                                         const SymbolicKey& key) {
    std::optional<std::string> component = key.component;
    std::optional<std::string> module = key.module;
    std::string version = key.version.value_or(anchor.component_version);

    if (module && !component) {
        component = anchor.component_name;
    }
    if (!component && !module) {
        fs::path self = anchor_module_dir.lexically_normal();
        if (!self.has_filename()) self = self.parent_path();
        component = anchor.component_name;
        module = self.filename().string();
    }
    if (!module || module->empty()) {
        module = "ROOT";
    }

    // An unnamed component still matches descriptors without a name
    std::vector<fs::path> result;
    auto descriptors = find_all_descriptors(index);
    sort_by_proximity(descriptors, anchor_module_dir);

    std::error_code ec;
    for (const auto& d : descriptors) {
        if (d.component_name != *component) continue;
        if (d.component_version != version) continue;
        fs::path dir = d.modules_dir() / *module;
        if (!fs::is_directory(dir, ec)) continue;
        result.push_back(dir);
    }

    log::trace("%s@%s:%s: %zu module dir(s)", version.c_str(),
               component->c_str(), module->c_str(), result.size());
    return result;
}

std::vector<fs::path> resolve_prefix(const ProjectIndex& index,
                                     const fs::path& anchor_module_dir,
                                     const std::string& key) {
    auto anchor = descriptor_for_module(index, anchor_module_dir);
    if (!anchor) return {};

    SymbolicKey parsed = parse_symbolic_key(key);
    return target_module_dirs(index, anchor_module_dir, *anchor, parsed);
}

std::vector<std::string> resolve_symbolic_key(const ProjectIndex& index,
                                              const fs::path& anchor_module_dir,
                                              const std::string& key,
                                              std::optional<Family> default_family) {
    if (is_url(key)) return {key};

    auto anchor = descriptor_for_module(index, anchor_module_dir);
    if (!anchor) return {key};

    SymbolicKey parsed = parse_symbolic_key(key);
    std::optional<Family> family = default_family;
    if (parsed.family) {
        family = parse_family(*parsed.family);
    } else if (!default_family) {
        return {key};
    }

    std::vector<std::string> result;
    size_t existing = 0;
    std::error_code ec;

    for (const auto& module_dir : target_module_dirs(index, anchor_module_dir, *anchor, parsed)) {
        auto target = find_convention_dir(index.base_dir(), module_dir, *family);
        if (!target) continue;

        std::string candidate = to_slash_path(*target);
        if (!parsed.remainder.empty()) {
            candidate += "/" + parsed.remainder;
        }

        // Existing files go first, each group keeps its order
        if (fs::exists(candidate, ec)) {
            result.insert(result.begin() + static_cast<std::ptrdiff_t>(existing), candidate);
            ++existing;
        } else {
            result.push_back(candidate);
        }
    }

    if (result.empty()) {
        log::debug("unresolved key '%s'", key.c_str());
        result.push_back(key);
    }
    return result;
}

std::vector<std::string> resolve_symbolic_key_at(const ProjectIndex& index,
                                                 const fs::path& location,
                                                 const std::string& key,
                                                 std::optional<Family> default_family) {
    std::error_code ec;
    fs::path start = fs::is_directory(location, ec) ? location : location.parent_path();
    auto module_root = find_module_root(index.base_dir(), start);
    if (!module_root) return {key};
    return resolve_symbolic_key(index, *module_root, key, default_family);
}

} // namespace adocref
