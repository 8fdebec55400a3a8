#include <adocref/antora/descriptor.hpp>
#include <adocref/antora/layout.hpp>
#include <adocref/descriptor_cache.hpp>
#include <adocref/project_index.hpp>
#include <adocref/log.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace adocref {

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static std::string scalar_or_empty(const YAML::Node& node) {
    if (node && node.IsScalar()) return node.Scalar();
    return "";
}

ModuleDescriptor parse_descriptor(const std::string& yaml_text, const fs::path& file) {
    ModuleDescriptor d;
    d.declaring_file = file;
    d.root_dir = file.parent_path();

    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        log::debug("ignoring malformed descriptor %s: %s",
                   file.string().c_str(), e.what());
        return d;
    }
    if (!root.IsMap()) {
        log::debug("descriptor %s is not a mapping", file.string().c_str());
        return d;
    }

    const YAML::Node& doc = root;
    d.component_name = scalar_or_empty(doc["name"]);
    d.component_version = scalar_or_empty(doc["version"]);
    d.title = scalar_or_empty(doc["title"]);

    const YAML::Node asciidoc = doc["asciidoc"];
    if (asciidoc && asciidoc.IsMap()) {
        const YAML::Node attributes = asciidoc["attributes"];
        if (attributes && attributes.IsMap()) {
            for (const auto& kv : attributes) {
                // false and ~ unset an attribute in Antora; nothing to offer
                if (!kv.first.IsScalar() || !kv.second.IsScalar()) continue;
                if (kv.second.Scalar() == "false") continue;
                d.attributes.emplace_back(kv.first.Scalar(), kv.second.Scalar());
            }
        }
    }

    return d;
}

bool is_module_name(const std::string& name) {
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '.' && c != '-') {
            return false;
        }
    }
    return true;
}

static std::vector<fs::path> list_modules(const fs::path& modules_dir) {
    std::vector<fs::path> modules;
    std::error_code ec;
    if (!fs::is_directory(modules_dir, ec)) return modules;

    for (auto& entry : fs::directory_iterator(modules_dir, ec)) {
        if (!entry.is_directory(ec) || ec) continue;
        if (!is_module_name(entry.path().filename().string())) continue;
        modules.push_back(entry.path());
    }
    std::sort(modules.begin(), modules.end());
    return modules;
}

static Result<ModuleDescriptor> read_and_parse(const fs::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return RefError::io("open descriptor", file);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return Result<ModuleDescriptor>::ok(parse_descriptor(ss.str(), file));
}

Result<ModuleDescriptor> load_descriptor(const fs::path& file, DescriptorCache* cache) {
    std::optional<FileStamp> stamp;
    if (cache && cache->is_open()) {
        auto s = FileStamp::of(file);
        if (s.is_ok()) stamp = s.value();
    }

    std::optional<ModuleDescriptor> descriptor;
    if (stamp) {
        auto cached = cache->lookup(file, *stamp);
        if (cached.is_ok()) {
            log::trace("descriptor cache hit: %s", file.string().c_str());
            descriptor = std::move(cached).value();
        }
    }

    if (!descriptor) {
        auto parsed = read_and_parse(file);
        if (parsed.is_err()) return std::move(parsed).error();
        descriptor = std::move(parsed).value();
        if (stamp) {
            auto stored = cache->store(*descriptor, *stamp);
            if (stored.is_err()) {
                log::debug("%s", stored.error().format().c_str());
            }
        }
    }

    descriptor->modules = list_modules(descriptor->modules_dir());
    return Result<ModuleDescriptor>::ok(std::move(*descriptor));
}

// ---------------------------------------------------------------------------
// Proximity
// ---------------------------------------------------------------------------

size_t path_proximity(const std::string& a, const std::string& b) {
    size_t i = 0;
    while (i < a.size() && i < b.size() && a[i] == b[i]) ++i;
    return i;
}

void sort_by_proximity(std::vector<ModuleDescriptor>& descriptors,
                       const fs::path& anchor) {
    std::string origin = to_slash_path(anchor);
    std::stable_sort(descriptors.begin(), descriptors.end(),
        [&](const ModuleDescriptor& a, const ModuleDescriptor& b) {
            return path_proximity(to_slash_path(a.declaring_file), origin) >
                   path_proximity(to_slash_path(b.declaring_file), origin);
        });
}

// ---------------------------------------------------------------------------
// Index queries
// ---------------------------------------------------------------------------

std::vector<ModuleDescriptor> find_all_descriptors(const ProjectIndex& index) {
    std::vector<ModuleDescriptor> result;
    for (const auto& file : index.files_named(ANTORA_YML)) {
        auto d = load_descriptor(file, index.descriptor_cache());
        if (d.is_err()) {
            log::warn("%s", d.error().format().c_str());
            continue;
        }
        result.push_back(std::move(d).value());
    }
    return result;
}

std::optional<ModuleDescriptor> descriptor_for_module(const ProjectIndex& index,
                                                      const fs::path& module_dir) {
    fs::path file = module_dir.lexically_normal();
    if (!file.has_filename()) file = file.parent_path();
    file = file.parent_path().parent_path() / ANTORA_YML;

    std::error_code ec;
    if (!fs::exists(file, ec)) return std::nullopt;

    auto d = load_descriptor(file, index.descriptor_cache());
    if (d.is_err()) {
        log::debug("%s", d.error().format().c_str());
        return std::nullopt;
    }
    return std::move(d).value();
}

std::vector<AntoraModule> collect_prefixes(const ProjectIndex& index,
                                           const fs::path& module_dir) {
    std::vector<AntoraModule> result;

    auto anchor = descriptor_for_module(index, module_dir);
    if (!anchor) return result;

    auto descriptors = find_all_descriptors(index);
    sort_by_proximity(descriptors, module_dir);

    // First title seen per component, for modules of untitled descriptors
    std::unordered_map<std::string, std::string> component_titles;

    for (const auto& d : descriptors) {
        if (!d.title.empty() && !component_titles.count(d.component_name)) {
            component_titles[d.component_name] = d.title;
        }

        std::string version_prefix;
        if (d.component_version != anchor->component_version) {
            version_prefix = d.component_version + "@";
        }

        for (const auto& module : d.modules) {
            std::string name = module.filename().string();
            if (d.component_name == anchor->component_name) {
                result.push_back({version_prefix + name + ":",
                                  d.component_name, name, d.title, module});
            }
            if (name == "ROOT") {
                result.push_back({version_prefix + d.component_name + "::",
                                  d.component_name, name, d.title, module});
            }
            result.push_back({version_prefix + d.component_name + ":" + name + ":",
                              d.component_name, name, d.title, module});
        }
    }

    std::unordered_set<std::string> seen;
    std::vector<AntoraModule> unique;
    unique.reserve(result.size());
    for (auto& m : result) {
        if (!seen.insert(m.prefix).second) continue;
        if (m.title.empty()) {
            auto it = component_titles.find(m.component);
            if (it != component_titles.end()) m.title = it->second;
        }
        unique.push_back(std::move(m));
    }
    return unique;
}

std::vector<std::pair<std::string, std::string>> descriptor_attributes(
    const ModuleDescriptor& descriptor, const fs::path& module_dir) {
    std::vector<std::pair<std::string, std::string>> attrs;
    if (!descriptor.component_name.empty()) {
        attrs.emplace_back("page-component-name", descriptor.component_name);
    }
    if (!descriptor.component_version.empty()) {
        attrs.emplace_back("page-component-version", descriptor.component_version);
    }
    if (!descriptor.title.empty()) {
        attrs.emplace_back("page-component-title", descriptor.title);
    }
    fs::path module = module_dir.lexically_normal();
    if (!module.has_filename()) module = module.parent_path();
    attrs.emplace_back("page-module", module.filename().string());

    for (const auto& [k, v] : descriptor.attributes) {
        attrs.emplace_back(to_lower(k), v);
    }
    return attrs;
}

} // namespace adocref
