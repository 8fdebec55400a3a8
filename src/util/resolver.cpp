#include <adocref/resolver.hpp>
#include <adocref/log.hpp>

namespace adocref {

namespace fs = std::filesystem;

ResolveOptions ResolveOptions::from_config(const Config& config) {
    ResolveOptions opts;
    opts.max_substitutions = config.resolve.max_substitutions;
    return opts;
}

ReferenceResolver::ReferenceResolver(const ProjectIndex& index, ResolveOptions options)
    : index_(index), options_(options) {}

std::vector<std::string> ReferenceResolver::resolve_key(const fs::path& location,
                                                        const std::string& key,
                                                        std::optional<Family> default_family) const {
    auto lock = index_.read_lock();
    return resolve_symbolic_key_at(index_, location, key, default_family);
}

std::vector<std::string> ReferenceResolver::resolve_key_in_module(
    const fs::path& module_dir,
    const std::string& key,
    std::optional<Family> default_family) const {
    auto lock = index_.read_lock();
    return resolve_symbolic_key(index_, module_dir, key, default_family);
}

std::vector<fs::path> ReferenceResolver::resolve_prefix(const fs::path& module_dir,
                                                        const std::string& key) const {
    auto lock = index_.read_lock();
    return adocref::resolve_prefix(index_, module_dir, key);
}

std::vector<AntoraModule> ReferenceResolver::collect_prefixes(const fs::path& module_dir) const {
    auto lock = index_.read_lock();
    return adocref::collect_prefixes(index_, module_dir);
}

std::vector<ModuleDescriptor> ReferenceResolver::descriptors() const {
    auto lock = index_.read_lock();
    return find_all_descriptors(index_);
}

std::optional<fs::path> ReferenceResolver::module_root(const fs::path& location) const {
    std::error_code ec;
    fs::path dir = fs::is_directory(location, ec) ? location : location.parent_path();
    auto lock = index_.read_lock();
    return find_module_root(index_.base_dir(), dir);
}

std::optional<std::string> ReferenceResolver::expand_attributes(const fs::path& context_file,
                                                                const std::string& text) const {
    auto lock = index_.read_lock();
    auto expanded = adocref::expand_attributes(index_, context_file, text,
                                               options_.max_substitutions);
    if (!expanded) {
        log::debug("no unambiguous expansion for '%s'", text.c_str());
    }
    return expanded;
}

std::vector<AttributeDeclaration> ReferenceResolver::find_attributes(const fs::path& context_file,
                                                                     const std::string& name) const {
    auto lock = index_.read_lock();
    return adocref::find_attributes(index_, context_file, name);
}

std::vector<AttributeDeclaration> ReferenceResolver::collect_attributes(
    const fs::path& context_file) const {
    auto lock = index_.read_lock();
    return adocref::collect_attributes(index_, context_file);
}

std::vector<BlockId> ReferenceResolver::find_block_ids(const std::string& key) const {
    auto lock = index_.read_lock();
    return adocref::find_block_ids(index_, key);
}

} // namespace adocref
