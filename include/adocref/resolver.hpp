#pragma once

#include <adocref/antora/attributes.hpp>
#include <adocref/antora/descriptor.hpp>
#include <adocref/antora/layout.hpp>
#include <adocref/antora/xref.hpp>
#include <adocref/project_index.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace adocref {

struct ResolveOptions {
    int max_substitutions = 64;   // Bound on {name} replacements per expansion

    static ResolveOptions from_config(const Config& config);
};

// Entry point for reference resolution against a project index. Every call
// runs inside one read transaction on the index.
class ReferenceResolver {
public:
    explicit ReferenceResolver(const ProjectIndex& index, ResolveOptions options = {});

    // Candidate paths for an Antora key, existing files first; {key} when
    // nothing applies. location is any file or directory inside a module.
    std::vector<std::string> resolve_key(const std::filesystem::path& location,
                                         const std::string& key,
                                         std::optional<Family> default_family = std::nullopt) const;

    // Same, anchored at a known module root
    std::vector<std::string> resolve_key_in_module(const std::filesystem::path& module_dir,
                                                   const std::string& key,
                                                   std::optional<Family> default_family = std::nullopt) const;

    // Module directories addressed by the prefix of key
    std::vector<std::filesystem::path> resolve_prefix(const std::filesystem::path& module_dir,
                                                      const std::string& key) const;

    std::vector<AntoraModule> collect_prefixes(const std::filesystem::path& module_dir) const;
    std::vector<ModuleDescriptor> descriptors() const;

    std::optional<std::filesystem::path> module_root(const std::filesystem::path& location) const;

    std::optional<std::string> expand_attributes(const std::filesystem::path& context_file,
                                                 const std::string& text) const;
    std::vector<AttributeDeclaration> find_attributes(const std::filesystem::path& context_file,
                                                      const std::string& name) const;
    std::vector<AttributeDeclaration> collect_attributes(const std::filesystem::path& context_file) const;

    std::vector<BlockId> find_block_ids(const std::string& key) const;

    const ResolveOptions& options() const { return options_; }

private:
    const ProjectIndex& index_;
    ResolveOptions options_;
};

} // namespace adocref
