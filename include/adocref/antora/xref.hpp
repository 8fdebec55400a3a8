#pragma once

#include <adocref/antora/descriptor.hpp>
#include <adocref/antora/layout.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace adocref {

class ProjectIndex;

// version@component:module:family$remainder, every prefix optional
struct SymbolicKey {
    std::optional<std::string> version;
    std::optional<std::string> component;
    std::optional<std::string> module;
    std::optional<std::string> family;
    std::string remainder;
};

// Consumes, left to right: version@, then component:module: or module:,
// then family$ (one of the five families). Never fails.
SymbolicKey parse_symbolic_key(const std::string& key);

// http://, https://, file://, ftp:// or irc://
bool is_url(const std::string& key);

// The functions below expect the caller to hold index.read_lock().

// Module directories a key's version/component/module prefix designates,
// relative to the anchor module; closest descriptor first. Missing parts are
// inherited from the anchor, an empty module name means ROOT.
std::vector<std::filesystem::path> target_module_dirs(
    const ProjectIndex& index,
    const std::filesystem::path& anchor_module_dir,
    const ModuleDescriptor& anchor,
    const SymbolicKey& key);

// Module directories for the prefix of key; empty if the anchor has no
// readable descriptor
std::vector<std::filesystem::path> resolve_prefix(
    const ProjectIndex& index,
    const std::filesystem::path& anchor_module_dir,
    const std::string& key);

// Candidate paths for key, existing files first. Returns {key} for URLs,
// for keys without family when default_family is unset, and when nothing
// matches.
std::vector<std::string> resolve_symbolic_key(
    const ProjectIndex& index,
    const std::filesystem::path& anchor_module_dir,
    const std::string& key,
    std::optional<Family> default_family);

// Same, anchored at the module root enclosing location (a file or directory);
// {key} when location is not inside a module
std::vector<std::string> resolve_symbolic_key_at(
    const ProjectIndex& index,
    const std::filesystem::path& location,
    const std::string& key,
    std::optional<Family> default_family);

} // namespace adocref
