#pragma once

#include <adocref/result.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace adocref {

class ProjectIndex;
class DescriptorCache;

// Parsed antora.yml. Missing keys are empty strings.
struct ModuleDescriptor {
    std::string component_name;
    std::string component_version;
    std::string title;
    std::filesystem::path root_dir;        // directory containing antora.yml
    std::filesystem::path declaring_file;  // the antora.yml itself

    // asciidoc.attributes entries with scalar values, in document order
    std::vector<std::pair<std::string, std::string>> attributes;

    // Qualifying directories under root_dir/modules, sorted by name
    std::vector<std::filesystem::path> modules;

    std::filesystem::path modules_dir() const { return root_dir / "modules"; }
};

// Addressable prefix of one module ("2.0@comp:mod:")
struct AntoraModule {
    std::string prefix;
    std::string component;
    std::string module;
    std::string title;
    std::filesystem::path module_dir;
};

// Best-effort parse. Text that is not a YAML mapping yields empty fields.
ModuleDescriptor parse_descriptor(const std::string& yaml_text,
                                  const std::filesystem::path& file);

// Read and parse a descriptor file, going through cache when non-null.
// Fills in modules. Fails only when the file cannot be read.
Result<ModuleDescriptor> load_descriptor(const std::filesystem::path& file,
                                         DescriptorCache* cache);

// True if name followed by ':' matches the module prefix pattern [\w.-]*:
bool is_module_name(const std::string& name);

// Number of equal leading characters
size_t path_proximity(const std::string& a, const std::string& b);

// Stable sort, descriptors whose file shares the longest prefix with anchor first
void sort_by_proximity(std::vector<ModuleDescriptor>& descriptors,
                       const std::filesystem::path& anchor);

// The functions below expect the caller to hold index.read_lock().

// Every antora.yml in the project, in index order; unreadable files skipped
std::vector<ModuleDescriptor> find_all_descriptors(const ProjectIndex& index);

// Descriptor owning a module root (module_dir/../../antora.yml)
std::optional<ModuleDescriptor> descriptor_for_module(const ProjectIndex& index,
                                                      const std::filesystem::path& module_dir);

// Prefixes usable from module_dir, closest component first, unique by prefix
std::vector<AntoraModule> collect_prefixes(const ProjectIndex& index,
                                           const std::filesystem::path& module_dir);

// page-component-name, page-component-version, page-component-title,
// page-module and the descriptor's asciidoc attributes
std::vector<std::pair<std::string, std::string>> descriptor_attributes(
    const ModuleDescriptor& descriptor,
    const std::filesystem::path& module_dir);

} // namespace adocref
