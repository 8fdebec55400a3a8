#pragma once

#include <adocref/declaration.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace adocref {

class ProjectIndex;

// Reserved attribute naming the build-output snippets directory
inline constexpr const char* SNIPPETS_ATTRIBUTE = "snippets";

// A {name} occurrence in text
struct AttributeRef {
    std::string name;
    size_t begin = 0;  // offset of '{'
    size_t end = 0;    // offset past '}'
};

// First {name} at or after from, name matching [a-zA-Z0-9_][a-zA-Z0-9_-]*
std::optional<AttributeRef> find_attribute_ref(const std::string& text, size_t from = 0);

// The functions below expect the caller to hold index.read_lock().
// context_file is the document the text belongs to.

// Attributes a document in an Antora module sees implicitly: descriptor
// attributes plus imagesdir / attachmentsdir / partialsdir / examplesdir
// relative to the document's directory
std::vector<std::pair<std::string, std::string>> antora_attributes(
    const ProjectIndex& index,
    const std::filesystem::path& context_file);

// Declarations of one attribute, in priority order: snippets directory,
// then Antora attributes of the enclosing module; if either applies, index
// declarations are not consulted.
std::vector<AttributeDeclaration> find_attributes(const ProjectIndex& index,
                                                  const std::filesystem::path& context_file,
                                                  const std::string& name);

// Everything visible from context_file, for completion
std::vector<AttributeDeclaration> collect_attributes(const ProjectIndex& index,
                                                     const std::filesystem::path& context_file);

// Replace {name} references until none can be resolved. nullopt when a name
// has several distinct values, or after max_substitutions replacements
// (cyclic definitions). Unknown names are left in place.
std::optional<std::string> expand_attributes(const ProjectIndex& index,
                                             const std::filesystem::path& context_file,
                                             const std::string& text,
                                             int max_substitutions = 64);

// Declarations of a block id, empty for an empty key
std::vector<BlockId> find_block_ids(const ProjectIndex& index, const std::string& key);

} // namespace adocref
