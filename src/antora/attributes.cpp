#include <adocref/antora/attributes.hpp>
#include <adocref/antora/descriptor.hpp>
#include <adocref/antora/layout.hpp>
#include <adocref/project_index.hpp>
#include <adocref/log.hpp>

#include <algorithm>
#include <cctype>

namespace adocref {

namespace fs = std::filesystem;

static bool is_name_start(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool is_name_char(char c) {
    return is_name_start(c) || c == '-';
}

std::optional<AttributeRef> find_attribute_ref(const std::string& text, size_t from) {
    for (size_t open = text.find('{', from); open != std::string::npos;
         open = text.find('{', open + 1)) {
        size_t i = open + 1;
        if (i >= text.size() || !is_name_start(text[i])) continue;
        while (i < text.size() && is_name_char(text[i])) ++i;
        if (i < text.size() && text[i] == '}') {
            return AttributeRef{text.substr(open + 1, i - open - 1), open, i + 1};
        }
    }
    return std::nullopt;
}

static fs::path document_dir(const fs::path& context_file) {
    std::error_code ec;
    if (fs::is_directory(context_file, ec)) return context_file;
    return context_file.parent_path();
}

std::vector<std::pair<std::string, std::string>> antora_attributes(
    const ProjectIndex& index, const fs::path& context_file) {
    std::vector<std::pair<std::string, std::string>> attrs;

    fs::path dir = document_dir(context_file);
    auto module_root = find_module_root(index.base_dir(), dir);
    if (!module_root) return attrs;

    auto descriptor = descriptor_for_module(index, *module_root);
    if (descriptor) {
        attrs = descriptor_attributes(*descriptor, *module_root);
    }

    for (Family f : {Family::Image, Family::Attachment, Family::Partial, Family::Example}) {
        auto rel = find_convention_dir_relative(index.base_dir(), dir, f);
        if (rel) {
            attrs.emplace_back(std::string(family_name(f)) + "sdir", *rel);
        }
    }
    return attrs;
}

std::vector<AttributeDeclaration> find_attributes(const ProjectIndex& index,
                                                  const fs::path& context_file,
                                                  const std::string& name) {
    std::vector<AttributeDeclaration> result;
    std::string key = to_lower(name);
    fs::path dir = document_dir(context_file);

    if (key == SNIPPETS_ATTRIBUTE) {
        auto snippets = find_snippets_dir(index.base_dir(), dir);
        if (snippets) {
            result.push_back(AttributeDeclaration::directory_derived(
                key, to_slash_path(*snippets)));
        }
    }

    for (auto& [k, v] : antora_attributes(index, context_file)) {
        if (k == key) {
            result.push_back(AttributeDeclaration::metadata_derived(k, v));
            break;
        }
    }

    // A specific value shadows whatever documents declare
    if (result.empty()) {
        result = index.attribute_declarations(key);
    }
    return result;
}

std::vector<AttributeDeclaration> collect_attributes(const ProjectIndex& index,
                                                     const fs::path& context_file) {
    std::vector<AttributeDeclaration> result = index.all_attribute_declarations();
    fs::path dir = document_dir(context_file);

    auto snippets = find_snippets_dir(index.base_dir(), dir);
    if (snippets) {
        result.push_back(AttributeDeclaration::directory_derived(
            SNIPPETS_ATTRIBUTE, to_slash_path(*snippets)));
    }

    for (auto& [k, v] : convention_attributes(index.base_dir(), dir)) {
        result.push_back(AttributeDeclaration::directory_derived(k, v));
    }

    auto module_root = find_module_root(index.base_dir(), dir);
    if (module_root) {
        auto descriptor = descriptor_for_module(index, *module_root);
        if (descriptor) {
            for (auto& [k, v] : descriptor_attributes(*descriptor, *module_root)) {
                result.push_back(AttributeDeclaration::metadata_derived(k, v));
            }
        }
    }
    return result;
}

std::optional<std::string> expand_attributes(const ProjectIndex& index,
                                             const fs::path& context_file,
                                             const std::string& text,
                                             int max_substitutions) {
    std::string val = text;
    size_t from = 0;
    int substitutions = 0;

    while (auto ref = find_attribute_ref(val, from)) {
        std::vector<std::optional<std::string>> values;
        for (const auto& decl : find_attributes(index, context_file, ref->name)) {
            if (std::find(values.begin(), values.end(), decl.value()) == values.end()) {
                values.push_back(decl.value());
            }
        }

        if (values.size() > 1) {
            log::debug("attribute '%s' is ambiguous (%zu values)",
                       ref->name.c_str(), values.size());
            return std::nullopt;
        }

        if (values.size() == 1 && values.front()) {
            if (++substitutions > max_substitutions) {
                log::debug("giving up on '%s' after %d substitutions",
                           text.c_str(), max_substitutions);
                return std::nullopt;
            }
            val.replace(ref->begin, ref->end - ref->begin, *values.front());
            // The replacement may complete a reference to its left, so rescan
            from = 0;
            continue;
        }

        // Unknown or unset: keep the braces, look further
        from = ref->end;
    }
    return val;
}

std::vector<BlockId> find_block_ids(const ProjectIndex& index, const std::string& key) {
    if (key.empty()) return {};
    return index.block_ids(key);
}

} // namespace adocref
