#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace adocref {

// Component descriptor file name
inline constexpr const char* ANTORA_YML = "antora.yml";

// Kind of resource a symbolic key addresses
enum class Family { Example, Attachment, Partial, Image, Page };

// "example", "attachment", "partial", "image", "page"
const char* family_name(Family f);
std::optional<Family> parse_family(const std::string& name);
const std::vector<Family>& all_families();

// Forward-slash rendering of a path, as used in resolved keys and attribute values
std::string to_slash_path(const std::filesystem::path& p);

// dir/.. is named "modules" and dir/../.. contains antora.yml
bool is_module_root(const std::filesystem::path& dir);

// The following walk upward from start_dir, testing each directory and
// stopping after project_root has been tested. None of them walk above
// project_root; the closest enclosing module root wins.

std::optional<std::filesystem::path> find_module_root(
    const std::filesystem::path& project_root,
    const std::filesystem::path& start_dir);

// Conventional directory of a family inside the closest module root:
//   images, attachments: <module>/assets/<family>s, then <module>/<family>s
//   examples, pages:     <module>/<family>s
//   partials:            <module>/partials, then <module>/pages/_partials
std::optional<std::filesystem::path> find_convention_dir(
    const std::filesystem::path& project_root,
    const std::filesystem::path& start_dir,
    Family family);

// Same lookup, expressed relative to start_dir ("../../assets/images")
std::optional<std::string> find_convention_dir_relative(
    const std::filesystem::path& project_root,
    const std::filesystem::path& start_dir,
    Family family);

// Build-output snippets: <dir>/target/generated-snippets next to a pom.xml,
// <dir>/build/generated-snippets next to build.gradle or build.gradle.kts
std::optional<std::filesystem::path> find_snippets_dir(
    const std::filesystem::path& project_root,
    const std::filesystem::path& start_dir);

// partialsdir, imagesdir, attachmentsdir, examplesdir: absolute convention
// directories for start_dir, each present only when found
std::vector<std::pair<std::string, std::string>> convention_attributes(
    const std::filesystem::path& project_root,
    const std::filesystem::path& start_dir);

} // namespace adocref
