#pragma once

#include <adocref/result.hpp>
#include <adocref/log.hpp>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace adocref {

// File name of the per-project configuration, looked up in the project root
inline constexpr const char* CONFIG_FILE_NAME = "adocref.toml";

struct IndexConfig {
    // Glob patterns (relative to the project root) excluded from indexing
    std::vector<std::string> exclude;
};

struct ResolveConfig {
    // Upper bound on attribute substitutions in one expansion
    int max_substitutions = 64;
};

struct CacheConfig {
    bool enabled = false;
    std::string path;  // relative paths are resolved against the project root
};

// Layered configuration: global < project
struct Config {
    IndexConfig index;
    ResolveConfig resolve;
    CacheConfig cache;
    std::optional<log::Level> log_level;

    // Track which scalar fields were explicitly set (for merge)
    bool max_substitutions_set = false;
    bool cache_enabled_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Global config (if any) overlaid with <project_root>/adocref.toml (if any)
    static Result<Config> discover(const std::filesystem::path& project_root);
};

// Discover the global config file path: ~/.adocref/config.toml
std::string global_config_path();

} // namespace adocref
