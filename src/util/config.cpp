#include <adocref/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace adocref {

namespace fs = std::filesystem;

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return RefError{RefError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()),
            "", "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [index]
    if (auto index = doc["index"].as_table()) {
        if (auto exclude = (*index)["exclude"].as_array()) {
            for (const auto& el : *exclude) {
                if (auto s = el.value<std::string>()) {
                    cfg.index.exclude.push_back(*s);
                } else {
                    return RefError{RefError::Config,
                        "index.exclude entries must be strings"};
                }
            }
        }
    }

    // [resolve]
    if (auto resolve = doc["resolve"].as_table()) {
        if (auto v = (*resolve)["max-substitutions"].value<int64_t>()) {
            if (*v <= 0) {
                return RefError{RefError::Config,
                    "resolve.max-substitutions must be positive",
                    "the default is 64"};
            }
            cfg.resolve.max_substitutions = static_cast<int>(*v);
            cfg.max_substitutions_set = true;
        }
    }

    // [cache]
    if (auto cache = doc["cache"].as_table()) {
        if (auto v = (*cache)["enabled"].value<bool>()) {
            cfg.cache.enabled = *v;
            cfg.cache_enabled_set = true;
        }
        if (auto v = (*cache)["path"].value<std::string>()) {
            cfg.cache.path = *v;
        }
    }

    // [log]
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (lvl.is_err()) return std::move(lvl).error();
            cfg.log_level = lvl.value();
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return RefError::io("open config file", path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err()) {
        auto err = std::move(cfg).error();
        return err.at(path, err.line);
    }
    return cfg;
}

void Config::merge(const Config& other) {
    // Exclusions accumulate across layers
    for (const auto& pattern : other.index.exclude) {
        index.exclude.push_back(pattern);
    }

    if (other.max_substitutions_set) {
        resolve.max_substitutions = other.resolve.max_substitutions;
        max_substitutions_set = true;
    }

    if (other.cache_enabled_set) {
        cache.enabled = other.cache.enabled;
        cache_enabled_set = true;
    }
    if (!other.cache.path.empty()) {
        cache.path = other.cache.path;
    }

    if (other.log_level.has_value()) {
        log_level = other.log_level;
    }
}

Result<Config> Config::discover(const fs::path& project_root) {
    Config result;
    std::error_code ec;

    std::string global = global_config_path();
    if (!global.empty() && fs::exists(global, ec)) {
        auto cfg = Config::load(global);
        if (cfg.is_err()) return std::move(cfg).error();
        result.merge(cfg.value());
    }

    fs::path local = project_root / CONFIG_FILE_NAME;
    if (fs::exists(local, ec)) {
        auto cfg = Config::load(local.string());
        if (cfg.is_err()) return std::move(cfg).error();
        result.merge(cfg.value());
    }

    if (!result.cache.path.empty() && fs::path(result.cache.path).is_relative() &&
        result.cache.path != ":memory:") {
        result.cache.path = (project_root / result.cache.path).string();
    }

    return Result<Config>::ok(std::move(result));
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.adocref/config.toml";
}

} // namespace adocref
