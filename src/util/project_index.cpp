#include <adocref/project_index.hpp>
#include <adocref/descriptor_cache.hpp>
#include <adocref/glob.hpp>
#include <adocref/lang/lexer.hpp>
#include <adocref/log.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace adocref {

namespace fs = std::filesystem;

std::string to_lower(const std::string& s) {
    std::string out = s;
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// ---------------------------------------------------------------------------
// Document scanning
// ---------------------------------------------------------------------------

namespace {

bool is_attr_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

struct EntryLine {
    std::string name;
    std::optional<std::string> value;
};

// :name: value | :name!: | :!name:
std::optional<EntryLine> parse_entry_line(const std::string& line) {
    if (line.size() < 3 || line[0] != ':') return std::nullopt;

    size_t i = 1;
    bool unset = false;
    if (line[i] == '!') {
        unset = true;
        ++i;
    }
    size_t name_begin = i;
    if (i >= line.size() || line[i] == '-') return std::nullopt;
    while (i < line.size() && is_attr_name_char(line[i])) ++i;
    if (i == name_begin) return std::nullopt;
    std::string name = line.substr(name_begin, i - name_begin);

    if (i < line.size() && line[i] == '!') {
        if (unset) return std::nullopt;
        unset = true;
        ++i;
    }
    if (i >= line.size() || line[i] != ':') return std::nullopt;
    ++i;

    EntryLine entry;
    entry.name = to_lower(name);
    if (unset) {
        if (!trim(line.substr(i)).empty()) return std::nullopt;
        return entry;
    }
    // The value must be separated from the name
    if (i < line.size() && !std::isspace(static_cast<unsigned char>(line[i]))) {
        return std::nullopt;
    }
    entry.value = trim(line.substr(i));
    return entry;
}

// [[id]], [[id,reftext]] lex to the name "[id"; [#id.role%opt] to "#id.role%opt"
std::optional<std::string> anchor_id(const std::string& attr_name) {
    if (attr_name.size() < 2) return std::nullopt;
    std::string id;
    if (attr_name[0] == '[') {
        id = attr_name.substr(1);
    } else if (attr_name[0] == '#') {
        size_t end = attr_name.find_first_of(".%", 1);
        id = attr_name.substr(1, end == std::string::npos ? std::string::npos : end - 1);
    } else {
        return std::nullopt;
    }
    id = trim(id);
    if (id.empty()) return std::nullopt;
    return id;
}

bool read_file(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// WorkspaceIndex
// ---------------------------------------------------------------------------

WorkspaceIndex::WorkspaceIndex(fs::path base_dir, Config config)
    : base_dir_(fs::absolute(base_dir).lexically_normal()),
      config_(std::move(config)) {
    if (!base_dir_.has_filename() && base_dir_.has_parent_path() &&
        base_dir_ != base_dir_.root_path()) {
        base_dir_ = base_dir_.parent_path();
    }
}

WorkspaceIndex::~WorkspaceIndex() = default;

Result<std::unique_ptr<WorkspaceIndex>> WorkspaceIndex::open(const fs::path& base_dir) {
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) {
        return RefError{RefError::NotFound,
            "project directory does not exist: " + base_dir.string()};
    }

    auto config = Config::discover(base_dir).within("loading configuration for " +
                                                    base_dir.generic_string());
    if (config.is_err()) return std::move(config).error();
    if (config.value().log_level) {
        log::set_level(*config.value().log_level);
    }

    auto index = std::make_unique<WorkspaceIndex>(base_dir, std::move(config).value());

    if (index->config_.cache.enabled) {
        std::string path = index->config_.cache.path;
        if (path.empty()) {
            path = (index->base_dir_ / ".adocref" / "cache.db").string();
        }
        ADOCREF_TRY(index->enable_cache(path).within("opening project " +
                                                     index->base_dir_.generic_string()));
    }

    ADOCREF_TRY(index->scan());
    return Result<std::unique_ptr<WorkspaceIndex>>::ok(std::move(index));
}

Status WorkspaceIndex::enable_cache(const std::string& path) {
    auto cache = std::make_unique<DescriptorCache>();
    ADOCREF_TRY(cache->open(path));

    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_ = std::move(cache);
    log::debug("descriptor cache: %s", path.c_str());
    return ok_status();
}

Status WorkspaceIndex::scan() {
    std::unordered_map<std::string, std::vector<fs::path>> files;
    std::vector<fs::path> documents;

    std::error_code ec;
    fs::recursive_directory_iterator it(base_dir_, ec);
    if (ec) {
        return RefError::io("scan project directory", base_dir_, ec);
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            log::warn("scan of %s stopped early: %s",
                      base_dir_.string().c_str(), ec.message().c_str());
            break;
        }
        const auto& entry = *it;
        std::string name = entry.path().filename().string();

        std::error_code type_ec;
        bool is_dir = entry.is_directory(type_ec);

        if (is_dir && !name.empty() && name[0] == '.') {
            it.disable_recursion_pending();
            continue;
        }

        std::string rel = entry.path().lexically_relative(base_dir_).generic_string();
        if (glob_excluded(config_.index.exclude, rel)) {
            log::trace("excluded: %s", rel.c_str());
            if (is_dir) it.disable_recursion_pending();
            continue;
        }

        if (is_dir || !entry.is_regular_file(type_ec)) continue;

        files[name].push_back(entry.path());
        if (entry.path().extension() == ".adoc") {
            documents.push_back(entry.path());
        }
    }

    for (auto& [_, paths] : files) {
        std::sort(paths.begin(), paths.end());
    }
    std::sort(documents.begin(), documents.end());

    std::unique_lock<std::shared_mutex> lock(mutex_);
    files_by_name_ = std::move(files);
    attributes_.clear();
    block_ids_.clear();
    document_count_ = 0;

    for (const auto& doc : documents) {
        std::string source;
        if (!read_file(doc, source)) {
            log::warn("cannot read %s", doc.string().c_str());
            continue;
        }
        index_document(doc, source);
        ++document_count_;
    }

    log::info("indexed %zu documents under %s",
              document_count_, base_dir_.string().c_str());
    return ok_status();
}

void WorkspaceIndex::index_document(const fs::path& path, const std::string& source) {
    auto lexed = lex(source, path.string());
    if (lexed.unclosed_blocks > 0) {
        log::debug("%s: %d unclosed block(s)", path.string().c_str(),
                   lexed.unclosed_blocks);
    }

    for (const auto& tok : lexed.tokens) {
        if (tok.type == AdocTokenType::Text && tok.pos.col == 1) {
            auto entry = parse_entry_line(tok.text);
            if (entry) {
                attributes_[entry->name].push_back(
                    AttributeDeclaration::indexed(entry->name, entry->value, tok.pos));
            }
        } else if (tok.type == AdocTokenType::BlockAttrName) {
            auto id = anchor_id(tok.text);
            if (id) {
                block_ids_[*id].push_back({*id, tok.pos});
            }
        }
    }
}

const fs::path& WorkspaceIndex::base_dir() const {
    return base_dir_;
}

std::vector<fs::path> WorkspaceIndex::files_named(const std::string& name) const {
    auto it = files_by_name_.find(name);
    if (it == files_by_name_.end()) return {};
    return it->second;
}

std::vector<AttributeDeclaration> WorkspaceIndex::attribute_declarations(
    const std::string& name) const {
    auto it = attributes_.find(to_lower(name));
    if (it == attributes_.end()) return {};
    return it->second;
}

std::vector<AttributeDeclaration> WorkspaceIndex::all_attribute_declarations() const {
    std::vector<std::string> names;
    names.reserve(attributes_.size());
    for (const auto& [name, _] : attributes_) names.push_back(name);
    std::sort(names.begin(), names.end());

    std::vector<AttributeDeclaration> result;
    for (const auto& name : names) {
        const auto& decls = attributes_.at(name);
        result.insert(result.end(), decls.begin(), decls.end());
    }
    return result;
}

std::vector<BlockId> WorkspaceIndex::block_ids(const std::string& id) const {
    auto it = block_ids_.find(id);
    if (it == block_ids_.end()) return {};
    return it->second;
}

ReadLock WorkspaceIndex::read_lock() const {
    return ReadLock(mutex_);
}

DescriptorCache* WorkspaceIndex::descriptor_cache() const {
    return cache_.get();
}

const Config& WorkspaceIndex::config() const {
    return config_;
}

size_t WorkspaceIndex::document_count() const {
    return document_count_;
}

} // namespace adocref
