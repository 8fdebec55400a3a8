#pragma once

#include <adocref/config.hpp>
#include <adocref/declaration.hpp>
#include <adocref/result.hpp>

#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace adocref {

class DescriptorCache;

using ReadLock = std::shared_lock<std::shared_mutex>;

// Read-only view of a documentation project, as provided by the host.
// Results are already restricted to in-project files (no excluded scopes).
class ProjectIndex {
public:
    virtual ~ProjectIndex() = default;

    virtual const std::filesystem::path& base_dir() const = 0;

    // All files with exactly this file name, sorted by path
    virtual std::vector<std::filesystem::path> files_named(const std::string& name) const = 0;

    // Declarations of one attribute; name is matched lower-cased
    virtual std::vector<AttributeDeclaration> attribute_declarations(const std::string& name) const = 0;
    virtual std::vector<AttributeDeclaration> all_attribute_declarations() const = 0;

    virtual std::vector<BlockId> block_ids(const std::string& id) const = 0;

    // Held for the whole duration of a resolver call
    virtual ReadLock read_lock() const = 0;

    virtual DescriptorCache* descriptor_cache() const { return nullptr; }
};

// ProjectIndex over the local filesystem. scan() walks base_dir, skipping
// hidden directories and configured exclusions, and indexes every .adoc file.
class WorkspaceIndex : public ProjectIndex {
public:
    WorkspaceIndex(std::filesystem::path base_dir, Config config);
    ~WorkspaceIndex() override;

    // Load configuration from base_dir, open the descriptor cache if enabled,
    // and scan.
    static Result<std::unique_ptr<WorkspaceIndex>> open(const std::filesystem::path& base_dir);

    // Rebuild the index (takes the exclusive lock)
    Status scan();

    // Open (or replace) the descriptor cache at path; ":memory:" allowed
    Status enable_cache(const std::string& path);

    const std::filesystem::path& base_dir() const override;
    std::vector<std::filesystem::path> files_named(const std::string& name) const override;
    std::vector<AttributeDeclaration> attribute_declarations(const std::string& name) const override;
    std::vector<AttributeDeclaration> all_attribute_declarations() const override;
    std::vector<BlockId> block_ids(const std::string& id) const override;
    ReadLock read_lock() const override;
    DescriptorCache* descriptor_cache() const override;

    const Config& config() const;
    size_t document_count() const;

private:
    std::filesystem::path base_dir_;
    Config config_;
    std::unique_ptr<DescriptorCache> cache_;

    std::unordered_map<std::string, std::vector<std::filesystem::path>> files_by_name_;
    std::unordered_map<std::string, std::vector<AttributeDeclaration>> attributes_;
    std::unordered_map<std::string, std::vector<BlockId>> block_ids_;
    size_t document_count_ = 0;

    mutable std::shared_mutex mutex_;

    void index_document(const std::filesystem::path& path, const std::string& source);
};

// Lower-case ASCII copy
std::string to_lower(const std::string& s);

} // namespace adocref
