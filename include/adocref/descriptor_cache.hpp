#pragma once

#include <adocref/result.hpp>
#include <adocref/antora/descriptor.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace adocref {

// Identity of a file's content as seen by stat(2)
struct FileStamp {
    uint64_t inode = 0;
    int64_t mtime_sec = 0;
    int64_t mtime_nsec = 0;
    int64_t size = 0;

    static Result<FileStamp> of(const std::filesystem::path& path);

    bool operator==(const FileStamp& o) const;
    bool operator!=(const FileStamp& o) const { return !(*this == o); }
};

// SQLite-backed cache of parsed descriptors, keyed by path and content stamp.
// Only the parsed content is cached; module directories are always listed
// fresh.
class DescriptorCache {
public:
    DescriptorCache();
    ~DescriptorCache();
    DescriptorCache(DescriptorCache&&) noexcept;
    DescriptorCache& operator=(DescriptorCache&&) noexcept;

    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // NotFound when there is no entry or the stamp differs
    Result<ModuleDescriptor> lookup(const std::filesystem::path& file,
                                    const FileStamp& stamp);
    Status store(const ModuleDescriptor& descriptor, const FileStamp& stamp);
    Status remove(const std::filesystem::path& file);

    Status clear();
    Result<int64_t> count();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace adocref
