#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

namespace cachesweep::cleanup {

struct UsageSnapshot {
    std::filesystem::path root;
    uint64_t total_bytes = 0;
    // Keyed by the root's immediate child directories. Files directly under
    // the root only count toward total_bytes.
    std::map<std::string, uint64_t> per_folder_bytes;
};

class PathNotFoundError : public std::runtime_error {
public:
    explicit PathNotFoundError(const std::filesystem::path& path)
        : std::runtime_error("Path not found: " + path.string()), path_(path) {}

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

struct ScanOptions {
    bool parallel = true;
    unsigned max_workers = 0; // 0 = hardware_concurrency
};

class UsageScanner {
public:
    explicit UsageScanner(ScanOptions options = {});

    // Throws PathNotFoundError if root is missing or not a directory.
    // Unreadable entries are skipped and count as zero bytes. Symlinks are
    // never followed.
    UsageSnapshot Scan(const std::filesystem::path& root) const;

    // Bytes held by a single file or directory tree; 0 if it is absent,
    // a symlink, or unreadable.
    static uint64_t MeasurePath(const std::filesystem::path& path);

private:
    ScanOptions options_;
};

} // namespace cachesweep::cleanup
