#include "usage_scanner.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>
#include <thread>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace cachesweep::cleanup {

namespace {

// Walks a directory tree with an explicit stack so that one unreadable
// directory only hides its own subtree instead of ending the walk.
uint64_t SumTree(const fs::path& dir) {
    uint64_t total = 0;
    std::vector<fs::path> pending{dir};

    while (!pending.empty()) {
        fs::path current = std::move(pending.back());
        pending.pop_back();

        std::error_code ec;
        fs::directory_iterator it(current, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::debug("Skipping unreadable directory {}: {}", current.string(), ec.message());
            continue;
        }

        const fs::directory_iterator end{};
        while (it != end) {
            const auto& entry = *it;
            std::error_code st_ec;
            auto status = entry.symlink_status(st_ec);
            if (!st_ec) {
                if (fs::is_directory(status)) {
                    pending.push_back(entry.path());
                } else if (fs::is_regular_file(status)) {
                    std::error_code sz_ec;
                    auto size = entry.file_size(sz_ec);
                    if (!sz_ec) total += size;
                }
            }

            it.increment(ec);
            if (ec) {
                spdlog::debug("Directory listing interrupted in {}: {}", current.string(), ec.message());
                break;
            }
        }
    }
    return total;
}

} // namespace

UsageScanner::UsageScanner(ScanOptions options) : options_(options) {}

uint64_t UsageScanner::MeasurePath(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec) return 0;
    if (fs::is_regular_file(status)) {
        auto size = fs::file_size(path, ec);
        return ec ? 0 : size;
    }
    if (fs::is_directory(status)) return SumTree(path);
    return 0;
}

UsageSnapshot UsageScanner::Scan(const fs::path& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw PathNotFoundError(root);
    }

    UsageSnapshot snapshot;
    snapshot.root = root;

    std::vector<std::pair<std::string, fs::path>> folders;
    fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("Cannot list {}: {}", root.string(), ec.message());
        return snapshot;
    }

    const fs::directory_iterator end{};
    while (it != end) {
        const auto& entry = *it;
        std::error_code st_ec;
        auto status = entry.symlink_status(st_ec);
        if (!st_ec) {
            if (fs::is_directory(status)) {
                folders.emplace_back(entry.path().filename().string(), entry.path());
            } else if (fs::is_regular_file(status)) {
                std::error_code sz_ec;
                auto size = entry.file_size(sz_ec);
                if (!sz_ec) snapshot.total_bytes += size;
            }
        }
        it.increment(ec);
        if (ec) break;
    }

    if (!options_.parallel || folders.size() < 2) {
        for (const auto& [name, path] : folders) {
            uint64_t bytes = SumTree(path);
            snapshot.per_folder_bytes[name] = bytes;
            snapshot.total_bytes += bytes;
        }
        return snapshot;
    }

    unsigned workers = options_.max_workers ? options_.max_workers : std::thread::hardware_concurrency();
    workers = std::max(2u, workers);

    // Fixed-size batches keep the number of live threads bounded
    for (size_t start = 0; start < folders.size(); start += workers) {
        size_t stop = std::min(folders.size(), start + workers);
        std::vector<std::future<uint64_t>> futures;
        futures.reserve(stop - start);
        for (size_t i = start; i < stop; ++i) {
            futures.push_back(std::async(std::launch::async, SumTree, folders[i].second));
        }
        for (size_t i = start; i < stop; ++i) {
            uint64_t bytes = futures[i - start].get();
            snapshot.per_folder_bytes[folders[i].first] = bytes;
            snapshot.total_bytes += bytes;
        }
    }
    return snapshot;
}

} // namespace cachesweep::cleanup
