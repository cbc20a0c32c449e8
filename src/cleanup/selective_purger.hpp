#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "cleanup/purge_result.hpp"

namespace cachesweep::cleanup {

// Deletes an allow-list of subpaths under a root. One item failing never
// stops the rest of the batch.
class SelectivePurger {
public:
    // Same shape as std::filesystem::remove_all(path, ec).
    using RemoveFn = std::function<std::uintmax_t(const std::filesystem::path&, std::error_code&)>;

    explicit SelectivePurger(std::string phase = "cache", RemoveFn remover = {});

    PurgeBatchResult Purge(const std::filesystem::path& root, const std::vector<std::string>& relative_paths) const;

    // True for a non-empty relative path with no ".." component.
    static bool StaysInsideRoot(const std::string& relative_path);

private:
    PurgeItemResult PurgeOne(const std::filesystem::path& root, const std::string& relative_path) const;

    std::string phase_;
    RemoveFn remover_;
};

} // namespace cachesweep::cleanup
