#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>
#include "cleanup/purge_result.hpp"

namespace cachesweep::cleanup {

// Second purge phase: empties generic temp directories. Each immediate child
// of a temp root is one item; its files are unlinked first, then the emptied
// directories are removed deepest first. The roots themselves are kept.
class TempPurger {
public:
    // Same shape as std::filesystem::remove(path, ec).
    using RemoveFn = std::function<bool(const std::filesystem::path&, std::error_code&)>;

    explicit TempPurger(std::vector<std::string> name_prefixes = {}, RemoveFn remover = {});

    PurgeBatchResult Purge(const std::vector<std::filesystem::path>& roots) const;

    bool Selects(const std::string& entry_name) const;

private:
    PurgeItemResult PurgeEntry(const std::filesystem::path& entry) const;

    std::vector<std::string> name_prefixes_;
    RemoveFn remover_;
};

} // namespace cachesweep::cleanup
