#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cachesweep::cleanup {

enum class ItemStatus {
    REMOVED,
    FAILED,
    SKIPPED_ABSENT,
    REJECTED
};

struct PurgeItemResult {
    std::string relative_path;
    std::filesystem::path absolute_path;
    ItemStatus status = ItemStatus::SKIPPED_ABSENT;
    uint64_t bytes = 0;
    std::string reason;
};

struct PurgeBatchResult {
    size_t items_attempted = 0;
    size_t items_succeeded = 0;
    uint64_t bytes_freed = 0;
    std::vector<PurgeItemResult> items;

    size_t items_failed() const { return items_attempted - items_succeeded; }

    // Folds one item into the counters. Absent items are listed but not attempted.
    void Record(PurgeItemResult item);
};

std::string ItemStatusToString(ItemStatus status);

} // namespace cachesweep::cleanup
