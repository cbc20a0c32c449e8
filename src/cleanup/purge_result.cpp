#include "purge_result.hpp"
#include <utility>

namespace cachesweep::cleanup {

void PurgeBatchResult::Record(PurgeItemResult item) {
    switch (item.status) {
        case ItemStatus::REMOVED:
            ++items_attempted;
            ++items_succeeded;
            bytes_freed += item.bytes;
            break;
        case ItemStatus::FAILED:
        case ItemStatus::REJECTED:
            ++items_attempted;
            bytes_freed += item.bytes; // partial temp deletions still free space
            break;
        case ItemStatus::SKIPPED_ABSENT:
            break;
    }
    items.push_back(std::move(item));
}

std::string ItemStatusToString(ItemStatus status) {
    switch (status) {
        case ItemStatus::REMOVED: return "REMOVED";
        case ItemStatus::FAILED: return "FAILED";
        case ItemStatus::SKIPPED_ABSENT: return "SKIPPED_ABSENT";
        case ItemStatus::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

} // namespace cachesweep::cleanup
