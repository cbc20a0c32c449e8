#include "selective_purger.hpp"
#include "cleanup/usage_scanner.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace fs = std::filesystem;

namespace cachesweep::cleanup {

namespace {

bool ParentResolvesInside(const fs::path& root, const fs::path& target) {
    std::error_code ec;
    fs::path real_root = fs::canonical(root, ec);
    if (ec) return false;
    fs::path real_parent = fs::canonical(target.parent_path(), ec);
    if (ec) return false;

    auto rel = real_parent.lexically_relative(real_root);
    return !rel.empty() && *rel.begin() != "..";
}

} // namespace

SelectivePurger::SelectivePurger(std::string phase, RemoveFn remover)
    : phase_(std::move(phase)), remover_(std::move(remover)) {
    if (!remover_) {
        remover_ = [](const fs::path& p, std::error_code& ec) { return fs::remove_all(p, ec); };
    }
}

bool SelectivePurger::StaysInsideRoot(const std::string& relative_path) {
    if (relative_path.empty()) return false;
    fs::path rel(relative_path);
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) return false;
    for (const auto& part : rel) {
        if (part == "..") return false;
    }
    // "." or "./" would resolve to the root itself
    return rel.lexically_normal() != fs::path(".");
}

PurgeItemResult SelectivePurger::PurgeOne(const fs::path& root, const std::string& relative_path) const {
    PurgeItemResult item;
    item.relative_path = relative_path;

    if (!StaysInsideRoot(relative_path)) {
        item.absolute_path = root / relative_path;
        item.status = ItemStatus::REJECTED;
        item.reason = "escapes root";
        spdlog::warn("[{}] Rejected allow-list entry '{}': escapes root", phase_, relative_path);
        return item;
    }

    item.absolute_path = (root / relative_path).lexically_normal();

    std::error_code ec;
    auto status = fs::symlink_status(item.absolute_path, ec);
    if (status.type() == fs::file_type::not_found) {
        item.status = ItemStatus::SKIPPED_ABSENT;
        spdlog::debug("[{}] Not present: {}", phase_, utils::Logger::TildePath(item.absolute_path.string()));
        return item;
    }
    // EACCES on a parent and the like: the entry may exist, so it is a failure, not a skip
    if (ec) {
        item.status = ItemStatus::FAILED;
        item.reason = ec.message();
        spdlog::warn("[{}] Cannot stat {}: {}", phase_, utils::Logger::TildePath(item.absolute_path.string()),
                     item.reason);
        return item;
    }

    // A symlinked parent directory could point the delete outside the root
    if (!ParentResolvesInside(root, item.absolute_path)) {
        item.status = ItemStatus::REJECTED;
        item.reason = "escapes root via symlink";
        spdlog::warn("[{}] Rejected {}: parent resolves outside root", phase_,
                     utils::Logger::TildePath(item.absolute_path.string()));
        return item;
    }

    uint64_t size = UsageScanner::MeasurePath(item.absolute_path);

    std::error_code rm_ec;
    remover_(item.absolute_path, rm_ec);
    if (rm_ec) {
        item.status = ItemStatus::FAILED;
        item.reason = rm_ec.message();
        spdlog::warn("[{}] Failed to delete {}: {}", phase_, utils::Logger::TildePath(item.absolute_path.string()),
                     item.reason);
        return item;
    }

    item.status = ItemStatus::REMOVED;
    item.bytes = size;
    spdlog::info("[{}] Deleted {} ({} bytes)", phase_, utils::Logger::TildePath(item.absolute_path.string()), size);
    return item;
}

PurgeBatchResult SelectivePurger::Purge(const fs::path& root, const std::vector<std::string>& relative_paths) const {
    PurgeBatchResult batch;
    for (const auto& relative_path : relative_paths) {
        PurgeItemResult item;
        try {
            item = PurgeOne(root, relative_path);
        } catch (const std::exception& e) {
            // Allocation or path conversion errors still only cost this one item
            item.relative_path = relative_path;
            item.absolute_path = root / relative_path;
            item.status = ItemStatus::FAILED;
            item.reason = e.what();
            spdlog::warn("[{}] Failed to delete {}: {}", phase_, relative_path, e.what());
        }
        batch.Record(std::move(item));
    }

    auto& metrics = utils::Metrics::Instance();
    metrics.items_attempted_total(phase_).Increment(static_cast<double>(batch.items_attempted));
    metrics.item_failures_total(phase_).Increment(static_cast<double>(batch.items_failed()));
    metrics.bytes_freed_total(phase_).Increment(static_cast<double>(batch.bytes_freed));

    spdlog::info("[{}] {} of {} items removed, {} bytes freed", phase_, batch.items_succeeded,
                 batch.items_attempted, batch.bytes_freed);
    return batch;
}

} // namespace cachesweep::cleanup
