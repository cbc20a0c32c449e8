#include "temp_purger.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <utility>
#include <algorithm>
#include <set>

namespace fs = std::filesystem;

namespace cachesweep::cleanup {

namespace {

constexpr const char* kPhase = "temp";

struct TreeListing {
    std::vector<fs::path> files;  // anything that is not a directory, symlinks included
    std::vector<fs::path> dirs;   // pre-order, so reversed it is deepest first
};

TreeListing ListTree(const fs::path& top) {
    TreeListing listing;
    std::vector<fs::path> pending{top};
    while (!pending.empty()) {
        fs::path current = std::move(pending.back());
        pending.pop_back();
        listing.dirs.push_back(current);

        std::error_code ec;
        fs::directory_iterator it(current, ec);
        if (ec) continue; // removal of this directory will fail and be reported

        const fs::directory_iterator end{};
        while (it != end) {
            std::error_code st_ec;
            auto status = it->symlink_status(st_ec);
            if (!st_ec) {
                if (fs::is_directory(status)) pending.push_back(it->path());
                else listing.files.push_back(it->path());
            }
            it.increment(ec);
            if (ec) break;
        }
    }
    return listing;
}

uint64_t RegularFileBytes(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (ec || !fs::is_regular_file(status)) return 0;
    auto size = fs::file_size(path, ec);
    return ec ? 0 : size;
}

} // namespace

TempPurger::TempPurger(std::vector<std::string> name_prefixes, RemoveFn remover)
    : name_prefixes_(std::move(name_prefixes)), remover_(std::move(remover)) {
    if (!remover_) {
        remover_ = [](const fs::path& p, std::error_code& ec) { return fs::remove(p, ec); };
    }
}

bool TempPurger::Selects(const std::string& entry_name) const {
    if (name_prefixes_.empty()) return true;
    return std::any_of(name_prefixes_.begin(), name_prefixes_.end(), [&](const std::string& prefix) {
        return entry_name.compare(0, prefix.size(), prefix) == 0;
    });
}

PurgeItemResult TempPurger::PurgeEntry(const fs::path& entry) const {
    PurgeItemResult item;
    item.relative_path = entry.filename().string();
    item.absolute_path = entry;

    std::error_code ec;
    auto status = fs::symlink_status(entry, ec);
    if (status.type() == fs::file_type::not_found) {
        item.status = ItemStatus::SKIPPED_ABSENT;
        return item;
    }
    if (ec) {
        item.status = ItemStatus::FAILED;
        item.reason = ec.message();
        spdlog::warn("[{}] Cannot stat {}: {}", kPhase, entry.string(), item.reason);
        return item;
    }

    size_t failures = 0;
    auto note_failure = [&](const fs::path& p, const std::error_code& err) {
        ++failures;
        if (item.reason.empty()) item.reason = p.filename().string() + ": " + err.message();
        spdlog::debug("[{}] Could not remove {}: {}", kPhase, p.string(), err.message());
    };

    if (!fs::is_directory(status)) {
        uint64_t size = RegularFileBytes(entry);
        std::error_code rm_ec;
        remover_(entry, rm_ec);
        if (rm_ec) note_failure(entry, rm_ec);
        else item.bytes = size;
    } else {
        TreeListing listing = ListTree(entry);
        for (const auto& file : listing.files) {
            uint64_t size = RegularFileBytes(file);
            std::error_code rm_ec;
            remover_(file, rm_ec);
            if (rm_ec) note_failure(file, rm_ec);
            else item.bytes += size;
        }
        for (auto it = listing.dirs.rbegin(); it != listing.dirs.rend(); ++it) {
            std::error_code rm_ec;
            remover_(*it, rm_ec);
            if (rm_ec) note_failure(*it, rm_ec);
        }
    }

    std::error_code gone_ec;
    bool gone = !fs::exists(fs::symlink_status(entry, gone_ec));
    if (gone) {
        item.status = ItemStatus::REMOVED;
    } else {
        item.status = ItemStatus::FAILED;
        if (item.reason.empty()) item.reason = "entry still present";
        spdlog::warn("[{}] Could not fully remove {} ({} failures): {}", kPhase,
                     utils::Logger::TildePath(entry.string()), failures, item.reason);
    }
    return item;
}

PurgeBatchResult TempPurger::Purge(const std::vector<fs::path>& roots) const {
    PurgeBatchResult batch;
    std::set<fs::path> seen;

    for (const auto& root : roots) {
        std::error_code ec;
        fs::path resolved = fs::weakly_canonical(root, ec);
        if (ec) resolved = root.lexically_normal();
        if (!seen.insert(resolved).second) continue;

        if (!fs::is_directory(resolved, ec)) {
            spdlog::debug("[{}] Temp root not present: {}", kPhase, root.string());
            continue;
        }

        spdlog::info("[{}] Cleaning {}", kPhase, utils::Logger::TildePath(resolved.string()));

        // Snapshot the children first so deleting does not disturb iteration
        std::vector<fs::path> entries;
        fs::directory_iterator it(resolved, ec);
        if (ec) {
            spdlog::warn("[{}] Cannot list {}: {}", kPhase, resolved.string(), ec.message());
            continue;
        }
        const fs::directory_iterator end{};
        while (it != end) {
            if (Selects(it->path().filename().string())) entries.push_back(it->path());
            it.increment(ec);
            if (ec) break;
        }

        for (const auto& entry : entries) {
            PurgeItemResult item;
            try {
                item = PurgeEntry(entry);
            } catch (const std::exception& e) {
                item.relative_path = entry.filename().string();
                item.absolute_path = entry;
                item.status = ItemStatus::FAILED;
                item.reason = e.what();
                spdlog::warn("[{}] Failed to clean {}: {}", kPhase, entry.string(), e.what());
            }
            batch.Record(std::move(item));
        }
    }

    auto& metrics = utils::Metrics::Instance();
    metrics.items_attempted_total(kPhase).Increment(static_cast<double>(batch.items_attempted));
    metrics.item_failures_total(kPhase).Increment(static_cast<double>(batch.items_failed()));
    metrics.bytes_freed_total(kPhase).Increment(static_cast<double>(batch.bytes_freed));

    spdlog::info("[{}] {} of {} entries removed, {} bytes freed", kPhase, batch.items_succeeded,
                 batch.items_attempted, batch.bytes_freed);
    return batch;
}

} // namespace cachesweep::cleanup
