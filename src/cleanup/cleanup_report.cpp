#include "cleanup_report.hpp"
#include <spdlog/fmt/fmt.h>

namespace cachesweep::cleanup {

CleanupReport BuildReport(const UsageSnapshot& before, const UsageSnapshot& after,
                          const PurgeBatchResult& cache, const PurgeBatchResult& temp,
                          const TerminationResult& termination) {
    CleanupReport report;
    report.before_bytes = before.total_bytes;
    report.after_bytes = after.total_bytes;
    report.saved_bytes = static_cast<int64_t>(before.total_bytes) - static_cast<int64_t>(after.total_bytes);
    if (before.total_bytes > 0) {
        report.saved_percent = static_cast<double>(report.saved_bytes) / static_cast<double>(before.total_bytes) * 100.0;
    }
    report.items_attempted = cache.items_attempted + temp.items_attempted;
    report.items_succeeded = cache.items_succeeded + temp.items_succeeded;
    report.items_failed = cache.items_failed() + temp.items_failed();
    report.bytes_freed = cache.bytes_freed + temp.bytes_freed;
    report.processes_terminated = termination.terminated;
    return report;
}

std::string FormatBytes(uint64_t bytes) {
    constexpr double kKB = 1024.0;
    constexpr double kMB = kKB * 1024.0;
    constexpr double kGB = kMB * 1024.0;

    const double b = static_cast<double>(bytes);
    if (b >= kGB) return fmt::format("{:.2f} GB", b / kGB);
    if (b >= kMB) return fmt::format("{:.2f} MB", b / kMB);
    if (b >= kKB) return fmt::format("{:.2f} KB", b / kKB);
    return fmt::format("{} B", bytes);
}

std::string FormatSignedBytes(int64_t bytes) {
    if (bytes >= 0) return FormatBytes(static_cast<uint64_t>(bytes));
    // Negate in unsigned space so INT64_MIN does not overflow
    return "-" + FormatBytes(0 - static_cast<uint64_t>(bytes));
}

std::string FormatReport(const CleanupReport& report) {
    std::string out;
    out += "==================================================\n";
    out += "Cleanup summary\n";
    out += "==================================================\n";
    out += fmt::format("  Size before:       {}\n", FormatBytes(report.before_bytes));
    out += fmt::format("  Size after:        {}\n", FormatBytes(report.after_bytes));
    out += fmt::format("  Space saved:       {} ({:.2f}%)\n", FormatSignedBytes(report.saved_bytes),
                       report.saved_percent);
    out += fmt::format("  Freed by purge:    {}\n", FormatBytes(report.bytes_freed));
    out += fmt::format("  Items removed:     {} of {} ({} failed)\n", report.items_succeeded,
                       report.items_attempted, report.items_failed);
    out += fmt::format("  Processes stopped: {}\n", report.processes_terminated);
    out += "==================================================\n";
    return out;
}

} // namespace cachesweep::cleanup
