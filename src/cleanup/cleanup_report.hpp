#pragma once
#include <cstdint>
#include <string>
#include "cleanup/process_terminator.hpp"
#include "cleanup/purge_result.hpp"
#include "cleanup/usage_scanner.hpp"

namespace cachesweep::cleanup {

struct CleanupReport {
    uint64_t before_bytes = 0;
    uint64_t after_bytes = 0;
    // Signed: the browser may write new data between the two scans.
    int64_t saved_bytes = 0;
    double saved_percent = 0.0;
    size_t items_attempted = 0;
    size_t items_succeeded = 0;
    size_t items_failed = 0;
    uint64_t bytes_freed = 0;
    size_t processes_terminated = 0;
};

CleanupReport BuildReport(const UsageSnapshot& before, const UsageSnapshot& after,
                          const PurgeBatchResult& cache, const PurgeBatchResult& temp,
                          const TerminationResult& termination);

// Binary units: 1 GB = 1024^3 bytes.
std::string FormatBytes(uint64_t bytes);
std::string FormatSignedBytes(int64_t bytes);

std::string FormatReport(const CleanupReport& report);

} // namespace cachesweep::cleanup
