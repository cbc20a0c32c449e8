#include "metrics.hpp"
#include <prometheus/text_serializer.h>
#include <filesystem>
#include <fstream>

namespace cachesweep::utils {

Metrics& Metrics::Instance() {
    static Metrics instance;
    instance.EnsureMetricsCreated();
    return instance;
}

Metrics::Metrics() : registry_(std::make_shared<prometheus::Registry>()) {}

void Metrics::EnsureMetricsCreated() {
    if (processes_terminated_total_) return;
    if (!registry_) registry_ = std::make_shared<prometheus::Registry>();

    bytes_freed_family_ = &prometheus::BuildCounter()
                               .Name("cachesweep_bytes_freed_total")
                               .Help("Bytes reclaimed by purge phase")
                               .Register(*registry_);

    items_attempted_family_ = &prometheus::BuildCounter()
                                   .Name("cachesweep_items_attempted_total")
                                   .Help("Purge items that existed and were attempted, by phase")
                                   .Register(*registry_);

    item_failures_family_ = &prometheus::BuildCounter()
                                 .Name("cachesweep_item_failures_total")
                                 .Help("Purge items that could not be removed, by phase")
                                 .Register(*registry_);

    processes_terminated_total_ = &prometheus::BuildCounter()
                                       .Name("cachesweep_processes_terminated_total")
                                       .Help("Processes force-stopped before purging")
                                       .Register(*registry_)
                                       .Add({});

    process_kill_failures_total_ = &prometheus::BuildCounter()
                                        .Name("cachesweep_process_kill_failures_total")
                                        .Help("Processes that refused termination")
                                        .Register(*registry_)
                                        .Add({});

    usage_bytes_family_ = &prometheus::BuildGauge()
                               .Name("cachesweep_usage_bytes")
                               .Help("Recursive byte usage of the target root")
                               .Register(*registry_);

    last_run_exit_code_ = &prometheus::BuildGauge()
                               .Name("cachesweep_last_run_exit_code")
                               .Help("Exit code of the last cleanup run")
                               .Register(*registry_)
                               .Add({});
}

bool Metrics::WriteTextfile(const std::string& path) {
    prometheus::TextSerializer serializer;
    const std::string body = serializer.Serialize(registry_->Collect());

    // node_exporter may read at any moment, so write aside and rename into place
    std::filesystem::path target(path);
    std::filesystem::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) return false;
        ofs << body;
        if (!ofs) return false;
    }
    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

prometheus::Counter& Metrics::bytes_freed_total(const std::string& phase) {
    return bytes_freed_family_->Add({{"phase", phase}});
}

prometheus::Counter& Metrics::items_attempted_total(const std::string& phase) {
    return items_attempted_family_->Add({{"phase", phase}});
}

prometheus::Counter& Metrics::item_failures_total(const std::string& phase) {
    return item_failures_family_->Add({{"phase", phase}});
}

prometheus::Counter& Metrics::processes_terminated_total() { return *processes_terminated_total_; }
prometheus::Counter& Metrics::process_kill_failures_total() { return *process_kill_failures_total_; }

prometheus::Gauge& Metrics::usage_bytes(const std::string& snapshot) {
    return usage_bytes_family_->Add({{"snapshot", snapshot}});
}

prometheus::Gauge& Metrics::last_run_exit_code() { return *last_run_exit_code_; }

} // namespace cachesweep::utils
