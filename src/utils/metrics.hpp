#pragma once
#include <prometheus/registry.h>
#include <prometheus/gauge.h>
#include <prometheus/counter.h>
#include <memory>
#include <string>

namespace cachesweep::utils {

class Metrics {
public:
    static Metrics& Instance();

    // Writes the registry in Prometheus text format (textfile collector layout).
    // Returns false if the file could not be written.
    bool WriteTextfile(const std::string& path);

    prometheus::Counter& bytes_freed_total(const std::string& phase);
    prometheus::Counter& items_attempted_total(const std::string& phase);
    prometheus::Counter& item_failures_total(const std::string& phase);
    prometheus::Counter& processes_terminated_total();
    prometheus::Counter& process_kill_failures_total();
    prometheus::Gauge& usage_bytes(const std::string& snapshot);
    prometheus::Gauge& last_run_exit_code();

private:
    Metrics();
    void EnsureMetricsCreated();
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* bytes_freed_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* items_attempted_family_ = nullptr;
    prometheus::Family<prometheus::Counter>* item_failures_family_ = nullptr;
    prometheus::Counter* processes_terminated_total_ = nullptr;
    prometheus::Counter* process_kill_failures_total_ = nullptr;
    prometheus::Family<prometheus::Gauge>* usage_bytes_family_ = nullptr;
    prometheus::Gauge* last_run_exit_code_ = nullptr;
};

} // namespace cachesweep::utils
