#include "cleanup_runner.hpp"
#include "cleanup/selective_purger.hpp"
#include "cleanup/temp_purger.hpp"
#include "cleanup/usage_scanner.hpp"
#include "utils/logger.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <utility>
#include <spdlog/fmt/ranges.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cachesweep::service {

using cleanup::RunState;

bool IsAffirmative(const std::string& answer) {
    std::string a;
    for (unsigned char c : answer) {
        if (!std::isspace(c)) a.push_back(static_cast<char>(std::tolower(c)));
    }
    return a == "y" || a == "yes";
}

CleanupRunner::CleanupRunner(CleanupConfig config, RunnerHooks hooks)
    : config_(std::move(config)), hooks_(std::move(hooks)) {
    if (!hooks_.is_privileged) hooks_.is_privileged = [] { return ::geteuid() == 0; };
    if (!hooks_.process_table) hooks_.process_table = std::make_shared<cleanup::ProcfsProcessTable>();
    if (!hooks_.restart) {
        hooks_.restart = [] {
            int rc = std::system("systemctl reboot");
            return rc == 0;
        };
    }
    if (!hooks_.in) hooks_.in = &std::cin;
    if (!hooks_.out) hooks_.out = &std::cout;
}

bool CleanupRunner::ConfirmStart() {
    if (config_.assume_yes) return true;
    *hooks_.out << "Close the browser and press Enter to start cleaning "
                << utils::Logger::TildePath(config_.root_path) << " ..." << std::flush;
    std::string line;
    if (!std::getline(*hooks_.in, line)) {
        *hooks_.out << "\n";
        return false;
    }
    return true;
}

void CleanupRunner::OfferRestart() {
    *hooks_.out << "Restart now? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(*hooks_.in, answer) || !IsAffirmative(answer)) {
        spdlog::info("Restart skipped");
        return;
    }
    spdlog::info("Restarting system");
    if (!hooks_.restart()) {
        spdlog::error("Restart request failed");
    }
}

void CleanupRunner::Finish(RunOutcome& outcome) {
    auto& metrics = utils::Metrics::Instance();
    metrics.last_run_exit_code().Set(outcome.exit_code);
    if (config_.metrics_file.empty()) return;
    if (!metrics.WriteTextfile(config_.metrics_file)) {
        spdlog::warn("Could not write metrics to {}", config_.metrics_file);
    }
}

RunOutcome CleanupRunner::Run() {
    cleanup::RunFSM fsm;
    RunOutcome outcome;
    try {
        outcome = Execute(fsm);
    } catch (const std::exception& e) {
        spdlog::error("Cleanup aborted: {}", e.what());
        fsm.TransitionTo(RunState::FAILED);
        outcome.exit_code = kExitInternalError;
    }
    outcome.final_state = fsm.GetCurrentState();
    Finish(outcome);
    return outcome;
}

RunOutcome CleanupRunner::Execute(cleanup::RunFSM& fsm) {
    RunOutcome outcome;

    if (!hooks_.is_privileged()) {
        spdlog::error("cachesweep must be run as root (try sudo)");
        fsm.TransitionTo(RunState::FAILED);
        outcome.exit_code = kExitNotPrivileged;
        return outcome;
    }

    if (!ConfirmStart()) {
        spdlog::info("Cancelled before any change was made");
        fsm.TransitionTo(RunState::CANCELLED);
        outcome.exit_code = kExitCancelled;
        return outcome;
    }

    const fs::path root(config_.root_path);
    cleanup::UsageScanner scanner(cleanup::ScanOptions{config_.parallel_scan, 0});
    auto& metrics = utils::Metrics::Instance();

    // 1. Baseline
    spdlog::info("Measuring {}", utils::Logger::TildePath(root.string()));
    try {
        outcome.before = scanner.Scan(root);
    } catch (const cleanup::PathNotFoundError& e) {
        spdlog::error("{}", e.what());
        fsm.TransitionTo(RunState::FAILED);
        outcome.exit_code = kExitRootMissing;
        return outcome;
    }
    metrics.usage_bytes("before").Set(static_cast<double>(outcome.before->total_bytes));
    spdlog::info("Current size: {}", cleanup::FormatBytes(outcome.before->total_bytes));
    fsm.TransitionTo(RunState::SCANNED);

    // 2. Release file locks
    if (!config_.process_names.empty()) {
        spdlog::info("Stopping processes: {}", fmt::join(config_.process_names, ", "));
    }
    cleanup::ProcessTerminator terminator(hooks_.process_table,
                                          std::chrono::milliseconds(config_.grace_period_ms));
    outcome.termination = terminator.Terminate(config_.process_names);
    if (!outcome.termination.failures.empty()) {
        spdlog::warn("{} process(es) could not be stopped; some files may stay locked",
                     outcome.termination.failures.size());
    }
    fsm.TransitionTo(RunState::TERMINATED);

    // 3. Cache folders
    spdlog::info("Deleting {} cache folder(s)", config_.cache_paths.size());
    cleanup::SelectivePurger cache_purger("cache");
    outcome.cache = cache_purger.Purge(root, config_.cache_paths);
    fsm.TransitionTo(RunState::PURGED_CACHE);

    // 4. Temp directories
    std::vector<fs::path> temp_roots(config_.temp_roots.begin(), config_.temp_roots.end());
    // TempPurger treats an empty prefix list as "everything", so only pass one on request
    std::vector<std::string> prefixes = config_.purge_all_temp ? std::vector<std::string>{} : config_.temp_prefixes;
    if (prefixes.empty() && !config_.purge_all_temp) {
        spdlog::warn("No temp prefixes configured, skipping temp directories");
        temp_roots.clear();
    }
    cleanup::TempPurger temp_purger(prefixes);
    outcome.temp = temp_purger.Purge(temp_roots);
    fsm.TransitionTo(RunState::PURGED_TEMP);

    // 5. Re-measure. The root only vanishes if something else removed it.
    try {
        outcome.after = scanner.Scan(root);
    } catch (const cleanup::PathNotFoundError& e) {
        spdlog::warn("{} after purge; counting it as empty", e.what());
        outcome.after = cleanup::UsageSnapshot{root, 0, {}};
    }
    metrics.usage_bytes("after").Set(static_cast<double>(outcome.after->total_bytes));
    fsm.TransitionTo(RunState::RESCANNED);

    // 6. Report
    outcome.report = cleanup::BuildReport(*outcome.before, *outcome.after, outcome.cache, outcome.temp,
                                          outcome.termination);
    *hooks_.out << cleanup::FormatReport(*outcome.report) << std::flush;
    fsm.TransitionTo(RunState::REPORTED);

    if (config_.offer_restart) OfferRestart();

    fsm.TransitionTo(RunState::DONE);
    outcome.exit_code = kExitOk;
    return outcome;
}

} // namespace cachesweep::service
