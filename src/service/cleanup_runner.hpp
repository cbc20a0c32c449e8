#pragma once
#include <functional>
#include <iosfwd>
#include <memory>
#include <optional>
#include "cleanup/cleanup_report.hpp"
#include "cleanup/process_terminator.hpp"
#include "cleanup/purge_result.hpp"
#include "cleanup/run_fsm.hpp"
#include "service/cleanup_config.hpp"

namespace cachesweep::service {

enum ExitCode : int {
    kExitOk = 0,
    kExitNotPrivileged = 1,
    kExitRootMissing = 2,
    kExitConfigError = 3,
    kExitCancelled = 4,
    kExitInternalError = 5
};

// Seams to the outside world. Unset members get the production behaviour.
struct RunnerHooks {
    std::function<bool()> is_privileged;                  // default: effective uid 0
    std::shared_ptr<cleanup::ProcessTable> process_table;  // default: /proc
    std::function<bool()> restart;                        // default: systemctl reboot
    std::istream* in = nullptr;                           // default: std::cin
    std::ostream* out = nullptr;                          // default: std::cout
};

struct RunOutcome {
    int exit_code = kExitOk;
    cleanup::RunState final_state = cleanup::RunState::INIT;
    std::optional<cleanup::UsageSnapshot> before;
    std::optional<cleanup::UsageSnapshot> after;
    cleanup::TerminationResult termination;
    cleanup::PurgeBatchResult cache;
    cleanup::PurgeBatchResult temp;
    std::optional<cleanup::CleanupReport> report;
};

class CleanupRunner {
public:
    explicit CleanupRunner(CleanupConfig config, RunnerHooks hooks = {});

    // Runs every phase in order. Never throws; the outcome carries the exit code.
    RunOutcome Run();

private:
    RunOutcome Execute(cleanup::RunFSM& fsm);
    bool ConfirmStart();
    void OfferRestart();
    void Finish(RunOutcome& outcome);

    CleanupConfig config_;
    RunnerHooks hooks_;
};

bool IsAffirmative(const std::string& answer);

} // namespace cachesweep::service
