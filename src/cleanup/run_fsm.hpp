#pragma once
#include <string>
#include <vector>

namespace cachesweep::cleanup {

enum class RunState {
    INIT,
    SCANNED,
    TERMINATED,
    PURGED_CACHE,
    PURGED_TEMP,
    RESCANNED,
    REPORTED,
    DONE,
    FAILED,
    CANCELLED
};

// Tracks the phase sequence of one cleanup run. Transitions that skip or
// reorder a phase are refused so the runner cannot purge before scanning.
class RunFSM {
public:
    RunFSM();

    bool TransitionTo(RunState next_state);
    RunState GetCurrentState() const;
    bool IsTerminal() const;
    const std::vector<RunState>& History() const { return history_; }
    static std::string StateToString(RunState state);

private:
    static bool IsAllowed(RunState from, RunState to);

    RunState current_state_;
    std::vector<RunState> history_;
};

} // namespace cachesweep::cleanup
