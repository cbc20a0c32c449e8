#include "run_fsm.hpp"
#include <spdlog/spdlog.h>

namespace cachesweep::cleanup {

RunFSM::RunFSM() : current_state_(RunState::INIT), history_{RunState::INIT} {}

bool RunFSM::IsAllowed(RunState from, RunState to) {
    // Any unfinished run may fail; only INIT may be cancelled
    if (to == RunState::FAILED) {
        return from != RunState::DONE && from != RunState::FAILED && from != RunState::CANCELLED;
    }
    switch (from) {
        case RunState::INIT:
            return to == RunState::SCANNED || to == RunState::CANCELLED;
        case RunState::SCANNED: return to == RunState::TERMINATED;
        case RunState::TERMINATED: return to == RunState::PURGED_CACHE;
        case RunState::PURGED_CACHE: return to == RunState::PURGED_TEMP;
        case RunState::PURGED_TEMP: return to == RunState::RESCANNED;
        case RunState::RESCANNED: return to == RunState::REPORTED;
        case RunState::REPORTED: return to == RunState::DONE;
        default: return false;
    }
}

bool RunFSM::TransitionTo(RunState next_state) {
    if (!IsAllowed(current_state_, next_state)) {
        spdlog::error("Refusing run transition {} -> {}", StateToString(current_state_), StateToString(next_state));
        return false;
    }
    spdlog::debug("Run state {} -> {}", StateToString(current_state_), StateToString(next_state));
    current_state_ = next_state;
    history_.push_back(next_state);
    return true;
}

RunState RunFSM::GetCurrentState() const {
    return current_state_;
}

bool RunFSM::IsTerminal() const {
    return current_state_ == RunState::DONE || current_state_ == RunState::FAILED ||
           current_state_ == RunState::CANCELLED;
}

std::string RunFSM::StateToString(RunState state) {
    switch (state) {
        case RunState::INIT: return "INIT";
        case RunState::SCANNED: return "SCANNED";
        case RunState::TERMINATED: return "TERMINATED";
        case RunState::PURGED_CACHE: return "PURGED_CACHE";
        case RunState::PURGED_TEMP: return "PURGED_TEMP";
        case RunState::RESCANNED: return "RESCANNED";
        case RunState::REPORTED: return "REPORTED";
        case RunState::DONE: return "DONE";
        case RunState::FAILED: return "FAILED";
        case RunState::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

} // namespace cachesweep::cleanup
