#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace cachesweep::cleanup {

struct ProcessInfo {
    int pid = 0;
    std::string comm;       // kernel task name, at most 15 chars
    std::string exe_name;   // basename of argv[0], may be empty for kernel threads
};

// Source of running processes plus the means to stop them.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    virtual std::vector<ProcessInfo> List() = 0;

    // Sends a forceful stop. Returns 0 on success, otherwise an errno value.
    virtual int Kill(int pid) = 0;
};

// Reads /proc/<pid>/comm and /proc/<pid>/cmdline; stops with SIGKILL.
class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(std::string proc_root = "/proc");

    std::vector<ProcessInfo> List() override;
    int Kill(int pid) override;

private:
    std::string proc_root_;
};

struct TerminationFailure {
    int pid;
    std::string name;
    std::string reason;
};

struct TerminationResult {
    size_t matched = 0;
    size_t terminated = 0;
    size_t already_gone = 0;
    std::vector<TerminationFailure> failures;
};

class ProcessTerminator {
public:
    ProcessTerminator(std::shared_ptr<ProcessTable> table, std::chrono::milliseconds grace_period);

    // Force-stops every process matching one of names (case-insensitive).
    // Failures are collected, never thrown. Waits for the grace period when
    // at least one process was signalled.
    TerminationResult Terminate(const std::vector<std::string>& names);

    static bool Matches(const ProcessInfo& process, const std::string& lowered_name);

private:
    std::shared_ptr<ProcessTable> table_;
    std::chrono::milliseconds grace_period_;
};

} // namespace cachesweep::cleanup
