#include "process_terminator.hpp"
#include "utils/metrics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <utility>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace cachesweep::cleanup {

namespace {

constexpr size_t kTaskCommLen = 15;

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::optional<std::string> ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) return std::nullopt;
    return s;
}

bool IsPid(const std::string& name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

ProcfsProcessTable::ProcfsProcessTable(std::string proc_root) : proc_root_(std::move(proc_root)) {}

std::vector<ProcessInfo> ProcfsProcessTable::List() {
    std::vector<ProcessInfo> out;
    std::error_code ec;
    fs::directory_iterator it(proc_root_, ec);
    if (ec) {
        spdlog::warn("Cannot enumerate processes in {}: {}", proc_root_, ec.message());
        return out;
    }

    for (const fs::directory_iterator end{}; it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        if (!IsPid(name)) continue;

        ProcessInfo info;
        info.pid = std::stoi(name);

        // Processes exit between listing and reading; a vanished one is simply dropped
        auto comm = ReadFile(it->path() / "comm");
        if (!comm) continue;
        if (!comm->empty() && comm->back() == '\n') comm->pop_back();
        info.comm = *comm;

        if (auto cmdline = ReadFile(it->path() / "cmdline"); cmdline && !cmdline->empty()) {
            std::string argv0 = cmdline->substr(0, cmdline->find('\0'));
            info.exe_name = fs::path(argv0).filename().string();
        }
        out.push_back(std::move(info));
    }
    return out;
}

int ProcfsProcessTable::Kill(int pid) {
    if (::kill(pid, SIGKILL) == 0) return 0;
    return errno;
}

ProcessTerminator::ProcessTerminator(std::shared_ptr<ProcessTable> table, std::chrono::milliseconds grace_period)
    : table_(std::move(table)), grace_period_(grace_period) {}

bool ProcessTerminator::Matches(const ProcessInfo& process, const std::string& lowered_name) {
    if (lowered_name.empty()) return false;
    if (ToLower(process.exe_name) == lowered_name) return true;

    std::string comm = ToLower(process.comm);
    if (comm == lowered_name) return true;
    // The kernel truncates comm, so a long name can only be matched by its prefix
    return comm.size() == kTaskCommLen && lowered_name.size() > kTaskCommLen &&
           lowered_name.compare(0, kTaskCommLen, comm) == 0;
}

TerminationResult ProcessTerminator::Terminate(const std::vector<std::string>& names) {
    TerminationResult result;
    if (names.empty()) return result;

    std::vector<std::string> targets;
    for (const auto& name : names) targets.push_back(ToLower(name));

    const int self = static_cast<int>(::getpid());
    auto processes = table_->List();

    for (const auto& process : processes) {
        if (process.pid == self) continue;

        auto hit = std::find_if(targets.begin(), targets.end(),
                                [&](const std::string& t) { return Matches(process, t); });
        if (hit == targets.end()) continue;

        ++result.matched;
        int err = table_->Kill(process.pid);
        if (err == 0) {
            ++result.terminated;
            utils::Metrics::Instance().processes_terminated_total().Increment();
            spdlog::info("Terminated {} (pid {})", process.comm, process.pid);
        } else if (err == ESRCH) {
            ++result.already_gone;
            spdlog::debug("{} (pid {}) already exited", process.comm, process.pid);
        } else {
            result.failures.push_back({process.pid, process.comm, std::strerror(err)});
            utils::Metrics::Instance().process_kill_failures_total().Increment();
            spdlog::warn("Could not terminate {} (pid {}): {}", process.comm, process.pid, std::strerror(err));
        }
    }

    if (result.terminated > 0 && grace_period_.count() > 0) {
        spdlog::info("Waiting {} ms for file handles to be released", grace_period_.count());
        std::this_thread::sleep_for(grace_period_);
    }
    return result;
}

} // namespace cachesweep::cleanup
