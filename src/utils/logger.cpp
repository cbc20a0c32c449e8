#include "logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <vector>
#include <pwd.h>
#include <unistd.h>

namespace cachesweep::utils {

void Logger::Init(const std::string& log_level) {
    auto console = spdlog::get("console");
    if (!console) console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    if (log_level == "debug") spdlog::set_level(spdlog::level::debug);
    else if (log_level == "info") spdlog::set_level(spdlog::level::info);
    else if (log_level == "warn") spdlog::set_level(spdlog::level::warn);
    else if (log_level == "error") spdlog::set_level(spdlog::level::err);
    else spdlog::set_level(spdlog::level::info);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

bool Logger::IsValidLevel(const std::string& log_level) {
    return log_level == "debug" || log_level == "info" || log_level == "warn" || log_level == "error";
}

std::string Logger::HomeDirectory() {
    return HomeDirectory(::geteuid() == 0);
}

std::string Logger::HomeDirectory(bool privileged) {
    const char* sudo_user = std::getenv("SUDO_USER");
    if (privileged && sudo_user && *sudo_user) {
        long hint = ::sysconf(_SC_GETPW_R_SIZE_MAX);
        std::vector<char> buf(hint > 0 ? static_cast<size_t>(hint) : 16384);
        struct passwd pw {};
        struct passwd* found = nullptr;
        int rc = ::getpwnam_r(sudo_user, &pw, buf.data(), buf.size(), &found);
        if (rc == 0 && found && found->pw_dir && *found->pw_dir) return found->pw_dir;
        spdlog::debug("No passwd entry for SUDO_USER '{}', falling back to $HOME", sudo_user);
    }

    const char* home = std::getenv("HOME");
    return home ? home : "";
}

std::string Logger::TildePath(const std::string& path) {
    std::string prefix = HomeDirectory();
    if (prefix.empty()) return path;

    while (prefix.size() > 1 && prefix.back() == '/') prefix.pop_back();
    if (prefix == "/") return path;
    if (path.compare(0, prefix.size(), prefix) != 0) return path;

    // Only a whole path component counts: /home/al must not match /home/alice
    if (path.size() > prefix.size() && path[prefix.size()] != '/') return path;

    return "~" + path.substr(prefix.size());
}

} // namespace cachesweep::utils
