#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace cachesweep::utils {

class Logger {
public:
    static void Init(const std::string& log_level);
    static bool IsValidLevel(const std::string& log_level);
    // Home of the user who invoked the tool. Under sudo $HOME is root's, so a
    // privileged run with SUDO_USER set looks that user up in the passwd database.
    static std::string HomeDirectory();
    static std::string HomeDirectory(bool privileged);
    // Replaces a leading HomeDirectory() with "~" so progress lines stay short.
    static std::string TildePath(const std::string& path);
};

} // namespace cachesweep::utils
