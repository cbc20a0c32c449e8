#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace cachesweep::service {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CleanupConfig {
    std::string root_path;
    std::vector<std::string> cache_paths;
    std::vector<std::string> temp_roots;
    // Only temp entries starting with one of these are purged. A shared /tmp
    // also holds X11 sockets and other users' files.
    std::vector<std::string> temp_prefixes{"chrome_", "scoped_dir", "undetected_chromedriver"};
    bool purge_all_temp = false;  // ignore temp_prefixes and empty the temp roots entirely
    std::vector<std::string> process_names;

    int grace_period_ms = 2000;
    std::string log_level = "info";
    std::string metrics_file;

    bool assume_yes = false;
    bool offer_restart = false;
    bool parallel_scan = true;
    bool show_help = false;

    // Chrome profile layout for the invoking user.
    static CleanupConfig Defaults();

    // Overlays keys present in a JSON file. Throws ConfigError.
    void MergeFile(const std::string& path);
    void MergeJson(const std::string& text);

    // CACHESWEEP_ROOT, CACHESWEEP_LOG_LEVEL, CACHESWEEP_GRACE_MS, CACHESWEEP_METRICS_FILE
    void ApplyEnv();

    // Throws ConfigError on a value that could make the run unsafe or meaningless.
    void Validate() const;
};

// Defaults, then --config file, then environment, then flags.
CleanupConfig ParseArgs(int argc, char** argv);

std::string Usage();

} // namespace cachesweep::service
