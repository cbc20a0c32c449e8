#include "cleanup_config.hpp"
#include "utils/logger.hpp"
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace cachesweep::service {

namespace {

int ParseInt(const std::string& value, const std::string& what) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return n;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + what + ": '" + value + "'");
    }
}

template <typename T>
void Assign(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Config key '") + key + "': " + e.what());
    }
}

} // namespace

CleanupConfig CleanupConfig::Defaults() {
    CleanupConfig c;

    if (std::string home = utils::Logger::HomeDirectory(); !home.empty()) {
        c.root_path = (fs::path(home) / ".config" / "google-chrome" / "Default").string();
    }

    c.cache_paths = {
        "Cache",
        "Code Cache",
        "GPUCache",
        "Media Cache",
        "Application Cache",
        "Service Worker/CacheStorage",
        "Service Worker/ScriptCache",
        "ShaderCache",
        "GrShaderCache",
        "DawnCache",
    };

    c.temp_roots.push_back("/tmp");
    if (const char* tmpdir = std::getenv("TMPDIR"); tmpdir && *tmpdir) {
        c.temp_roots.push_back(tmpdir);
    }

    c.process_names = {"chrome", "chromedriver"};
    return c;
}

void CleanupConfig::MergeJson(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Malformed config: ") + e.what());
    }
    if (!j.is_object()) throw ConfigError("Config root must be a JSON object");

    Assign(j, "root", root_path);
    Assign(j, "cache_paths", cache_paths);
    Assign(j, "temp_roots", temp_roots);
    Assign(j, "temp_prefixes", temp_prefixes);
    Assign(j, "purge_all_temp", purge_all_temp);
    Assign(j, "processes", process_names);
    Assign(j, "grace_period_ms", grace_period_ms);
    Assign(j, "log_level", log_level);
    Assign(j, "metrics_file", metrics_file);
    Assign(j, "parallel_scan", parallel_scan);
    Assign(j, "offer_restart", offer_restart);
}

void CleanupConfig::MergeFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigError("Cannot open config file: " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    MergeJson(ss.str());
}

void CleanupConfig::ApplyEnv() {
    if (const char* env = std::getenv("CACHESWEEP_ROOT"))
        root_path = env;
    if (const char* env = std::getenv("CACHESWEEP_LOG_LEVEL"))
        log_level = env;
    if (const char* env = std::getenv("CACHESWEEP_GRACE_MS"))
        grace_period_ms = ParseInt(env, "CACHESWEEP_GRACE_MS");
    if (const char* env = std::getenv("CACHESWEEP_METRICS_FILE"))
        metrics_file = env;
}

void CleanupConfig::Validate() const {
    if (!root_path.empty() && fs::path(root_path).lexically_normal() == fs::path("/")) {
        throw ConfigError("Refusing to use / as the cleanup root");
    }
    for (const auto& root : temp_roots) {
        fs::path p(root);
        if (!p.is_absolute()) throw ConfigError("Temp root must be absolute: " + root);
        if (p.lexically_normal() == fs::path("/")) throw ConfigError("Refusing to use / as a temp root");
    }
    if (!temp_roots.empty() && temp_prefixes.empty() && !purge_all_temp) {
        throw ConfigError("No temp prefixes configured; use --all-temp to empty the temp roots entirely");
    }
    if (grace_period_ms < 0) throw ConfigError("Grace period must not be negative");
    if (!utils::Logger::IsValidLevel(log_level)) throw ConfigError("Unknown log level: " + log_level);
}

CleanupConfig ParseArgs(int argc, char** argv) {
    CleanupConfig cfg = CleanupConfig::Defaults();

    // The config file sits underneath env and flags, so find it first
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) throw ConfigError("--config requires a value");
            cfg.MergeFile(argv[i + 1]);
            break;
        }
    }
    cfg.ApplyEnv();

    // A repeated list flag replaces the configured list instead of appending to it
    bool cache_set = false, temp_set = false, prefix_set = false, process_set = false;
    auto push = [](std::vector<std::string>& list, bool& replaced, const std::string& value) {
        if (!replaced) {
            list.clear();
            replaced = true;
        }
        list.push_back(value);
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw ConfigError(arg + " requires a value");
            return argv[++i];
        };

        if (arg == "--config") ++i;
        else if (arg == "--root") cfg.root_path = value();
        else if (arg == "--cache-path") push(cfg.cache_paths, cache_set, value());
        else if (arg == "--temp-root") push(cfg.temp_roots, temp_set, value());
        else if (arg == "--no-temp") { cfg.temp_roots.clear(); temp_set = true; }
        else if (arg == "--temp-prefix") push(cfg.temp_prefixes, prefix_set, value());
        else if (arg == "--all-temp") cfg.purge_all_temp = true;
        else if (arg == "--process") push(cfg.process_names, process_set, value());
        else if (arg == "--grace-ms") cfg.grace_period_ms = ParseInt(value(), "--grace-ms");
        else if (arg == "--log-level") cfg.log_level = value();
        else if (arg == "--metrics-file") cfg.metrics_file = value();
        else if (arg == "--yes" || arg == "-y") cfg.assume_yes = true;
        else if (arg == "--offer-restart") cfg.offer_restart = true;
        else if (arg == "--no-parallel-scan") cfg.parallel_scan = false;
        else if (arg == "--help" || arg == "-h") cfg.show_help = true;
        else throw ConfigError("Unknown option: " + arg);
    }
    return cfg;
}

std::string Usage() {
    return "Usage: cachesweep [options]\n"
           "\n"
           "Stops the browser, deletes its cache folders and temp files, and reports\n"
           "how much space was reclaimed. Must be run as root.\n"
           "\n"
           "Options:\n"
           "  --config FILE        JSON config file\n"
           "  --root DIR           profile directory to clean\n"
           "  --cache-path REL     cache subpath under the root (repeatable)\n"
           "  --temp-root DIR      temp directory to empty (repeatable)\n"
           "  --no-temp            skip the temp purge phase\n"
           "  --temp-prefix P      only purge temp entries starting with P (repeatable,\n"
           "                       default chrome_, scoped_dir, undetected_chromedriver)\n"
           "  --all-temp           purge every entry under the temp roots\n"
           "  --process NAME       process to stop before purging (repeatable)\n"
           "  --grace-ms N         wait after stopping processes (default 2000)\n"
           "  --log-level LEVEL    debug, info, warn or error\n"
           "  --metrics-file FILE  write Prometheus text metrics after the run\n"
           "  --no-parallel-scan   scan subdirectories sequentially\n"
           "  -y, --yes            do not wait for confirmation\n"
           "  --offer-restart      ask to restart the machine when done\n"
           "  -h, --help           show this help\n"
           "\n"
           "Exit codes: 0 ok, 1 not root, 2 root path missing, 3 bad configuration,\n"
           "4 cancelled, 5 internal error.\n";
}

} // namespace cachesweep::service
