#include <iostream>
#include <string>
#include <spdlog/spdlog.h>
#include "service/cleanup_config.hpp"
#include "service/cleanup_runner.hpp"
#include "utils/logger.hpp"

using namespace cachesweep;

int main(int argc, char** argv) {
    service::CleanupConfig cfg;
    try {
        cfg = service::ParseArgs(argc, argv);
        if (cfg.show_help) {
            std::cout << service::Usage();
            return service::kExitOk;
        }
        cfg.Validate();
    } catch (const service::ConfigError& e) {
        utils::Logger::Init("info");
        spdlog::error("{}", e.what());
        std::cerr << service::Usage();
        return service::kExitConfigError;
    }

    utils::Logger::Init(cfg.log_level);

    spdlog::info("cachesweep starting");
    spdlog::debug("Root: {}, {} cache path(s), {} temp root(s)", cfg.root_path, cfg.cache_paths.size(),
                  cfg.temp_roots.size());

    try {
        service::CleanupRunner runner(cfg);
        auto outcome = runner.Run();
        spdlog::info("Finished in state {}", cleanup::RunFSM::StateToString(outcome.final_state));
        return outcome.exit_code;
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled error: {}", e.what());
        return service::kExitInternalError;
    }
}
