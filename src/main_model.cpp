#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include "Params.hpp"
#include "io/json_loader.hpp"
#include "io/RunLog.hpp"
#include "engine/RunOrchestrator.h"

// Usage: kapital_model [config.json] [--endogenous|--exogenous] [--force] [--base-only]
int main(int argc, char* argv[]) {
    try {
        std::string config_path = "model.json";
        std::vector<std::string> flags;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg.rfind("--", 0) == 0) flags.push_back(arg);
            else config_path = arg;
        }

        std::cout << "=== Kapital Investment Model ===" << std::endl;
        std::cout << "Config: " << config_path << std::endl;

        if (!std::filesystem::exists(config_path)) {
            std::cerr << "Error: Config file not found: " << config_path << std::endl;
            return 1;
        }

        Kapital::ModelConfig cfg = Kapital::JsonLoader::load_config(config_path);

        for (const auto& f : flags) {
            if (f == "--endogenous") cfg.endog_p = true;
            else if (f == "--exogenous") cfg.endog_p = false;
            else if (f == "--force") cfg.force = true;
            else if (f == "--base-only") cfg.base_only = true;
            else {
                std::cerr << "Error: Unknown option " << f << std::endl;
                return 1;
            }
        }

        // Log file lives beside the results of the active closure
        std::filesystem::create_directories(cfg.out_dir());
        std::string log_path = (std::filesystem::path(cfg.out_dir()) / ("model-" + cfg.closure_tag() + ".log")).string();
        Kapital::RunLog log("Run", log_path);

        Kapital::RunOrchestrator orchestrator(cfg, &log);
        auto reports = orchestrator.run_all();

        int failed = 0;
        std::cout << "\n--- Run Summary ---" << std::endl;
        for (const auto& rep : reports) {
            std::cout << "  " << rep.stem << ": " << Kapital::to_string(rep.state);
            if (!rep.error.empty()) std::cout << " (" << rep.error << ")";
            std::cout << std::endl;
            if (rep.state == Kapital::RunState::Failed) ++failed;
        }

        log.close();

        if (failed > 0) {
            std::cerr << "Error: " << failed << " run(s) failed" << std::endl;
            return 1;
        }

        std::cout << "\n=== Finished Successfully ===" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
