#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include "Params.hpp"
#include "io/json_loader.hpp"
#include "io/RunLog.hpp"
#include "analysis/RunSummary.hpp"

// Usage: kapital_summary [config.json] [--compare]
//
// Default: results of the configured closure, written to <out dir>/summary-<en|ex>.csv.
// --compare: runs present under both closures, written to <out_cm>/summary-cm.csv.
int main(int argc, char* argv[]) {
    namespace fs = std::filesystem;
    using Kapital::RunSummary;

    try {
        std::string config_path = "model.json";
        bool compare = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--compare") compare = true;
            else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Error: Unknown option " << arg << std::endl;
                return 1;
            } else config_path = arg;
        }

        Kapital::ModelConfig cfg = Kapital::JsonLoader::load_config(config_path);

        std::string out_dir = compare ? cfg.out_cm : cfg.out_dir();
        std::string tag = compare ? "cm" : cfg.closure_tag();
        fs::create_directories(out_dir);

        Kapital::RunLog log("Summary", (fs::path(out_dir) / ("summary-" + tag + ".log")).string());
        log.log("Endogenous price", cfg.endog_p);
        log.log("Last year", cfg.last_year);

        std::vector<RunSummary::Row> rows;

        if (compare) {
            RunSummary::RunSet ex = RunSummary::load_dir(cfg.out_ex);
            RunSummary::RunSet en = RunSummary::load_dir(cfg.out_en);
            std::vector<std::string> stems = RunSummary::common_runs(ex, en);
            log.log("Overlapping runs found", stems.size());

            rows = RunSummary::build({{"P ex", &ex}, {"P end", &en}}, stems, cfg, true);
        } else {
            RunSummary::RunSet runs = RunSummary::load_dir(cfg.out_dir());
            std::vector<std::string> stems;
            for (const auto& kv : runs) stems.push_back(kv.first);
            log.log("Runs found", stems.size());

            // Price-feedback labels for the closures that would otherwise read alike
            if (cfg.endog_p) {
                for (auto& kv : cfg.legend) {
                    char c = kv.second.empty() ? ' ' : kv.second[0];
                    if (c == 'Q' || c == 'A') kv.second += ", PF";
                }
            }

            rows = RunSummary::build({{cfg.endog_p ? "P end" : "P ex", &runs}}, stems, cfg, false);
        }

        RunSummary::log_snapshots(rows, log);

        std::string csv_path = (fs::path(out_dir) / ("summary-" + tag + ".csv")).string();
        RunSummary::write_csv(csv_path, rows, cfg.last_year);
        log.log("Wrote", csv_path);
        log.close();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
