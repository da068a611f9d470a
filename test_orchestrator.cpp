#include <iostream>
#include <filesystem>
#include <fstream>
#include <map>
#include <string>
#include <vector>
#include <cassert>
#include <nlohmann/json.hpp>
#include "src/Params.hpp"
#include "src/Tables.hpp"
#include "src/io/json_loader.hpp"
#include "src/io/csv_io.h"
#include "src/io/RunLog.hpp"
#include "src/engine/RunOrchestrator.h"
#include "src/analysis/RunSummary.hpp"

using namespace Kapital;
namespace fs = std::filesystem;

// Twelve periods of constant productivity and taxes
static void write_run(const fs::path& path, double a, double itc) {
    std::ofstream f(path);
    f << "period,a,sub,itc,td\n";
    for (int t = 0; t < 12; ++t) {
        f << t << "," << a << ",0," << itc << ",0\n";
    }
}

static std::map<std::string, RunReport> by_stem(const std::vector<RunReport>& reports) {
    std::map<std::string, RunReport> out;
    for (const auto& r : reports) out[r.stem] = r;
    return out;
}

int main() {
    std::cout << "Testing RunOrchestrator..." << std::endl;

    fs::path dir = fs::temp_directory_path() / "kapital_test_orchestrator";
    fs::remove_all(dir);
    fs::create_directories(dir / "input");

    write_run(dir / "input" / "r01-baseline.csv", 1.0, 0.0);
    write_run(dir / "input" / "r02-itc.csv", 1.0, 0.1);
    write_run(dir / "input" / "r03-roll.csv", 1.0, 0.1);
    write_run(dir / "input" / "r04-dead.csv", 0.0, 0.0);
    write_run(dir / "input" / "r05-orphan.csv", 1.0, 0.1);
    write_run(dir / "input" / "r06-inertial.csv", 1.0, 0.1);
    write_run(dir / "input" / "notes.csv", 1.0, 0.0);

    nlohmann::json data = {
        {"parameters", {{"r", 0.05}, {"delta", 0.1}, {"w", 2.0}, {"pk", 1.0}, {"elast", -2.0}, {"scale", 1.0}}},
        {"p", 1.0},
        {"cap0", 10.0},
        {"in", (dir / "input").string()},
        {"out_ex", (dir / "output-ex").string()},
        {"out_en", (dir / "output-en").string()},
        {"roll", {{"r03", {{"base", "r01-baseline"}, {"year", 2}}},
                  {"r05", {{"base", "r99-missing"}, {"year", 1}}}}},
        {"inertial", {"r06"}}
    };
    ModelConfig cfg = JsonLoader::parse_config(data);
    const fs::path out = dir / "output-en";

    RunLog log("Test");

    // 1. Discovery
    std::cout << "Discovery..." << std::endl;
    {
        RunOrchestrator orch(cfg, &log);
        auto defs = orch.discover_runs();
        assert(defs.size() == 6);
        assert(defs[0].stem == "r01-baseline");
        assert(defs[2].stem == "r03-roll");
        assert(defs[2].prefix == "r03");
        assert(fs::path(defs[2].output_path) == out / "r03-roll.csv");
    }

    // 2. First pass
    std::cout << "First pass..." << std::endl;
    {
        RunOrchestrator orch(cfg, &log);
        auto reports = by_stem(orch.run_all());

        assert(reports.at("r01-baseline").state == RunState::Persisted);
        assert(reports.at("r02-itc").state == RunState::Persisted);
        assert(reports.at("r03-roll").state == RunState::Persisted);
        assert(reports.at("r06-inertial").state == RunState::Persisted);
        assert(reports.at("r04-dead").state == RunState::Failed);
        assert(reports.at("r05-orphan").state == RunState::Failed);
        assert(!reports.at("r05-orphan").error.empty());
        assert(reports.at("r01-baseline").max_abs_miss < 1e-8);
        assert(reports.at("r01-baseline").cap0 == 10.0);

        assert(fs::exists(out / "r01-baseline.csv"));
        assert(fs::exists(out / "r03-roll.csv"));
        assert(!fs::exists(out / "r04-dead.csv"));
        assert(!fs::exists(out / "r05-orphan.csv"));
        assert(!fs::exists(out / "notes.csv"));
    }

    // 3. Rolling run continues the baseline
    std::cout << "Rolling merge on disk..." << std::endl;
    {
        ResultTable base = CsvIO::read_results((out / "r01-baseline.csv").string());
        ResultTable roll = CsvIO::read_results((out / "r03-roll.csv").string());
        assert(roll.index == base.index);
        assert(roll.at(2, "cap") == base.at(2, "cap"));
        assert(roll.at(0, "p") == base.at(0, "p"));
        assert(roll.at(1, "inv") == base.at(1, "inv"));
        // From the join on, the run's own policy
        assert(roll.at(2, "itc") == 0.1);
        assert(roll.at(1, "itc") == 0.0);

        ResultTable inertial = CsvIO::read_results((out / "r06-inertial.csv").string());
        for (int i = 1; i < inertial.rows(); ++i) assert(inertial.p[i] == inertial.p[0]);
    }

    // 4. Cached results are not recomputed
    std::cout << "Second pass..." << std::endl;
    {
        RunOrchestrator orch(cfg, &log);
        auto reports = by_stem(orch.run_all());
        assert(reports.at("r01-baseline").state == RunState::Skipped);
        assert(reports.at("r02-itc").state == RunState::Skipped);
        assert(reports.at("r03-roll").state == RunState::Skipped);
        assert(reports.at("r06-inertial").state == RunState::Skipped);
        assert(reports.at("r04-dead").state == RunState::Failed);
    }

    // 5. Baseline only always recomputes
    std::cout << "Baseline only..." << std::endl;
    {
        ModelConfig base_cfg = cfg;
        base_cfg.base_only = true;
        RunOrchestrator orch(base_cfg, &log);
        auto reports = orch.run_all();
        assert(reports.size() == 1);
        assert(reports[0].stem == "r01-baseline");
        assert(reports[0].state == RunState::Persisted);
    }

    // 6. Exogenous closure evaluates the guess as given
    std::cout << "Exogenous closure..." << std::endl;
    {
        ModelConfig ex_cfg = cfg;
        ex_cfg.endog_p = false;
        RunOrchestrator orch(ex_cfg, &log);
        auto reports = by_stem(orch.run_all());
        assert(reports.at("r02-itc").state == RunState::Persisted);
        assert(reports.at("r02-itc").evaluations == 1);

        ResultTable d = CsvIO::read_results((dir / "output-ex" / "r02-itc.csv").string());
        for (int i = 0; i < d.rows(); ++i) assert(d.p[i] == 1.0);
    }

    // 7. Summary rows normalized against the baseline's first period
    std::cout << "Summary..." << std::endl;
    {
        ModelConfig sum_cfg = cfg;
        RunSummary::RunSet runs = RunSummary::load_dir(out.string());
        assert(runs.size() == 4);
        std::vector<std::string> stems;
        for (const auto& kv : runs) stems.push_back(kv.first);

        // Missing legend
        bool threw = false;
        try { RunSummary::build({{"P end", &runs}}, stems, sum_cfg, false); } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);

        sum_cfg.legend = {{"r01-baseline", "B: Baseline"}, {"r02-itc", "I: Credit"},
                          {"r03-roll", "R: Rolling credit"}, {"r06-inertial", "omit"}};
        auto rows = RunSummary::build({{"P end", &runs}}, stems, sum_cfg, false);
        assert(rows.size() == 3 * 12);
        assert(rows[0].legend == "B: Baseline" && rows[0].period == 0);
        assert(rows[0].cap == 0.0 && rows[0].inv == 0.0 && rows[0].p == 0.0);
        for (const auto& row : rows) assert(row.run != "r06-inertial");

        RunSummary::log_snapshots(rows, log, {0, 11});
        fs::path csv = out / "summary-en.csv";
        RunSummary::write_csv(csv.string(), rows, 5);
        std::ifstream f(csv);
        std::string line;
        int lines = 0;
        while (std::getline(f, line)) ++lines;
        assert(lines == 1 + 3 * 6);
    }

    fs::remove_all(dir);
    std::cout << "SUCCESS: RunOrchestrator verified." << std::endl;
    return 0;
}
