#include "RunOrchestrator.h"
#include <algorithm>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <set>

#include "../Errors.hpp"
#include "../io/csv_io.h"
#include "../kernel/evaluator.h"
#include "../rolling/rolling_merge.h"
#include "../solver/EquilibriumSolver.hpp"
#include "../analysis/Benchmark.hpp"

namespace fs = std::filesystem;

namespace Kapital {

const char* to_string(RunState s) {
    switch (s) {
        case RunState::NotStarted: return "NotStarted";
        case RunState::CapitalResolved: return "CapitalResolved";
        case RunState::Solved: return "Solved";
        case RunState::Failed: return "Failed";
        case RunState::Merged: return "Merged";
        case RunState::Persisted: return "Persisted";
        case RunState::Skipped: return "Skipped";
    }
    return "Unknown";
}

RunOrchestrator::RunOrchestrator(const ModelConfig& c, RunLog* l) : cfg(c), log(l) {}

std::vector<std::string> RunOrchestrator::order_runs(const std::vector<std::string>& stems,
                                                     const ModelConfig& cfg) {
    std::vector<std::string> sorted(stems);
    std::sort(sorted.begin(), sorted.end());
    std::set<std::string> present(sorted.begin(), sorted.end());

    // 0 = unvisited, 1 = on stack, 2 = done
    std::map<std::string, int> mark;
    std::vector<std::string> order;

    std::function<void(const std::string&)> visit = [&](const std::string& stem) {
        int& m = mark[stem];
        if (m == 2) return;
        if (m == 1) {
            throw ConfigurationMismatchError("Rolling runs form a cycle through " + stem);
        }
        m = 1;
        const RollingSpec* spec = cfg.rolling_spec(run_prefix(stem));
        if (spec && present.count(spec->base)) {
            visit(spec->base);
        }
        mark[stem] = 2;
        order.push_back(stem);
    };

    for (const auto& s : sorted) visit(s);
    return order;
}

std::vector<RunDefinition> RunOrchestrator::discover_runs() const {
    std::vector<std::string> stems;

    if (cfg.base_only) {
        stems.push_back(cfg.baseline);
    } else {
        if (!fs::is_directory(cfg.in_dir)) {
            throw std::runtime_error("Input directory not found: " + cfg.in_dir);
        }
        for (const auto& entry : fs::directory_iterator(cfg.in_dir)) {
            if (!entry.is_regular_file()) continue;
            const fs::path& path = entry.path();
            std::string name = path.filename().string();
            if (path.extension() == ".csv" && !name.empty() && name[0] == 'r') {
                stems.push_back(path.stem().string());
            }
        }
    }

    std::vector<RunDefinition> defs;
    for (const auto& stem : order_runs(stems, cfg)) {
        RunDefinition def;
        def.stem = stem;
        def.prefix = run_prefix(stem);
        def.input_path = (fs::path(cfg.in_dir) / (stem + ".csv")).string();
        def.output_path = (fs::path(cfg.out_dir()) / (stem + ".csv")).string();
        defs.push_back(def);
    }
    return defs;
}

RunReport RunOrchestrator::run_one(const RunDefinition& def) {
    RunReport rep;
    rep.stem = def.stem;

    if (log) log->log("Input file", def.input_path);

    // Cached result
    if (fs::exists(def.output_path) && !cfg.base_only && !cfg.force) {
        if (log) log->log("Output file exists, skipping", def.output_path);
        rep.state = RunState::Skipped;
        return rep;
    }

    try {
        ExogenousTable exo = CsvIO::read_exogenous(def.input_path);

        // 1. Initial capital, direct or inherited from the rolling baseline
        InvestParams pars = cfg.params;
        const RollingSpec* spec = cfg.rolling_spec(def.prefix);
        ResultTable base;

        if (spec) {
            fs::path base_path = fs::path(cfg.out_dir()) / (spec->base + ".csv");
            if (!fs::exists(base_path)) {
                throw ConfigurationMismatchError("Baseline output " + base_path.string()
                                                 + " does not exist for rolling run " + def.stem);
            }
            base = CsvIO::read_results(base_path.string());
            pars.cap0 = RollingMerge::resolve_initial_capital(*spec, base);
        } else {
            pars.cap0 = cfg.cap0;
        }
        rep.cap0 = pars.cap0;
        rep.state = RunState::CapitalResolved;
        if (log) log->log("Initial capital", pars.cap0);

        // 2. Prices
        Eigen::VectorXd guess = Eigen::VectorXd::Constant(exo.rows(), cfg.p0);
        EquilibriumSolver solver(pars, cfg.solver, log);
        EquilibriumResult res = solver.solve(exo, guess, cfg.endog_p, cfg.is_inertial(def.prefix));

        rep.max_abs_miss = res.max_abs_miss;
        rep.evaluations = res.evaluations;
        rep.state = RunState::Solved;

        // 3. Splice onto the baseline
        ResultTable d = res.table;
        if (spec) {
            d = RollingMerge::roll_onto(res.table, base, spec->year);
            rep.state = RunState::Merged;
        }

        // 4. Persist
        fs::path out_dir = fs::path(def.output_path).parent_path();
        if (!out_dir.empty()) fs::create_directories(out_dir);
        CsvIO::write_results(def.output_path, d);
        rep.state = RunState::Persisted;
        if (log) log->log("Wrote", def.output_path);

        if (def.stem.find("baseline") != std::string::npos) {
            report_baseline(d);
        }

    } catch (const std::exception& e) {
        rep.state = RunState::Failed;
        rep.error = e.what();
        if (log) log->log("Run failed: " + def.stem, rep.error);
    }

    return rep;
}

std::vector<RunReport> RunOrchestrator::run_all() {
    if (log) log->log("Endogenous price", cfg.endog_p);

    std::vector<RunReport> reports;
    for (const auto& def : discover_runs()) {
        reports.push_back(run_one(def));
    }
    return reports;
}

void RunOrchestrator::report_baseline(const ResultTable& d) const {
    if (!log) return;

    BaselineBenchmark b = Benchmark::compute(d, cfg.params);
    if (b.has_cap10) {
        log->log("Year 10 capital", b.cap10);
    } else {
        log->log("Year 10 capital", "period 10 not in run");
    }
    log->log("Investment benchmark ITC", b.itc);
    log->log("Investment benchmark sub", b.sub);
}

} // namespace Kapital
