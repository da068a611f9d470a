#ifndef KAPITAL_RUN_ORCHESTRATOR_H
#define KAPITAL_RUN_ORCHESTRATOR_H

#include <string>
#include <vector>
#include "../Params.hpp"
#include "../Tables.hpp"
#include "../io/RunLog.hpp"

namespace Kapital {

enum class RunState {
    NotStarted,
    CapitalResolved,
    Solved,
    Failed,
    Merged,
    Persisted,
    Skipped   // output already present
};

const char* to_string(RunState s);

struct RunDefinition {
    std::string stem;         // "r05-delayed-itc"
    std::string prefix;       // "r05"
    std::string input_path;
    std::string output_path;
};

struct RunReport {
    std::string stem;
    RunState state = RunState::NotStarted;
    std::string error;
    double cap0 = 0.0;
    double max_abs_miss = 0.0;
    long evaluations = 0;
};

class RunOrchestrator {
public:
    RunOrchestrator(const ModelConfig& cfg, RunLog* log = nullptr);

    // Simulation definitions in the input directory, in execution order
    std::vector<RunDefinition> discover_runs() const;

    // Orders stems so every rolling run follows its base; ties by name.
    // A dependency cycle raises ConfigurationMismatchError.
    static std::vector<std::string> order_runs(const std::vector<std::string>& stems, const ModelConfig& cfg);

    // Resolve capital, solve, merge, persist. Errors are reported, never thrown.
    RunReport run_one(const RunDefinition& def);

    std::vector<RunReport> run_all();

private:
    void report_baseline(const ResultTable& d) const;

    const ModelConfig& cfg;
    RunLog* log;
};

} // namespace Kapital

#endif // KAPITAL_RUN_ORCHESTRATOR_H
