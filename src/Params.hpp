#pragma once
#include <map>
#include <set>
#include <string>
#include <vector>
#include <stdexcept>
#include "solver/GenericNewtonSolver.hpp"

namespace Kapital {

// Model parameters for one evaluation
struct InvestParams {
    double r = 0.0;      // real interest rate
    double delta = 0.0;  // depreciation
    double w = 0.0;      // adjustment cost coefficient
    double pk = 0.0;     // price of capital goods
    double elast = 0.0;  // demand elasticity
    double scale = 0.0;  // demand scale
    double cap0 = 0.0;   // initial capital (overridden by rolling runs)
};

// Rolling run: inherit capital from `base` at period `year` and splice onto it
struct RollingSpec {
    std::string base;
    int year = 0;
    bool has_cap0 = false;
    double cap0 = 0.0;
};

struct ModelConfig {
    InvestParams params;
    double p0 = 1.0;     // initial price guess, every period
    double cap0 = 0.0;   // default initial capital

    bool endog_p = true;
    bool base_only = false;
    bool force = false;

    std::string in_dir;
    std::string out_ex;
    std::string out_en;
    std::string out_cm = "output-cm";
    std::string baseline = "r01-baseline";

    std::map<std::string, RollingSpec> roll;   // keyed by run prefix ("r05")
    std::set<std::string> inertial;            // run prefixes

    GenericNewtonSolver::Options solver;

    // Summary program
    std::map<std::string, std::string> legend;
    int last_year = 30;

    const std::string& out_dir() const { return endog_p ? out_en : out_ex; }
    std::string closure_tag() const { return endog_p ? "en" : "ex"; }

    const RollingSpec* rolling_spec(const std::string& prefix) const {
        auto it = roll.find(prefix);
        return it == roll.end() ? nullptr : &it->second;
    }

    bool is_inertial(const std::string& prefix) const {
        return inertial.count(prefix) > 0;
    }
};

// Run prefix used as registry key: first three characters of the file stem
inline std::string run_prefix(const std::string& stem) {
    return stem.substr(0, 3);
}

} // namespace Kapital
