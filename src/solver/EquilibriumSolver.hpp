#pragma once
#include <Eigen/Dense>
#include <sstream>
#include <string>
#include "GenericNewtonSolver.hpp"
#include "../blocks/ResidualBlocks.hpp"
#include "../kernel/evaluator.h"
#include "../Errors.hpp"
#include "../Params.hpp"
#include "../io/RunLog.hpp"

namespace Kapital {

struct EquilibriumResult {
    Eigen::VectorXd prices;     // price path used for the final table
    ResultTable table;          // authoritative evaluation at `prices`
    bool root_found = false;    // false when prices were exogenous
    double max_abs_miss = 0.0;  // from the root finder's final residuals
    int iterations = 0;
    long evaluations = 0;
};

// Market-clearing price path for one run
class EquilibriumSolver {
    const InvestParams& pars;
    GenericNewtonSolver::Options opts;
    RunLog* log;

public:
    EquilibriumSolver(const InvestParams& p, const GenericNewtonSolver::Options& o, RunLog* l = nullptr)
        : pars(p), opts(o), log(l) {}

    EquilibriumResult solve(const ExogenousTable& exo, const Eigen::VectorXd& guess,
                            bool prices_endogenous, bool inertial) const {
        EquilibriumResult out;
        EvalTrace trace;
        trace.log = log;

        Eigen::VectorXd p = guess;

        if (prices_endogenous) {
            GenericNewtonSolver::Result sol;

            if (inertial) {
                // Only the first-period price is free
                if (guess.size() == 0) {
                    throw MissingDataError("Inertial solve needs a first-period price guess");
                }
                Eigen::VectorXd x0(1);
                x0[0] = guess[0];
                sol = GenericNewtonSolver::solve(ResidualBlocks::bind_one(exo, pars, &trace), x0, opts);
            } else {
                sol = GenericNewtonSolver::solve(ResidualBlocks::bind_all(exo, pars, &trace), guess, opts);
            }

            out.max_abs_miss = sol.fun.size() > 0 ? sol.fun.cwiseAbs().maxCoeff() : 0.0;
            out.iterations = sol.iterations;

            if (log) {
                log->log("Max absolute miss distance", out.max_abs_miss);
                log->log("Success", sol.success);
            }

            if (!sol.success) {
                std::ostringstream msg;
                msg << "Price solve did not converge after " << sol.iterations
                    << " iterations (" << sol.message << "), max miss " << out.max_abs_miss;
                throw SolverDivergenceError(msg.str());
            }

            if (inertial) {
                p = Eigen::VectorXd::Constant(exo.rows(), sol.x[0]);
            } else {
                p = sol.x;
            }
            out.root_found = true;
        }

        // Final evaluation, whether or not prices were solved for
        out.table = Evaluator::evaluate(p, exo, pars, &trace);
        out.prices = p;
        out.evaluations = trace.calls;

        if (!prices_endogenous) {
            out.max_abs_miss = out.table.p_diff.size() > 0 ? out.table.p_diff.cwiseAbs().maxCoeff() : 0.0;
        }
        return out;
    }
};

} // namespace Kapital
