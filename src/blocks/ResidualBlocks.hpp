#pragma once
#include <Eigen/Dense>
#include "../kernel/evaluator.h"
#include "../solver/GenericNewtonSolver.hpp"

namespace Kapital {

// Miss distances p_market - p, shaped for GenericNewtonSolver
class ResidualBlocks {
public:
    // One price per period in, one miss distance per period out
    static Eigen::VectorXd miss_all(const Eigen::VectorXd& p_guess, const ExogenousTable& exo,
                                    const InvestParams& pars, EvalTrace* trace = nullptr) {
        ResultTable res = Evaluator::evaluate(p_guess, exo, pars, trace);
        return res.p_diff;
    }

    // Inertial closure: the first-period price holds in every period.
    // Only the first period's miss distance is returned.
    static Eigen::VectorXd miss_one(const Eigen::VectorXd& p_guess, const ExogenousTable& exo,
                                    const InvestParams& pars, EvalTrace* trace = nullptr) {
        Eigen::VectorXd p = Eigen::VectorXd::Constant(exo.rows(), p_guess[0]);
        ResultTable res = Evaluator::evaluate(p, exo, pars, trace);
        Eigen::VectorXd out(1);
        out[0] = res.p_diff[res.index.first_pos()];
        return out;
    }

    static ResidualFunc bind_all(const ExogenousTable& exo, const InvestParams& pars, EvalTrace* trace) {
        return [&exo, &pars, trace](const Eigen::VectorXd& x) -> Eigen::VectorXd {
            return miss_all(x, exo, pars, trace);
        };
    }

    static ResidualFunc bind_one(const ExogenousTable& exo, const InvestParams& pars, EvalTrace* trace) {
        return [&exo, &pars, trace](const Eigen::VectorXd& x) -> Eigen::VectorXd {
            return miss_one(x, exo, pars, trace);
        };
    }
};

} // namespace Kapital
