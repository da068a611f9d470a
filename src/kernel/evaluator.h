#ifndef KAPITAL_EVALUATOR_H
#define KAPITAL_EVALUATOR_H

#include <Eigen/Dense>
#include "../Params.hpp"
#include "../Tables.hpp"
#include "../io/RunLog.hpp"

namespace Kapital {

// Caller-owned evaluation counter, used only to label progress lines
struct EvalTrace {
    long calls = 0;
    RunLog* log = nullptr;
};

class Evaluator {
public:
    // Evaluate the model for a full guess of the price trajectory.
    // p must hold one non-NaN price per row of exo (MissingDataError otherwise).
    static ResultTable evaluate(const Eigen::VectorXd& p, const ExogenousTable& exo,
                                const InvestParams& pars, EvalTrace* trace = nullptr);

private:
    // lam[last] = lam_ss[last], then discount backwards
    static void backward_lambda(ResultTable& d, const InvestParams& pars);

    // cap[first] = cap0, then accumulate forwards
    static void forward_capital(ResultTable& d, const InvestParams& pars);

    static void check_guess(const Eigen::VectorXd& p, const ExogenousTable& exo);
};

} // namespace Kapital

#endif // KAPITAL_EVALUATOR_H
