#pragma once
#include <cmath>
#include "../Params.hpp"
#include "../Tables.hpp"

namespace Kapital {

// Reference figures reported for the baseline run
struct BaselineBenchmark {
    bool has_cap10 = false;
    double cap10 = 0.0;   // capital stock in period 10, start of rolling runs
    double sub = 0.1;     // reference production subsidy
    double itc = 0.0;     // ITC giving the same investment incentive as `sub`
};

class Benchmark {
public:
    // ITC equivalent of a production subsidy `sub` at the terminal period:
    //   gamma_b = (p a)^2 / (4w),  itc = gamma_b / ((r+delta) pk) * (2+sub) * sub
    static BaselineBenchmark compute(const ResultTable& d, const InvestParams& pars, double sub = 0.1) {
        BaselineBenchmark out;
        out.sub = sub;

        if (d.index.contains(10)) {
            out.has_cap10 = true;
            out.cap10 = d.at(10, "cap");
        }

        int last = d.index.last_pos();
        double gamma_b = std::pow(d.p[last] * d.a[last], 2) / (4.0 * pars.w);
        out.itc = gamma_b / ((pars.r + pars.delta) * pars.pk) * (2.0 + sub) * sub;
        return out;
    }
};

} // namespace Kapital
