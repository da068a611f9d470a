#include "evaluator.h"
#include "../Errors.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace Kapital {

void Evaluator::check_guess(const Eigen::VectorXd& p, const ExogenousTable& exo) {
    if (p.size() != exo.rows()) {
        throw MissingDataError("Price guess has " + std::to_string(p.size()) + " entries for "
                               + std::to_string(exo.rows()) + " periods");
    }
    for (int i = 0; i < p.size(); ++i) {
        if (std::isnan(p[i])) {
            throw MissingDataError("Price guess is missing period " + std::to_string(exo.index[i]));
        }
    }
}

ResultTable Evaluator::evaluate(const Eigen::VectorXd& p, const ExogenousTable& exo,
                                const InvestParams& pars, EvalTrace* trace) {
    check_guess(p, exo);

    if (trace) {
        trace->calls += 1;
        double p1 = p[0];
        double pN = p[p.size() - 1];
        if (p1 != pN && trace->log) {
            std::ostringstream msg;
            msg << std::setprecision(10) << p1 << " to " << pN;
            trace->log->log("Guess " + std::to_string(trace->calls), msg.str());
        }
    }

    const double r = pars.r;
    const double delta = pars.delta;
    const double w = pars.w;
    const double pk = pars.pk;

    ResultTable d(exo.index);
    d.a = exo.a;
    d.sub = exo.sub;
    d.itc = exo.itc;
    d.td = exo.td;
    d.p = p;

    // 1. Intratemporal
    d.p_net = p.array() * (1.0 + d.sub.array());
    d.pk_net = pk * (1.0 - d.itc.array());
    d.gamma = (d.p_net.array().square() * d.a.array().square()) / (4.0 * w);

    // 2. Steady-state references
    d.lam_ss = d.gamma.array() * (1.0 - d.td.array()) / (r + delta);
    d.inv_ss = (d.gamma.array() / (r + delta) - d.pk_net.array()) / (2.0 * w);
    d.cap_ss = d.inv_ss / delta;

    // 3-4. Costate, then investment from the marginal adjustment cost condition
    backward_lambda(d, pars);
    d.inv = (d.lam.array() / (1.0 - d.td.array()) - d.pk_net.array()) / (2.0 * w);

    // 5. State
    forward_capital(d, pars);

    // 6. Output and credit outlays
    d.q = d.p_net.array() * d.a.array().square() * d.cap.array() / (2.0 * w);
    d.rev_ptc = d.sub.array() * p.array() * d.q.array();
    d.rev_itc = d.itc.array() * pk * d.inv.array();

    // 7. Isoelastic inverse demand
    const double inv_elast = 1.0 / pars.elast;
    d.p_market = (d.q.array() / pars.scale).pow(inv_elast);
    d.p_diff = d.p_market - p;

    return d;
}

void Evaluator::backward_lambda(ResultTable& d, const InvestParams& pars) {
    const PeriodIndex& idx = d.index;
    const double disc = 1.0 + pars.r + pars.delta;

    d.lam.resize(idx.size());
    int last = idx.last_pos();
    d.lam[last] = d.lam_ss[last];

    for (int y = last - 1; y >= idx.first_pos(); --y) {
        d.lam[y] = (d.lam[y + 1] + d.gamma[y] * (1.0 - d.td[y])) / disc;
    }
}

void Evaluator::forward_capital(ResultTable& d, const InvestParams& pars) {
    const PeriodIndex& idx = d.index;

    d.cap.resize(idx.size());
    d.cap[idx.first_pos()] = pars.cap0;

    for (int y = idx.first_pos(); idx.has_next(y); ++y) {
        d.cap[y + 1] = d.inv[y] + (1.0 - pars.delta) * d.cap[y];
    }
}

} // namespace Kapital
