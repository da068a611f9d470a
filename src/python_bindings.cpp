#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/eigen.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "Params.hpp"
#include "Tables.hpp"
#include "Errors.hpp"
#include "kernel/evaluator.h"
#include "solver/EquilibriumSolver.hpp"
#include "rolling/rolling_merge.h"

namespace py = pybind11;

// ============================================================================
// Helpers
// ============================================================================

Kapital::ExogenousTable reconstruct_exo(const std::vector<int>& periods,
                                        const std::vector<double>& a, const std::vector<double>& sub,
                                        const std::vector<double>& itc, const std::vector<double>& td) {
    const size_t n = periods.size();
    if (a.size() != n || sub.size() != n || itc.size() != n || td.size() != n) {
        throw std::invalid_argument("periods, a, sub, itc and td must have the same length");
    }
    Kapital::ExogenousTable exo{Kapital::PeriodIndex(periods)};
    for (size_t i = 0; i < n; ++i) {
        exo.a[i] = a[i];
        exo.sub[i] = sub[i];
        exo.itc[i] = itc[i];
        exo.td[i] = td[i];
    }
    return exo;
}

Kapital::InvestParams reconstruct_params(double r, double delta, double w, double pk,
                                         double elast, double scale, double cap0) {
    Kapital::InvestParams p;
    p.r = r;
    p.delta = delta;
    p.w = w;
    p.pk = pk;
    p.elast = elast;
    p.scale = scale;
    p.cap0 = cap0;
    return p;
}

py::dict table_to_dict(const Kapital::ResultTable& d) {
    py::dict out;
    out["period"] = d.index.periods();
    for (const auto& c : Kapital::ResultTable::columns()) {
        const Eigen::VectorXd& col = d.*c.second;
        out[py::str(c.first)] = std::vector<double>(col.data(), col.data() + col.size());
    }
    return out;
}

Kapital::ResultTable dict_to_table(const py::dict& src) {
    auto periods = src["period"].cast<std::vector<int>>();
    Kapital::ResultTable d{Kapital::PeriodIndex(periods)};
    for (const auto& c : Kapital::ResultTable::columns()) {
        auto values = src[py::str(c.first)].cast<std::vector<double>>();
        if (values.size() != periods.size()) {
            throw std::invalid_argument("Column " + c.first + " does not match the period count");
        }
        (d.*c.second) = Eigen::Map<const Eigen::VectorXd>(values.data(), values.size());
    }
    return d;
}

// ============================================================================
// Wrappers
// ============================================================================

py::dict evaluate_py(const Eigen::VectorXd& prices, const std::vector<int>& periods,
                     const std::vector<double>& a, const std::vector<double>& sub,
                     const std::vector<double>& itc, const std::vector<double>& td,
                     double r, double delta, double w, double pk, double elast, double scale, double cap0) {
    auto exo = reconstruct_exo(periods, a, sub, itc, td);
    auto pars = reconstruct_params(r, delta, w, pk, elast, scale, cap0);
    return table_to_dict(Kapital::Evaluator::evaluate(prices, exo, pars));
}

py::dict solve_equilibrium_py(const Eigen::VectorXd& guess, const std::vector<int>& periods,
                              const std::vector<double>& a, const std::vector<double>& sub,
                              const std::vector<double>& itc, const std::vector<double>& td,
                              double r, double delta, double w, double pk, double elast, double scale, double cap0,
                              bool endogenous, bool inertial, int max_iter, double tol) {
    auto exo = reconstruct_exo(periods, a, sub, itc, td);
    auto pars = reconstruct_params(r, delta, w, pk, elast, scale, cap0);

    Kapital::GenericNewtonSolver::Options opts;
    opts.max_iter = max_iter;
    opts.tol = tol;

    Kapital::EquilibriumSolver solver(pars, opts);
    auto res = solver.solve(exo, guess, endogenous, inertial);

    py::dict out = table_to_dict(res.table);
    out["max_abs_miss"] = res.max_abs_miss;
    out["evaluations"] = res.evaluations;
    return out;
}

py::dict roll_onto_py(const py::dict& run, const py::dict& base, int join) {
    return table_to_dict(Kapital::RollingMerge::roll_onto(dict_to_table(run), dict_to_table(base), join));
}

// ============================================================================
// Module
// ============================================================================
PYBIND11_MODULE(kapital_core, m) {
    m.doc() = "Kapital investment model core";

    py::register_exception<Kapital::MissingDataError>(m, "MissingDataError");
    py::register_exception<Kapital::SolverDivergenceError>(m, "SolverDivergenceError");
    py::register_exception<Kapital::ConfigurationMismatchError>(m, "ConfigurationMismatchError");

    m.def("evaluate", &evaluate_py, "Evaluate the model at a price path",
          py::arg("prices"), py::arg("periods"),
          py::arg("a"), py::arg("sub"), py::arg("itc"), py::arg("td"),
          py::arg("r")=0.05, py::arg("delta")=0.1, py::arg("w")=2.0, py::arg("pk")=1.0,
          py::arg("elast")=-2.0, py::arg("scale")=1.0, py::arg("cap0")=10.0);

    m.def("solve_equilibrium", &solve_equilibrium_py, "Solve for market-clearing prices",
          py::arg("guess"), py::arg("periods"),
          py::arg("a"), py::arg("sub"), py::arg("itc"), py::arg("td"),
          py::arg("r")=0.05, py::arg("delta")=0.1, py::arg("w")=2.0, py::arg("pk")=1.0,
          py::arg("elast")=-2.0, py::arg("scale")=1.0, py::arg("cap0")=10.0,
          py::arg("endogenous")=true, py::arg("inertial")=false,
          py::arg("max_iter")=100, py::arg("tol")=1e-10);

    m.def("roll_onto", &roll_onto_py, "Splice a run onto its baseline at a join period",
          py::arg("run"), py::arg("base"), py::arg("join"));
}
