#pragma once
#include <Eigen/Dense>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>
#include "PeriodIndex.hpp"

namespace Kapital {

// Exogenous variables, one row per period
struct ExogenousTable {
    PeriodIndex index;
    Eigen::VectorXd a;    // productivity scale
    Eigen::VectorXd sub;  // production subsidy rate
    Eigen::VectorXd itc;  // investment tax credit rate
    Eigen::VectorXd td;   // ordinary tax rate

    ExogenousTable() = default;

    explicit ExogenousTable(const PeriodIndex& idx)
        : index(idx),
          a(Eigen::VectorXd::Zero(idx.size())),
          sub(Eigen::VectorXd::Zero(idx.size())),
          itc(Eigen::VectorXd::Zero(idx.size())),
          td(Eigen::VectorXd::Zero(idx.size())) {}

    int rows() const { return index.size(); }
};

// Output of one evaluation
struct ResultTable {
    PeriodIndex index;

    // Exogenous
    Eigen::VectorXd a, sub, itc, td;
    // Intratemporal
    Eigen::VectorXd p, p_net, pk_net, gamma;
    // Steady-state references
    Eigen::VectorXd lam_ss, inv_ss, cap_ss;
    // Dynamics
    Eigen::VectorXd lam, cap, inv, q;
    // Outlays and market clearing
    Eigen::VectorXd rev_ptc, rev_itc, p_market, p_diff;

    using Column = Eigen::VectorXd ResultTable::*;

    // Persisted column order
    static const std::vector<std::pair<std::string, Column>>& columns() {
        static const std::vector<std::pair<std::string, Column>> cols = {
            {"a", &ResultTable::a},
            {"sub", &ResultTable::sub},
            {"itc", &ResultTable::itc},
            {"td", &ResultTable::td},
            {"p", &ResultTable::p},
            {"p_net", &ResultTable::p_net},
            {"pk_net", &ResultTable::pk_net},
            {"gamma", &ResultTable::gamma},
            {"lam_ss", &ResultTable::lam_ss},
            {"inv_ss", &ResultTable::inv_ss},
            {"cap_ss", &ResultTable::cap_ss},
            {"lam", &ResultTable::lam},
            {"cap", &ResultTable::cap},
            {"inv", &ResultTable::inv},
            {"q", &ResultTable::q},
            {"rev_ptc", &ResultTable::rev_ptc},
            {"rev_itc", &ResultTable::rev_itc},
            {"p_market", &ResultTable::p_market},
            {"p_diff", &ResultTable::p_diff},
        };
        return cols;
    }

    static Column column_ptr(const std::string& name) {
        for (const auto& c : columns()) {
            if (c.first == name) return c.second;
        }
        throw std::out_of_range("ResultTable: unknown column " + name);
    }

    ResultTable() = default;

    explicit ResultTable(const PeriodIndex& idx) : index(idx) {
        for (const auto& c : columns()) {
            (this->*c.second) = Eigen::VectorXd::Zero(idx.size());
        }
    }

    int rows() const { return index.size(); }

    Eigen::VectorXd& column(const std::string& name) { return this->*column_ptr(name); }

    const Eigen::VectorXd& column(const std::string& name) const { return this->*column_ptr(name); }

    // Value of a column at a period label
    double at(int period, const std::string& name) const {
        int pos = index.position(period);
        if (pos < 0) {
            throw std::out_of_range("ResultTable: no period " + std::to_string(period));
        }
        return column(name)[pos];
    }
};

} // namespace Kapital
