#pragma once
#include <algorithm>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <Eigen/Dense>

namespace Kapital {

// Function pointer type: F(x) -> residuals
using ResidualFunc = std::function<Eigen::VectorXd(const Eigen::VectorXd&)>;

class GenericNewtonSolver {
public:
    struct Options {
        int max_iter = 100;
        double tol = 1e-10;            // On the residual 2-norm
        double fd_eps = 1e-7;          // Finite Difference Step
        double damping_factor = 1.0;   // Initial damping
        int max_backtracking = 30;     // Max backtracking steps
        bool verbose = false;
    };

    struct Result {
        Eigen::VectorXd x;
        Eigen::VectorXd fun;   // residuals at x
        bool success = false;
        int iterations = 0;
        std::string message;
    };

    static Result solve(const ResidualFunc& F, const Eigen::VectorXd& x0) {
        return solve(F, x0, Options());
    }

    static Result solve(const ResidualFunc& F, const Eigen::VectorXd& x0, const Options& opts) {
        Result res;
        res.x = x0;

        if (opts.verbose) {
            std::cout << "--- Kapital GenericNewtonSolver ---" << std::endl;
            std::cout << "Dim: " << x0.size() << ", Max Iter: " << opts.max_iter << std::endl;
        }

        Eigen::VectorXd f_val = F(res.x);
        double error = f_val.norm();
        res.fun = f_val;

        if (!std::isfinite(error)) {
            res.message = "Residual is not finite at the starting point";
            return res;
        }

        for (int iter = 0; iter < opts.max_iter; ++iter) {
            res.iterations = iter;

            if (opts.verbose) {
                std::cout << "  Iter " << std::setw(3) << iter
                          << " | Error: " << std::scientific << error
                          << " | x[0]: " << (res.x.size() > 0 ? res.x[0] : 0.0)
                          << std::defaultfloat << std::endl;
            }

            if (error < opts.tol) {
                res.success = true;
                res.message = "Converged";
                if (opts.verbose) std::cout << "[CONVERGED] Solution found." << std::endl;
                return res;
            }

            // Forward-difference Jacobian, then Newton step J * dx = -f
            Eigen::MatrixXd J = compute_jacobian(F, res.x, f_val, opts.fd_eps);
            Eigen::VectorXd dx = J.colPivHouseholderQr().solve(-f_val);

            if (!dx.allFinite()) {
                res.message = "Newton step is not finite";
                return res;
            }

            // Backtracking line search. NaN residuals never count as improvement.
            double lambda = opts.damping_factor;
            bool improved = false;

            for (int bt = 0; bt < opts.max_backtracking; ++bt) {
                Eigen::VectorXd x_new = res.x + lambda * dx;
                Eigen::VectorXd f_new = F(x_new);
                double err_new = f_new.norm();

                if (std::isfinite(err_new) && err_new < error) {
                    res.x = x_new;
                    f_val = f_new;
                    error = err_new;
                    improved = true;
                    break;
                }
                lambda *= 0.5;
            }

            res.fun = f_val;

            if (!improved) {
                res.message = "Line search failed to reduce the residual";
                if (opts.verbose) std::cout << "[FAIL] " << res.message << std::endl;
                return res;
            }
        }

        res.iterations = opts.max_iter;
        if (error < opts.tol) {
            res.success = true;
            res.message = "Converged";
            return res;
        }

        res.message = "Maximum iterations reached";
        if (opts.verbose) std::cout << "[FAIL] Max iterations reached." << std::endl;
        return res;
    }

private:
    static Eigen::MatrixXd compute_jacobian(
        const ResidualFunc& F,
        const Eigen::VectorXd& x,
        const Eigen::VectorXd& f_base,
        double eps
    ) {
        int n = x.size();
        int m = f_base.size(); // residuals
        Eigen::MatrixXd J(m, n);

        Eigen::VectorXd x_pert = x;

        for (int j = 0; j < n; ++j) {
            double orig = x_pert[j];
            double h = eps * std::max(1.0, std::abs(orig)); // Relative step size

            x_pert[j] = orig + h;
            Eigen::VectorXd f_plus = F(x_pert);

            // Forward difference reusing f_base (N+1 evals instead of 2N)
            J.col(j) = (f_plus - f_base) / h;

            x_pert[j] = orig; // Restore
        }

        return J;
    }
};

} // namespace Kapital
