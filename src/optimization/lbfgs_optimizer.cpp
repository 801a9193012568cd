#include "dataflow/optimization/lbfgs_optimizer.hpp"
#include "dataflow/utils/logging.hpp"
#include <Eigen/Core>
#include <LBFGSB.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace dataflow::optimization {

using namespace LBFGSpp;

void LBFGSOptimizer::projectBounds(std::vector<double> &x, const std::vector<double> &lower,
                                   const std::vector<double> &upper) {
	for (size_t i = 0; i < x.size(); ++i) {
		x[i] = std::max(lower[i], std::min(x[i], upper[i]));
	}
}

LBFGSOptimizer::Result LBFGSOptimizer::minimize(const Objective &objective, const std::vector<double> &x0,
                                                const std::vector<double> &lower,
                                                const std::vector<double> &upper, const Options &options) {
	if (x0.empty()) {
		throw std::invalid_argument("LBFGS requires at least one parameter.");
	}
	if (lower.size() != x0.size() || upper.size() != x0.size()) {
		throw std::invalid_argument("LBFGS bounds must match the number of parameters.");
	}

	Result result;
	const int n = static_cast<int>(x0.size());

	std::vector<double> start = x0;
	projectBounds(start, lower, upper);

	Eigen::VectorXd x = Eigen::VectorXd::Map(start.data(), n);
	const Eigen::VectorXd lb = Eigen::VectorXd::Map(lower.data(), n);
	const Eigen::VectorXd ub = Eigen::VectorXd::Map(upper.data(), n);

	LBFGSBParam<double> param;
	param.max_iterations = options.max_iterations;
	param.epsilon = options.epsilon;
	param.epsilon_rel = options.epsilon;
	param.m = options.m;
	param.ftol = options.ftol;
	param.wolfe = 0.9;
	param.max_linesearch = options.max_linesearch;

	LBFGSBSolver<double> solver(param);

	// The line search evaluates trial points in place, so the solver's x is not
	// reliable after a failure. Keep the best point seen instead.
	result.fx = std::numeric_limits<double>::infinity();
	result.x = start;

	std::vector<double> x_vec(static_cast<size_t>(n));
	std::vector<double> grad_vec(static_cast<size_t>(n));
	auto eigen_objective = [&](const Eigen::VectorXd &x_eigen, Eigen::VectorXd &grad_eigen) {
		for (int i = 0; i < n; ++i) {
			x_vec[static_cast<size_t>(i)] = x_eigen[i];
		}
		std::fill(grad_vec.begin(), grad_vec.end(), 0.0);

		const double fx = objective(x_vec, grad_vec);
		++result.evaluations;

		for (int i = 0; i < n; ++i) {
			grad_eigen[i] = grad_vec[static_cast<size_t>(i)];
		}
		if (std::isfinite(fx) && fx < result.fx) {
			result.fx = fx;
			result.x = x_vec;
		}
		return fx;
	};

	double fx = 0.0;
	try {
		result.iterations = solver.minimize(eigen_objective, x, fx, lb, ub);
		result.converged = result.iterations < options.max_iterations;
		result.message = result.converged ? "Converged" : "Maximum number of iterations reached";
	} catch (const std::exception &e) {
		result.converged = false;
		result.message = std::string("Failed: ") + e.what();
	}

	DATAFLOW_DEBUG("LBFGS finished after {} iterations ({} evaluations), f = {}: {}", result.iterations,
	               result.evaluations, result.fx, result.message);

	projectBounds(result.x, lower, upper);
	return result;
}

} // namespace dataflow::optimization
