#pragma once

#include <functional>
#include <string>
#include <vector>

namespace dataflow::optimization {

/**
 * @brief L-BFGS optimizer for bounded optimization problems
 *
 * Wrapper around the LBFGS++ library used for maximum likelihood estimation.
 * Supports box constraints on every parameter.
 */
class LBFGSOptimizer {
public:
	using Objective = std::function<double(const std::vector<double> &, std::vector<double> &)>;

	struct Result {
		std::vector<double> x;     // Best parameters found
		double fx = 0.0;           // Objective value at x
		int iterations = 0;        // Number of iterations
		int evaluations = 0;       // Number of objective evaluations
		bool converged = false;    // Whether the solver reported convergence
		std::string message;       // Status message
	};

	struct Options {
		int max_iterations;
		double epsilon;    // Gradient convergence tolerance
		int m;             // Number of corrections (L-BFGS memory)
		double ftol;       // Sufficient decrease for the line search
		int max_linesearch;

		Options() : max_iterations(200), epsilon(1e-6), m(10), ftol(1e-4), max_linesearch(40) {
		}
	};

	/**
	 * @brief Minimize objective function with box constraints
	 *
	 * The solver may stop early when the line search cannot make progress. In
	 * that case the best point evaluated so far is returned with
	 * `converged == false` and the solver's message.
	 *
	 * @param objective Function that computes f(x) and writes the gradient g(x)
	 * @param x0 Initial parameters
	 * @param lower Lower bounds for each parameter
	 * @param upper Upper bounds for each parameter
	 * @param options Optimization options
	 * @throws std::invalid_argument If dimensions of x0 and the bounds differ.
	 */
	static Result minimize(const Objective &objective, const std::vector<double> &x0,
	                       const std::vector<double> &lower, const std::vector<double> &upper,
	                       const Options &options = Options());

private:
	// Project parameters onto feasible region [lower, upper]
	static void projectBounds(std::vector<double> &x, const std::vector<double> &lower,
	                          const std::vector<double> &upper);
};

} // namespace dataflow::optimization
