#pragma once

#include <Eigen/Dense>
#include <cstddef>
#include <vector>

namespace dataflow::models {

/**
 * @class ARMAStateSpace
 * @brief Harvey state-space form of a zero-mean ARMA(p, q) process.
 *
 * With r = max(p, q + 1) the state evolves as a_{t+1} = T a_t + R e_t and the
 * observation is the first state element. T carries the AR coefficients in its
 * first column and an identity on the super-diagonal; R is (1, theta_1, ...,
 * theta_{r-1}). All quantities are expressed for unit innovation variance so
 * that the variance can be concentrated out of the likelihood.
 */
class ARMAStateSpace {
public:
	struct FilterResult {
		/// Sum of squared standardized innovations v_t^2 / F_t.
		double sum_squares = 0.0;
		/// Sum of log prediction variances log F_t.
		double sum_log_variance = 0.0;
		std::size_t nobs = 0;
		/// One-step innovations v_t.
		std::vector<double> innovations;
		/// Predicted state a_{n+1|n} after the last observation.
		Eigen::VectorXd next_state;
	};

	ARMAStateSpace(const Eigen::VectorXd &ar, const Eigen::VectorXd &ma);

	int stateDimension() const {
		return static_cast<int>(transition_.rows());
	}

	const Eigen::MatrixXd &transition() const {
		return transition_;
	}

	const Eigen::VectorXd &selection() const {
		return selection_;
	}

	/**
	 * @brief Unconditional state covariance, the solution of P = T P T' + R R'.
	 * @throws std::runtime_error If the process is not stationary.
	 */
	Eigen::MatrixXd stationaryCovariance() const;

	/**
	 * @brief Runs the Kalman filter from the stationary initialization.
	 * @throws std::runtime_error On a non-positive or non-finite prediction variance.
	 */
	FilterResult filter(const std::vector<double> &data) const;

	/// Point forecasts of the observation given the filtered state.
	std::vector<double> forecast(const FilterResult &filtered, int horizon) const;

	/// Gaussian log-likelihood with the innovation variance at its maximum.
	static double concentratedLogLikelihood(const FilterResult &filtered);

	/// Maximum likelihood estimate of the innovation variance.
	static double innovationVariance(const FilterResult &filtered);

private:
	Eigen::MatrixXd transition_;
	Eigen::VectorXd selection_;
};

} // namespace dataflow::models
