#include "dataflow/models/arma_state_space.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace dataflow::models {

namespace {

constexpr double kLog2Pi = 1.8378770664093453;

} // namespace

ARMAStateSpace::ARMAStateSpace(const Eigen::VectorXd &ar, const Eigen::VectorXd &ma) {
	const int p = static_cast<int>(ar.size());
	const int q = static_cast<int>(ma.size());
	const int r = std::max(p, q + 1);

	transition_ = Eigen::MatrixXd::Zero(r, r);
	for (int i = 0; i < p; ++i) {
		transition_(i, 0) = ar[i];
	}
	for (int i = 0; i + 1 < r; ++i) {
		transition_(i, i + 1) = 1.0;
	}

	selection_ = Eigen::VectorXd::Zero(r);
	selection_[0] = 1.0;
	for (int i = 0; i < q; ++i) {
		selection_[i + 1] = ma[i];
	}
}

Eigen::MatrixXd ARMAStateSpace::stationaryCovariance() const {
	const int r = stateDimension();
	const int n = r * r;

	// vec(P) = (I - T kron T)^{-1} vec(R R'), column-major vec.
	Eigen::MatrixXd system = Eigen::MatrixXd::Identity(n, n);
	for (int i = 0; i < r; ++i) {
		for (int j = 0; j < r; ++j) {
			const double t_ij = transition_(i, j);
			if (t_ij == 0.0) {
				continue;
			}
			system.block(i * r, j * r, r, r) -= t_ij * transition_;
		}
	}

	const Eigen::MatrixXd rr = selection_ * selection_.transpose();
	const Eigen::VectorXd rhs = Eigen::Map<const Eigen::VectorXd>(rr.data(), n);

	Eigen::FullPivLU<Eigen::MatrixXd> lu(system);
	if (!lu.isInvertible()) {
		throw std::runtime_error("Non-stationary ARMA process: stationary covariance is undefined.");
	}
	const Eigen::VectorXd solution = lu.solve(rhs);

	Eigen::MatrixXd covariance = Eigen::Map<const Eigen::MatrixXd>(solution.data(), r, r);
	covariance = 0.5 * (covariance + covariance.transpose());
	if (!covariance.allFinite() || covariance(0, 0) <= 0.0) {
		throw std::runtime_error("Non-stationary ARMA process: stationary covariance is undefined.");
	}
	return covariance;
}

ARMAStateSpace::FilterResult ARMAStateSpace::filter(const std::vector<double> &data) const {
	const int r = stateDimension();
	const Eigen::MatrixXd rr = selection_ * selection_.transpose();

	Eigen::VectorXd state = Eigen::VectorXd::Zero(r);
	Eigen::MatrixXd covariance = stationaryCovariance();

	FilterResult result;
	result.nobs = data.size();
	result.innovations.reserve(data.size());

	for (const double observation : data) {
		const double innovation = observation - state[0];
		const double variance = covariance(0, 0);
		if (!(variance > 0.0) || !std::isfinite(variance)) {
			throw std::runtime_error("Kalman filter produced a non-positive prediction variance.");
		}

		result.sum_squares += innovation * innovation / variance;
		result.sum_log_variance += std::log(variance);
		result.innovations.push_back(innovation);

		// Update, then predict.
		const Eigen::VectorXd gain = covariance.col(0) / variance;
		const Eigen::RowVectorXd first_row = covariance.row(0);
		state += gain * innovation;
		covariance -= gain * first_row;

		state = transition_ * state;
		covariance = transition_ * covariance * transition_.transpose() + rr;
	}

	result.next_state = state;
	return result;
}

std::vector<double> ARMAStateSpace::forecast(const FilterResult &filtered, int horizon) const {
	std::vector<double> values;
	if (horizon <= 0) {
		return values;
	}
	values.reserve(static_cast<size_t>(horizon));

	Eigen::VectorXd state = filtered.next_state;
	for (int h = 0; h < horizon; ++h) {
		values.push_back(state[0]);
		state = transition_ * state;
	}
	return values;
}

double ARMAStateSpace::innovationVariance(const FilterResult &filtered) {
	if (filtered.nobs == 0) {
		return 0.0;
	}
	return filtered.sum_squares / static_cast<double>(filtered.nobs);
}

double ARMAStateSpace::concentratedLogLikelihood(const FilterResult &filtered) {
	const double n = static_cast<double>(filtered.nobs);
	const double sigma2 = innovationVariance(filtered);
	return -0.5 * n * (kLog2Pi + 1.0 + std::log(sigma2)) - 0.5 * filtered.sum_log_variance;
}

} // namespace dataflow::models
