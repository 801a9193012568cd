#include "dataflow/models/arima.hpp"
#include "dataflow/optimization/lbfgs_optimizer.hpp"
#include "dataflow/utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <sstream>
#include <utility>

namespace dataflow::models {

namespace {

// Box for every optimizer coordinate. Partial autocorrelations at the bound
// are within 2e-4 of the unit circle.
constexpr double kParamBound = 50.0;
constexpr double kPenalty = 1e10;

double meanOf(const std::vector<double> &data) {
	return std::accumulate(data.begin(), data.end(), 0.0) / static_cast<double>(data.size());
}

// Root mean square around `center`.
double spreadAround(const std::vector<double> &data, double center) {
	double accum = 0.0;
	for (double value : data) {
		const double diff = value - center;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(data.size()));
}

Eigen::MatrixXd lagMatrix(const std::vector<double> &data, int lags, int first_row) {
	const int rows = static_cast<int>(data.size()) - first_row;
	Eigen::MatrixXd x = Eigen::MatrixXd::Zero(std::max(rows, 0), lags);
	for (int row = 0; row < rows; ++row) {
		const int t = first_row + row;
		for (int lag = 1; lag <= lags; ++lag) {
			if (t - lag >= 0) {
				x(row, lag - 1) = data[static_cast<size_t>(t - lag)];
			}
		}
	}
	return x;
}

Eigen::VectorXd tailVector(const std::vector<double> &data, int first_row) {
	const int rows = static_cast<int>(data.size()) - first_row;
	Eigen::VectorXd y(std::max(rows, 0));
	for (int row = 0; row < rows; ++row) {
		y[row] = data[static_cast<size_t>(first_row + row)];
	}
	return y;
}

std::string formatCoefficients(const Eigen::VectorXd &coeffs) {
	std::stringstream ss;
	ss << coeffs.transpose();
	return ss.str();
}

} // namespace

ARIMA::ARIMA(int p, int d, int q, bool include_mean, int max_iterations)
    : p_(p), d_(d), q_(q), include_mean_(include_mean), max_iterations_(max_iterations) {
	if (p < 0 || d < 0 || q < 0) {
		throw std::invalid_argument("ARIMA orders (p, d, q) must be non-negative.");
	}
	if (max_iterations <= 0) {
		throw std::invalid_argument("ARIMA optimizer iterations must be positive.");
	}
}

std::vector<double> ARIMA::difference(const std::vector<double> &data, int d) {
	if (d == 0)
		return data;
	if (data.size() <= static_cast<size_t>(d)) {
		throw std::invalid_argument("Insufficient data length for requested differencing order.");
	}

	std::vector<double> result = data;
	for (int diff_order = 0; diff_order < d; ++diff_order) {
		std::vector<double> temp;
		temp.reserve(result.size() - 1);
		for (size_t i = 1; i < result.size(); ++i) {
			temp.push_back(result[i] - result[i - 1]);
		}
		result = std::move(temp);
	}
	return result;
}

std::vector<double> ARIMA::integrationAnchors(const std::vector<double> &data, int d) {
	if (d == 0)
		return {};
	if (data.size() <= static_cast<size_t>(d)) {
		throw std::invalid_argument("Insufficient data length for requested differencing order.");
	}

	std::vector<double> anchors;
	anchors.reserve(static_cast<size_t>(d));
	std::vector<double> level = data;
	for (int k = 0; k < d; ++k) {
		anchors.push_back(level.back());
		level = difference(level, 1);
	}
	return anchors;
}

std::vector<double> ARIMA::integrate(const std::vector<double> &forecast_diff, const std::vector<double> &anchors) {
	std::vector<double> result = forecast_diff;
	// Undo the innermost difference first.
	for (auto anchor = anchors.rbegin(); anchor != anchors.rend(); ++anchor) {
		double previous = *anchor;
		for (double &value : result) {
			previous += value;
			value = previous;
		}
	}
	return result;
}

Eigen::VectorXd ARIMA::constrainStationary(const Eigen::VectorXd &unconstrained) {
	const int n = static_cast<int>(unconstrained.size());
	if (n == 0) {
		return {};
	}

	const Eigen::VectorXd partial = unconstrained.array() / (1.0 + unconstrained.array().square()).sqrt();

	// Durbin-Levinson recursion from partial autocorrelations.
	Eigen::MatrixXd y = Eigen::MatrixXd::Zero(n, n);
	for (int k = 0; k < n; ++k) {
		for (int i = 0; i < k; ++i) {
			y(k, i) = y(k - 1, i) + partial[k] * y(k - 1, k - i - 1);
		}
		y(k, k) = partial[k];
	}
	return -y.row(n - 1).transpose();
}

Eigen::VectorXd ARIMA::unconstrainStationary(const Eigen::VectorXd &constrained) {
	const int n = static_cast<int>(constrained.size());
	if (n == 0) {
		return {};
	}

	Eigen::MatrixXd y = Eigen::MatrixXd::Zero(n, n);
	y.row(n - 1) = -constrained.transpose();
	for (int k = n - 1; k > 0; --k) {
		const double pivot = y(k, k);
		if (std::abs(pivot) >= 1.0) {
			throw std::invalid_argument("Coefficients do not describe a stationary polynomial.");
		}
		for (int i = 0; i < k; ++i) {
			y(k - 1, i) = (y(k, i) - pivot * y(k, k - i - 1)) / (1.0 - pivot * pivot);
		}
	}

	Eigen::VectorXd result(n);
	for (int k = 0; k < n; ++k) {
		const double partial = y(k, k);
		if (std::abs(partial) >= 1.0) {
			throw std::invalid_argument("Coefficients do not describe a stationary polynomial.");
		}
		result[k] = partial / std::sqrt(1.0 - partial * partial);
	}
	return result;
}

bool ARIMA::isStationary(const Eigen::VectorXd &ar_coeffs) {
	const int p = static_cast<int>(ar_coeffs.size());
	if (p == 0 || ar_coeffs.isZero(0.0)) {
		return true;
	}
	if (!ar_coeffs.allFinite()) {
		return false;
	}

	// Eigenvalues of the companion matrix are the reciprocals of the roots of
	// 1 - phi_1 z - ... - phi_p z^p.
	Eigen::MatrixXd companion = Eigen::MatrixXd::Zero(p, p);
	companion.row(0) = ar_coeffs.transpose();
	for (int i = 1; i < p; ++i) {
		companion(i, i - 1) = 1.0;
	}

	Eigen::EigenSolver<Eigen::MatrixXd> solver(companion, false);
	if (solver.info() != Eigen::Success) {
		return false;
	}
	return solver.eigenvalues().cwiseAbs().maxCoeff() < 1.0;
}

bool ARIMA::isInvertible(const Eigen::VectorXd &ma_coeffs) {
	// 1 + theta_1 z + ... is invertible when -theta is a stationary AR polynomial.
	return isStationary(-ma_coeffs);
}

ARIMA::StartingValues ARIMA::conditionalSumOfSquares(const std::vector<double> &data, int p, int q) {
	if (p < 0 || q < 0 || static_cast<long long>(p) + q > static_cast<long long>(data.size())) {
		throw std::invalid_argument("Starting values need at least p + q observations.");
	}
	StartingValues start;
	start.ar = Eigen::VectorXd::Zero(p);
	start.ma = Eigen::VectorXd::Zero(q);
	if (p == 0 && q == 0) {
		return start;
	}

	const int n = static_cast<int>(data.size());
	const long long long_lags = 2LL * q;
	const long long first_row = std::max(long_lags + q, static_cast<long long>(p));
	if (n - first_row < 1) {
		DATAFLOW_WARN("Too few observations to estimate starting parameters; using zeros.");
		return start;
	}
	const int k = static_cast<int>(long_lags);
	const int r = static_cast<int>(first_row);

	// Long autoregression residuals stand in for the unobserved innovations.
	std::vector<double> innovations;
	if (q > 0) {
		const Eigen::MatrixXd x = lagMatrix(data, k, k);
		const Eigen::VectorXd y = tailVector(data, k);
		const Eigen::VectorXd coeffs = x.completeOrthogonalDecomposition().solve(y);
		const Eigen::VectorXd resid = y - x * coeffs;
		innovations.assign(resid.data(), resid.data() + resid.size());
	}

	const Eigen::VectorXd y = tailVector(data, r);
	Eigen::MatrixXd x(y.size(), p + q);
	if (p > 0) {
		x.leftCols(p) = lagMatrix(data, p, r);
	}
	if (q > 0) {
		// innovations[j] belongs to time k + j.
		x.rightCols(q) = lagMatrix(innovations, q, r - k);
	}

	const Eigen::VectorXd params = x.completeOrthogonalDecomposition().solve(y);
	if (!params.allFinite()) {
		DATAFLOW_WARN("Starting parameter regression produced non-finite values; using zeros.");
		return start;
	}
	start.ar = params.head(p);
	start.ma = params.tail(q);
	return start;
}

void ARIMA::unpackParameters(const std::vector<double> &params, Eigen::VectorXd &ar, Eigen::VectorXd &ma,
                             double &mu) const {
	const Eigen::Map<const Eigen::VectorXd> x(params.data(), static_cast<Eigen::Index>(params.size()));
	ar = p_ > 0 ? constrainStationary(x.head(p_)) : Eigen::VectorXd();
	ma = q_ > 0 ? Eigen::VectorXd(-constrainStationary(x.segment(p_, q_))) : Eigen::VectorXd();
	mu = include_mean_ ? x[p_ + q_] : 0.0;
}

double ARIMA::evaluateLogLikelihood(const std::vector<double> &params,
                                    const std::vector<double> &standardized) const {
	Eigen::VectorXd ar;
	Eigen::VectorXd ma;
	double mu = 0.0;
	unpackParameters(params, ar, ma, mu);

	std::vector<double> centered = standardized;
	for (double &value : centered) {
		value -= mu;
	}

	const ARMAStateSpace model(ar, ma);
	return ARMAStateSpace::concentratedLogLikelihood(model.filter(centered));
}

void ARIMA::fitDegenerate(double center) {
	degenerate_ = true;
	ar_coeffs_ = Eigen::VectorXd::Zero(p_);
	ma_coeffs_ = Eigen::VectorXd::Zero(q_);
	mean_ = center;
	sigma2_ = 0.0;
	scale_ = 1.0;
	log_likelihood_.reset();
	aic_.reset();
	bic_.reset();
	optimizer_converged_ = true;
	DATAFLOW_WARN("ARIMA({},{},{}): differenced series has no variation; using a constant forecast.", p_, d_, q_);
}

void ARIMA::fit(const core::TimeSeries &ts) {
	const std::vector<double> &history = ts.getValues();
	if (history.size() <= static_cast<size_t>(d_)) {
		throw std::invalid_argument("Insufficient data for the given ARIMA order.");
	}

	is_fitted_ = false;
	degenerate_ = false;
	const std::vector<double> working = difference(history, d_);
	anchors_ = integrationAnchors(history, d_);

	const int n = static_cast<int>(working.size());
	const long long parameter_count = static_cast<long long>(p_) + q_ + (include_mean_ ? 1 : 0);
	if (n <= parameter_count) {
		std::ostringstream oss;
		oss << "Insufficient observations after differencing: " << n << " remain for " << parameter_count
		    << " ARMA parameters.";
		throw std::invalid_argument(oss.str());
	}
	// Bounded by n from here on.
	const int k_estimated = static_cast<int>(parameter_count);

	// Work on a standardized copy so the optimizer box is scale free.
	const double center = include_mean_ ? meanOf(working) : 0.0;
	const double scale = spreadAround(working, center);
	if (!std::isfinite(scale)) {
		throw std::runtime_error("Series variance is not finite.");
	}
	residuals_.assign(working.size(), 0.0);
	if (scale == 0.0) {
		fitDegenerate(center);
		is_fitted_ = true;
		return;
	}
	scale_ = scale;

	std::vector<double> standardized;
	standardized.reserve(working.size());
	for (double value : working) {
		standardized.push_back((value - center) / scale);
	}

	StartingValues start = conditionalSumOfSquares(standardized, p_, q_);
	if (!isStationary(start.ar)) {
		DATAFLOW_WARN("Non-stationary starting autoregressive parameters found. Using zeros as starting parameters.");
		start.ar.setZero();
	}
	if (!isInvertible(start.ma)) {
		DATAFLOW_WARN("Non-invertible starting MA parameters found. Using zeros as starting parameters.");
		start.ma.setZero();
	}

	std::vector<double> x0;
	x0.reserve(static_cast<size_t>(k_estimated));
	const Eigen::VectorXd ar_free = unconstrainStationary(start.ar);
	const Eigen::VectorXd ma_free = unconstrainStationary(-start.ma);
	x0.insert(x0.end(), ar_free.data(), ar_free.data() + ar_free.size());
	x0.insert(x0.end(), ma_free.data(), ma_free.data() + ma_free.size());
	if (include_mean_) {
		x0.push_back(0.0);
	}

	std::vector<double> best = x0;
	if (k_estimated > 0) {
		const double nobs = static_cast<double>(n);
		auto negative_loglik = [&](const std::vector<double> &params) {
			try {
				const double loglik = evaluateLogLikelihood(params, standardized);
				return std::isfinite(loglik) ? -loglik / nobs : kPenalty;
			} catch (const std::runtime_error &e) {
				DATAFLOW_TRACE("Likelihood evaluation failed: {}", e.what());
				return kPenalty;
			}
		};

		std::vector<double> lower(x0.size(), -kParamBound);
		std::vector<double> upper(x0.size(), kParamBound);
		const double step_scale = std::cbrt(std::numeric_limits<double>::epsilon());

		auto objective = [&](const std::vector<double> &params, std::vector<double> &grad) {
			const double fx = negative_loglik(params);
			std::vector<double> probe = params;
			for (size_t i = 0; i < params.size(); ++i) {
				const double h = step_scale * std::max(1.0, std::abs(params[i]));
				const double hi = std::min(params[i] + h, upper[i]);
				const double lo = std::max(params[i] - h, lower[i]);
				probe[i] = hi;
				const double f_hi = negative_loglik(probe);
				probe[i] = lo;
				const double f_lo = negative_loglik(probe);
				probe[i] = params[i];
				grad[i] = (f_hi - f_lo) / (hi - lo);
			}
			return fx;
		};

		optimization::LBFGSOptimizer::Options options;
		options.max_iterations = max_iterations_;
		const auto result = optimization::LBFGSOptimizer::minimize(objective, x0, lower, upper, options);
		if (!std::isfinite(result.fx) || result.fx >= kPenalty) {
			throw std::runtime_error("Maximum likelihood optimization failed: " + result.message);
		}
		optimizer_converged_ = result.converged;
		if (!optimizer_converged_) {
			DATAFLOW_WARN("ARIMA({},{},{}) optimizer did not converge ({}); using best parameters found.", p_, d_, q_,
			              result.message);
		}
		best = result.x;
	} else {
		optimizer_converged_ = true;
	}

	double mu = 0.0;
	unpackParameters(best, ar_coeffs_, ma_coeffs_, mu);
	mean_ = center + scale * mu;

	std::vector<double> centered = standardized;
	for (double &value : centered) {
		value -= mu;
	}
	const ARMAStateSpace model(ar_coeffs_, ma_coeffs_);
	filtered_ = model.filter(centered);

	for (size_t t = 0; t < filtered_.innovations.size(); ++t) {
		residuals_[t] = filtered_.innovations[t] * scale;
	}
	sigma2_ = ARMAStateSpace::innovationVariance(filtered_) * scale * scale;

	// Likelihood of the unscaled data.
	const double loglik = ARMAStateSpace::concentratedLogLikelihood(filtered_) - static_cast<double>(n) * std::log(scale);
	if (std::isfinite(loglik)) {
		const int k = k_estimated + 1;
		log_likelihood_ = loglik;
		aic_ = -2.0 * loglik + 2.0 * static_cast<double>(k);
		bic_ = -2.0 * loglik + static_cast<double>(k) * std::log(static_cast<double>(n));
	} else {
		log_likelihood_.reset();
		aic_.reset();
		bic_.reset();
	}

	is_fitted_ = true;

	DATAFLOW_INFO("ARIMA({},{},{}) model fitted on {} observations.", p_, d_, q_, history.size());
	if (p_ > 0) {
		DATAFLOW_DEBUG("AR coeffs: [{}]", formatCoefficients(ar_coeffs_));
	}
	if (q_ > 0) {
		DATAFLOW_DEBUG("MA coeffs: [{}]", formatCoefficients(ma_coeffs_));
	}
	if (include_mean_) {
		DATAFLOW_DEBUG("Mean: {}", mean_);
	}
	DATAFLOW_DEBUG("Innovation variance: {}", sigma2_);
	if (aic_ && bic_) {
		DATAFLOW_INFO("ARIMA diagnostics: log-likelihood = {:.6f}, AIC = {:.6f}, BIC = {:.6f}", *log_likelihood_,
		              *aic_, *bic_);
	}
}

core::Forecast ARIMA::predict(int horizon) {
	if (!is_fitted_) {
		throw std::logic_error("Predict called before fit.");
	}
	if (horizon <= 0) {
		return {};
	}

	std::vector<double> diff_forecast;
	if (degenerate_) {
		diff_forecast.assign(static_cast<size_t>(horizon), mean_);
	} else {
		const ARMAStateSpace model(ar_coeffs_, ma_coeffs_);
		diff_forecast = model.forecast(filtered_, horizon);
		for (double &value : diff_forecast) {
			value = mean_ + scale_ * value;
		}
	}

	core::Forecast forecast;
	forecast.primary() = integrate(diff_forecast, anchors_);
	for (double value : forecast.primary()) {
		if (!std::isfinite(value)) {
			throw std::runtime_error("Forecast contains non-finite values.");
		}
	}
	return forecast;
}

ARIMABuilder &ARIMABuilder::withAR(int p) {
	p_ = p;
	return *this;
}

ARIMABuilder &ARIMABuilder::withDifferencing(int d) {
	d_ = d;
	return *this;
}

ARIMABuilder &ARIMABuilder::withMA(int q) {
	q_ = q;
	return *this;
}

ARIMABuilder &ARIMABuilder::withIntercept(bool include_intercept) {
	include_intercept_ = include_intercept;
	return *this;
}

ARIMABuilder &ARIMABuilder::withMaxIterations(int max_iterations) {
	max_iterations_ = max_iterations;
	return *this;
}

std::unique_ptr<ARIMA> ARIMABuilder::build() {
	const bool include_mean = include_intercept_.value_or(d_ == 0);
	return std::unique_ptr<ARIMA>(new ARIMA(p_, d_, q_, include_mean, max_iterations_));
}

} // namespace dataflow::models
