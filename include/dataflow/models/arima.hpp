#pragma once

#include "dataflow/models/arma_state_space.hpp"
#include "dataflow/models/iforecaster.hpp"
#include <Eigen/Dense>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace dataflow::models {

class ARIMABuilder; // Forward declaration

/**
 * @class ARIMA
 * @brief Non-seasonal ARIMA(p, d, q) fitted by exact maximum likelihood.
 *
 * The series is differenced d times and a zero-mean ARMA(p, q) is fitted to
 * the result; a constant mean is added when requested (by default only for
 * d == 0). The exact Gaussian likelihood is evaluated with a Kalman filter
 * started from the stationary covariance, the innovation variance is
 * concentrated out, and the AR/MA parameters are kept stationary/invertible
 * through a partial autocorrelation reparameterization.
 */
class ARIMA final : public IForecaster {
public:
	friend class ARIMABuilder;

	struct StartingValues {
		Eigen::VectorXd ar;
		Eigen::VectorXd ma;
	};

	void fit(const core::TimeSeries &ts) override;
	core::Forecast predict(int horizon) override;

	std::string getName() const override {
		return "ARIMA";
	}

	int p() const {
		return p_;
	}
	int d() const {
		return d_;
	}
	int q() const {
		return q_;
	}

	const Eigen::VectorXd &arCoefficients() const {
		return ar_coeffs_;
	}
	const Eigen::VectorXd &maCoefficients() const {
		return ma_coeffs_;
	}
	bool includesMean() const {
		return include_mean_;
	}
	/// Mean of the differenced series (zero when no mean is included).
	double mean() const {
		return mean_;
	}
	/// Maximum likelihood estimate of the innovation variance.
	double sigma2() const {
		return sigma2_;
	}
	/// One-step prediction errors of the differenced series.
	const std::vector<double> &residuals() const {
		return residuals_;
	}
	std::optional<double> logLikelihood() const {
		return log_likelihood_;
	}
	std::optional<double> aic() const {
		return aic_;
	}
	std::optional<double> bic() const {
		return bic_;
	}
	bool optimizerConverged() const {
		return optimizer_converged_;
	}

	// Static utility methods (public for testing)
	static std::vector<double> difference(const std::vector<double> &data, int d);
	/// Last value of each of the d differencing levels, level 0 being the data.
	static std::vector<double> integrationAnchors(const std::vector<double> &data, int d);
	static std::vector<double> integrate(const std::vector<double> &forecast_diff,
	                                     const std::vector<double> &anchors);

	/// Maps unconstrained reals to the coefficients of a stationary AR polynomial.
	static Eigen::VectorXd constrainStationary(const Eigen::VectorXd &unconstrained);
	/// Inverse of constrainStationary; throws std::invalid_argument if not stationary.
	static Eigen::VectorXd unconstrainStationary(const Eigen::VectorXd &constrained);
	static bool isStationary(const Eigen::VectorXd &ar_coeffs);
	static bool isInvertible(const Eigen::VectorXd &ma_coeffs);

	/// Hannan-Rissanen style conditional sum of squares starting values.
	static StartingValues conditionalSumOfSquares(const std::vector<double> &data, int p, int q);

private:
	ARIMA(int p, int d, int q, bool include_mean, int max_iterations);

	double evaluateLogLikelihood(const std::vector<double> &params, const std::vector<double> &standardized) const;
	void unpackParameters(const std::vector<double> &params, Eigen::VectorXd &ar, Eigen::VectorXd &ma,
	                      double &mu) const;
	void fitDegenerate(double center);

	int p_, d_, q_;
	bool include_mean_;
	int max_iterations_;

	Eigen::VectorXd ar_coeffs_;
	Eigen::VectorXd ma_coeffs_;
	double mean_ = 0.0;
	double sigma2_ = 0.0;
	double scale_ = 1.0;
	bool degenerate_ = false;

	std::vector<double> anchors_;
	std::vector<double> residuals_;
	ARMAStateSpace::FilterResult filtered_;

	std::optional<double> log_likelihood_;
	std::optional<double> aic_;
	std::optional<double> bic_;
	bool optimizer_converged_ = false;
	bool is_fitted_ = false;
};

class ARIMABuilder {
public:
	ARIMABuilder &withAR(int p);
	ARIMABuilder &withDifferencing(int d);
	ARIMABuilder &withMA(int q);
	/// Overrides the default of including a mean only when d == 0.
	ARIMABuilder &withIntercept(bool include_intercept);
	ARIMABuilder &withMaxIterations(int max_iterations);
	std::unique_ptr<ARIMA> build();

private:
	int p_ = 0;
	int d_ = 0;
	int q_ = 0;
	std::optional<bool> include_intercept_;
	int max_iterations_ = 200;
};

} // namespace dataflow::models
