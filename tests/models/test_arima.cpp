#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "dataflow/models/arima.hpp"
#include "common/series_helpers.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using dataflow::models::ARIMA;
using dataflow::models::ARIMABuilder;

namespace {

Eigen::VectorXd vec(std::initializer_list<double> values) {
	Eigen::VectorXd v(static_cast<Eigen::Index>(values.size()));
	Eigen::Index i = 0;
	for (double value : values) {
		v[i++] = value;
	}
	return v;
}

} // namespace

TEST_CASE("ARIMA builder enforces valid orders", "[models][arima][builder]") {
	REQUIRE_NOTHROW(ARIMABuilder().build());

	ARIMABuilder invalid_ar;
	invalid_ar.withAR(-1);
	REQUIRE_THROWS_AS(invalid_ar.build(), std::invalid_argument);

	REQUIRE_THROWS_AS(ARIMABuilder().withDifferencing(-1).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ARIMABuilder().withMA(-2).build(), std::invalid_argument);
	REQUIRE_THROWS_AS(ARIMABuilder().withAR(1).withMaxIterations(0).build(), std::invalid_argument);
}

TEST_CASE("ARIMA includes a mean only without differencing by default", "[models][arima][builder]") {
	REQUIRE(ARIMABuilder().withAR(1).build()->includesMean());
	REQUIRE_FALSE(ARIMABuilder().withAR(1).withDifferencing(1).build()->includesMean());
	REQUIRE(ARIMABuilder().withAR(1).withDifferencing(1).withIntercept(true).build()->includesMean());
	REQUIRE_FALSE(ARIMABuilder().withAR(1).withIntercept(false).build()->includesMean());
}

TEST_CASE("ARIMA differencing and integration are inverse operations", "[models][arima][differencing]") {
	const std::vector<double> squares = {1.0, 4.0, 9.0, 16.0};

	REQUIRE(ARIMA::difference(squares, 0) == squares);
	REQUIRE(ARIMA::difference(squares, 1) == std::vector<double> {3.0, 5.0, 7.0});
	REQUIRE(ARIMA::difference(squares, 2) == std::vector<double> {2.0, 2.0});
	REQUIRE_THROWS_AS(ARIMA::difference(squares, 4), std::invalid_argument);

	const auto anchors = ARIMA::integrationAnchors(squares, 2);
	REQUIRE(anchors == std::vector<double> {16.0, 7.0});

	// Constant second differences continue the sequence of squares.
	const auto restored = ARIMA::integrate({2.0, 2.0}, anchors);
	REQUIRE(restored.size() == 2);
	REQUIRE(restored[0] == Catch::Approx(25.0));
	REQUIRE(restored[1] == Catch::Approx(36.0));

	REQUIRE(ARIMA::integrate({1.5}, {}) == std::vector<double> {1.5});
}

TEST_CASE("ARIMA stationarity transforms round trip", "[models][arima][transform]") {
	const auto unconstrained = vec({0.3, -1.2, 2.0});
	const auto constrained = ARIMA::constrainStationary(unconstrained);

	REQUIRE(constrained.size() == 3);
	REQUIRE(ARIMA::isStationary(constrained));

	const auto recovered = ARIMA::unconstrainStationary(constrained);
	for (Eigen::Index i = 0; i < unconstrained.size(); ++i) {
		REQUIRE(recovered[i] == Catch::Approx(unconstrained[i]).margin(1e-9));
	}

	REQUIRE(ARIMA::constrainStationary(Eigen::VectorXd()).size() == 0);
	REQUIRE_THROWS_AS(ARIMA::unconstrainStationary(vec({1.5})), std::invalid_argument);
}

TEST_CASE("ARIMA detects stationarity and invertibility", "[models][arima][transform]") {
	REQUIRE(ARIMA::isStationary(Eigen::VectorXd()));
	REQUIRE(ARIMA::isStationary(vec({0.5})));
	REQUIRE(ARIMA::isStationary(vec({0.5, 0.3})));
	REQUIRE_FALSE(ARIMA::isStationary(vec({1.2})));
	REQUIRE_FALSE(ARIMA::isStationary(vec({0.7, 0.5})));

	REQUIRE(ARIMA::isInvertible(vec({-0.4})));
	REQUIRE(ARIMA::isInvertible(vec({0.9})));
	REQUIRE_FALSE(ARIMA::isInvertible(vec({1.5})));
}

TEST_CASE("ARIMA starting values recover an AR(1) coefficient", "[models][arima][css]") {
	const auto data = tests::helpers::generateAR1(0.7, 300);

	const auto start = ARIMA::conditionalSumOfSquares(data, 1, 0);
	REQUIRE(start.ar.size() == 1);
	REQUIRE(start.ma.size() == 0);
	REQUIRE(start.ar[0] == Catch::Approx(0.7).margin(0.1));

	const auto mixed = ARIMA::conditionalSumOfSquares(data, 1, 1);
	REQUIRE(mixed.ar.size() == 1);
	REQUIRE(mixed.ma.size() == 1);
	REQUIRE(std::isfinite(mixed.ar[0]));
	REQUIRE(std::isfinite(mixed.ma[0]));

	const auto too_short = ARIMA::conditionalSumOfSquares({1.0, 2.0, 3.0}, 1, 2);
	REQUIRE(too_short.ar.size() == 1);
	REQUIRE(too_short.ma.size() == 2);
	REQUIRE(too_short.ar.isZero(0.0));
	REQUIRE(too_short.ma.isZero(0.0));

	REQUIRE_THROWS_AS(ARIMA::conditionalSumOfSquares(data, 2147483647, 2147483647), std::invalid_argument);
	REQUIRE_THROWS_AS(ARIMA::conditionalSumOfSquares({1.0, 2.0}, 1, 2), std::invalid_argument);
}

TEST_CASE("ARIMA fit estimates AR(1) coefficient", "[models][arima][fit]") {
	const double phi = 0.7;
	const auto data = tests::helpers::generateAR1(phi, 300);
	auto ts = tests::helpers::makeSeries(data);

	auto model = ARIMABuilder().withAR(1).withDifferencing(0).withMA(0).build();
	model->fit(ts);

	REQUIRE(model->getName() == "ARIMA");
	REQUIRE(model->p() == 1);
	REQUIRE(model->d() == 0);
	REQUIRE(model->q() == 0);

	REQUIRE(model->arCoefficients().size() == 1);
	REQUIRE(model->arCoefficients()[0] == Catch::Approx(phi).margin(0.1));
	REQUIRE(model->includesMean());
	REQUIRE(model->mean() == Catch::Approx(0.0).margin(0.1));
	REQUIRE(model->sigma2() > 0.0);
	REQUIRE(model->residuals().size() == data.size());

	REQUIRE(model->logLikelihood().has_value());
	REQUIRE(model->aic().has_value());
	REQUIRE(model->bic().has_value());
	REQUIRE(*model->bic() > *model->aic());

	const auto forecast = model->predict(3);
	REQUIRE(forecast.primary().size() == 3);
	for (double value : forecast.primary()) {
		REQUIRE(std::isfinite(value));
	}
}

TEST_CASE("ARIMA(2,1,3) forecasts the trending sample", "[models][arima][forecast]") {
	auto ts = tests::helpers::makeSeries(tests::helpers::trendingSample());
	auto model = ARIMABuilder().withAR(2).withDifferencing(1).withMA(3).build();
	model->fit(ts);

	const auto forecast = model->predict(5);
	const std::vector<double> expected = {25.703259987406778, 27.083762122139053, 27.88086961703199,
	                                      29.12766641446821, 29.994117400760047};

	REQUIRE(forecast.primary().size() == expected.size());
	for (std::size_t i = 0; i < expected.size(); ++i) {
		REQUIRE(forecast.primary()[i] == Catch::Approx(expected[i]).epsilon(0.01));
	}
}

TEST_CASE("ARIMA fitting is deterministic", "[models][arima][forecast]") {
	const auto data = tests::helpers::trendingSample();

	auto first = ARIMABuilder().withAR(1).withDifferencing(1).withMA(1).build();
	first->fit(tests::helpers::makeSeries(data));
	auto second = ARIMABuilder().withAR(1).withDifferencing(1).withMA(1).build();
	second->fit(tests::helpers::makeSeries(data));

	REQUIRE(first->predict(10).primary() == second->predict(10).primary());
}

TEST_CASE("ARIMA(0,1,0) repeats the last observation", "[models][arima][forecast]") {
	const auto data = tests::helpers::trendingSample();
	auto model = ARIMABuilder().withDifferencing(1).build();
	model->fit(tests::helpers::makeSeries(data));

	// No free parameters, so there is nothing to optimize.
	REQUIRE(model->optimizerConverged());
	REQUIRE_FALSE(model->includesMean());

	const auto forecast = model->predict(4);
	REQUIRE(forecast.primary().size() == 4);
	for (double value : forecast.primary()) {
		REQUIRE(value == Catch::Approx(data.back()));
	}
}

TEST_CASE("ARIMA forecasts a constant series as that constant", "[models][arima][forecast]") {
	const std::vector<double> data(12, 7.0);
	auto model = ARIMABuilder().withAR(1).withMA(1).build();
	model->fit(tests::helpers::makeSeries(data));
	REQUIRE(model->optimizerConverged());
	REQUIRE(model->mean() == Catch::Approx(7.0));

	const auto forecast = model->predict(3);
	REQUIRE(forecast.primary().size() == 3);
	for (double value : forecast.primary()) {
		REQUIRE(value == Catch::Approx(7.0));
	}
}

TEST_CASE("ARIMA rejects misuse", "[models][arima][validation]") {
	auto unfitted = ARIMABuilder().withAR(1).build();
	REQUIRE_THROWS_AS(unfitted->predict(3), std::logic_error);

	auto overfit = ARIMABuilder().withAR(3).withDifferencing(1).withMA(3).build();
	REQUIRE_THROWS_AS(overfit->fit(tests::helpers::makeSeries({1.0, 2.0, 4.0, 3.0, 5.0})), std::invalid_argument);

	auto oversized = ARIMABuilder().withAR(2147483647).withDifferencing(1).withMA(2147483647).build();
	try {
		oversized->fit(tests::helpers::makeSeries(tests::helpers::trendingSample()));
		FAIL("expected std::invalid_argument");
	} catch (const std::invalid_argument &e) {
		REQUIRE(std::string(e.what()) ==
		        "Insufficient observations after differencing: 11 remain for 4294967294 ARMA parameters.");
	}

	auto too_much_differencing = ARIMABuilder().withDifferencing(5).build();
	REQUIRE_THROWS_AS(too_much_differencing->fit(tests::helpers::makeSeries({1.0, 2.0, 3.0})),
	                  std::invalid_argument);

	auto model = ARIMABuilder().withAR(1).build();
	model->fit(tests::helpers::makeSeries(tests::helpers::generateAR1(0.5, 50)));
	REQUIRE(model->predict(0).empty());
}
