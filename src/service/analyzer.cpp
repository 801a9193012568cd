#include "dataflow/service/analyzer.hpp"

#include "dataflow/core/time_series.hpp"
#include "dataflow/models/arima.hpp"
#include "dataflow/service/errors.hpp"
#include "dataflow/utils/descriptive.hpp"
#include "dataflow/utils/logging.hpp"
#include <exception>
#include <string>

namespace dataflow::service {

ServiceInfo Analyzer::info() const {
	return ServiceInfo {"Welcome to Data Flow Analyzer API",
	                    "1.0.0",
	                    {"/", "/health", "/analyze", "/stats", "/forecast/arima"}};
}

HealthStatus Analyzer::health() const {
	return HealthStatus {"healthy"};
}

CategoryAnalysis Analyzer::analyze(const std::vector<DataItem> &items) const {
	if (items.empty()) {
		throw ValidationError("At least one data item is required.");
	}

	std::vector<std::string> categories;
	std::vector<double> values;
	categories.reserve(items.size());
	values.reserve(items.size());
	for (const auto &item : items) {
		categories.push_back(item.category);
		values.push_back(item.value);
	}

	CategoryAnalysis analysis;
	analysis.groups = utils::Descriptive::summarizeBy(categories, values);
	DATAFLOW_DEBUG("Analyzed {} items in {} categories", items.size(), analysis.groups.size());
	return analysis;
}

DataStats Analyzer::stats(const std::vector<double> &values) const {
	if (values.empty()) {
		throw ValidationError("At least one value is required.");
	}
	const auto summary = utils::Descriptive::summarize(values);
	return DataStats {summary.mean, summary.median, summary.stddev, summary.count};
}

ArimaForecast Analyzer::forecastArima(const ArimaRequest &request) const {
	if (request.values.size() < kMinArimaValues) {
		throw ValidationError("At least 10 values are required for ARIMA.", ValidationError::Reason::Precondition);
	}

	const auto &order = request.order;
	DATAFLOW_INFO("ARIMA({},{},{}) requested on {} values, {} steps", order.p, order.d, order.q,
	              request.values.size(), request.steps);

	ArimaForecast result;
	result.model_order = order;
	try {
		const core::TimeSeries series(request.values);
		auto model = models::ARIMABuilder().withAR(order.p).withDifferencing(order.d).withMA(order.q).build();
		model->fit(series);
		DATAFLOW_DEBUG("{}({},{},{}) fitted, optimizer converged: {}", model->getName(), model->p(), model->d(),
		               model->q(), model->optimizerConverged());
		result.forecast = model->predict(request.steps).primary();
	} catch (const std::exception &e) {
		DATAFLOW_WARN("ARIMA({},{},{}) failed: {}", order.p, order.d, order.q, e.what());
		throw ModelFittingError(e.what());
	}

	if (result.forecast.size() != static_cast<std::size_t>(request.steps)) {
		throw ModelFittingError("expected " + std::to_string(request.steps) + " forecast values, got " +
		                        std::to_string(result.forecast.size()));
	}
	return result;
}

} // namespace dataflow::service
