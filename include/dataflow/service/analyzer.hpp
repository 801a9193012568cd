#pragma once

#include "dataflow/service/schema.hpp"
#include <cstddef>
#include <vector>

namespace dataflow::service {

/**
 * @class Analyzer
 * @brief The operations behind each endpoint, independent of the transport.
 *
 * Stateless: every call builds its own models and reductions, so a single
 * instance can serve concurrent requests.
 */
class Analyzer {
public:
	/// Shortest series accepted for ARIMA, whatever the order.
	static constexpr std::size_t kMinArimaValues = 10;

	ServiceInfo info() const;
	HealthStatus health() const;

	/**
	 * @brief Groups items by category and summarizes each group.
	 * @throws ValidationError If @p items is empty.
	 */
	CategoryAnalysis analyze(const std::vector<DataItem> &items) const;

	/**
	 * @brief Mean, median, population standard deviation and count.
	 * @throws ValidationError If @p values is empty.
	 */
	DataStats stats(const std::vector<double> &values) const;

	/**
	 * @brief Fits ARIMA(p, d, q) to the request values and forecasts @c steps ahead.
	 * @throws ValidationError If fewer than kMinArimaValues values are given.
	 * @throws ModelFittingError If the model cannot be fitted or forecast.
	 */
	ArimaForecast forecastArima(const ArimaRequest &request) const;
};

} // namespace dataflow::service
