#pragma once

#include <cstddef>
#include <vector>

namespace dataflow::core {

/**
 * @struct Forecast
 * @brief Holds the point predictions of a forecasting operation.
 */
struct Forecast {
	using Value = double;
	using Series = std::vector<Value>;

	/// Point forecasts, one per future step.
	Series point;

	Series &primary() {
		return point;
	}

	const Series &primary() const {
		return point;
	}

	/// Returns whether the forecast contains any values.
	bool empty() const {
		return point.empty();
	}

	/// Returns the forecast horizon (number of steps).
	std::size_t horizon() const {
		return point.size();
	}
};

} // namespace dataflow::core
