#pragma once

#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace dataflow::core {

/**
 * @class TimeSeries
 * @brief An equally spaced univariate series.
 *
 * Observations carry no timestamps; position in the vector is the time index.
 * All values are required to be finite.
 */
class TimeSeries {
public:
	using Value = double;
	using Values = std::vector<Value>;

	TimeSeries() = default;

	/**
	 * @brief Constructs a series from ordered observations.
	 * @throws std::invalid_argument If any observation is NaN or infinite.
	 */
	explicit TimeSeries(Values values) : values_(std::move(values)) {
		for (const auto value : values_) {
			if (!std::isfinite(value)) {
				throw std::invalid_argument("TimeSeries contains non-finite values.");
			}
		}
	}

	std::size_t size() const {
		return values_.size();
	}

	bool isEmpty() const {
		return values_.empty();
	}

	const Values &getValues() const {
		return values_;
	}

private:
	Values values_;
};

} // namespace dataflow::core
