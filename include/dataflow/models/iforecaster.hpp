#pragma once

#include "dataflow/core/forecast.hpp"
#include "dataflow/core/time_series.hpp"
#include <string>

namespace dataflow::models {

/**
 * @class IForecaster
 * @brief An interface for forecasting models.
 *
 * Models are fitted once on a series and may then be asked for any number of
 * future steps.
 */
class IForecaster {
public:
	virtual ~IForecaster() = default;

	/**
	 * @brief Fits the model to the provided time series data.
	 * @param ts The time series data to train the model on.
	 */
	virtual void fit(const core::TimeSeries &ts) = 0;

	/**
	 * @brief Generates forecasts for a specified number of steps into the future.
	 * @param horizon The number of future time steps to predict.
	 * @return A Forecast object containing the point predictions.
	 */
	virtual core::Forecast predict(int horizon) = 0;

	/**
	 * @brief Gets the name of the forecasting model.
	 */
	virtual std::string getName() const = 0;
};

} // namespace dataflow::models
