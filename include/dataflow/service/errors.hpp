#pragma once

#include <stdexcept>
#include <string>

namespace dataflow::service {

/**
 * @brief A request that fails a structural or size precondition.
 *
 * Raised before any numerical work. The caller has to fix the request; the
 * reason decides how the HTTP layer reports it.
 */
class ValidationError : public std::invalid_argument {
public:
	enum class Reason {
		// The body does not have the expected shape or types.
		InvalidBody,
		// The body is well formed but fails a minimum-size precondition.
		Precondition
	};

	explicit ValidationError(const std::string &detail, Reason reason = Reason::InvalidBody)
	    : std::invalid_argument(detail), reason_(reason) {
	}

	Reason reason() const {
		return reason_;
	}

private:
	Reason reason_;
};

/// The forecasting routine failed to fit or forecast; wraps the cause.
class ModelFittingError : public std::runtime_error {
public:
	explicit ModelFittingError(const std::string &cause) : std::runtime_error("Error in ARIMA model: " + cause) {
	}
};

} // namespace dataflow::service
