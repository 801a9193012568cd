#include "dataflow/service/schema.hpp"

#include "dataflow/service/errors.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace dataflow::service {

namespace {

// Parser diagnostics quote the offending input, which may not be valid UTF-8.
std::string printableAscii(const std::string &text) {
	std::string result = text;
	for (char &c : result) {
		const auto byte = static_cast<unsigned char>(c);
		if (byte < 0x20 || byte >= 0x7f) {
			c = '?';
		}
	}
	return result;
}

std::string describeType(const Json &value) {
	return value.type_name();
}

double requireNumber(const Json &value, const std::string &field) {
	if (!value.is_number()) {
		throw ValidationError(field + " must be a number, got " + describeType(value) + ".");
	}
	const double number = value.get<double>();
	if (!std::isfinite(number)) {
		throw ValidationError(field + " must be finite.");
	}
	return number;
}

// Accepts JSON integers and floats with no fractional part (e.g. 2.0).
long long requireInteger(const Json &value, const std::string &field) {
	constexpr auto limit = static_cast<long long>(std::numeric_limits<int>::max());
	if (value.is_number_unsigned()) {
		if (value.get<unsigned long long>() <= static_cast<unsigned long long>(limit)) {
			return value.get<long long>();
		}
		throw ValidationError(field + " is out of range.");
	}
	if (value.is_number_integer()) {
		const auto number = value.get<long long>();
		if (number < -limit || number > limit) {
			throw ValidationError(field + " is out of range.");
		}
		return number;
	}
	if (value.is_number_float()) {
		const double number = value.get<double>();
		if (std::isfinite(number) && std::floor(number) == number &&
		    std::fabs(number) <= static_cast<double>(limit)) {
			return static_cast<long long>(number);
		}
	}
	throw ValidationError(field + " must be an integer.");
}

std::string requireString(const Json &object, const std::string &key, const std::string &where) {
	const auto it = object.find(key);
	if (it == object.end()) {
		throw ValidationError(where + ": field '" + key + "' is required.");
	}
	if (!it->is_string()) {
		throw ValidationError(where + ": field '" + key + "' must be a string.");
	}
	return it->get<std::string>();
}

std::vector<double> requireNumberArray(const Json &value, const std::string &field) {
	if (!value.is_array()) {
		throw ValidationError(field + " must be an array of numbers.");
	}
	std::vector<double> numbers;
	numbers.reserve(value.size());
	for (std::size_t i = 0; i < value.size(); ++i) {
		numbers.push_back(requireNumber(value[i], field + "[" + std::to_string(i) + "]"));
	}
	return numbers;
}

ArimaOrder parseOrder(const Json &value) {
	if (!value.is_array() || value.size() != 3) {
		throw ValidationError("order must be an array of three integers [p, d, q].");
	}
	int terms[3];
	static const char *const names[3] = {"order.p", "order.d", "order.q"};
	for (std::size_t i = 0; i < 3; ++i) {
		const auto term = requireInteger(value[i], names[i]);
		if (term < 0) {
			throw ValidationError(std::string(names[i]) + " must be non-negative.");
		}
		terms[i] = static_cast<int>(term);
	}
	return ArimaOrder {terms[0], terms[1], terms[2]};
}

Json summaryToJson(const utils::Summary &summary) {
	Json j;
	j["mean"] = summary.mean;
	j["median"] = summary.median;
	j["std"] = summary.stddev;
	j["count"] = summary.count;
	j["sum"] = summary.sum;
	return j;
}

} // namespace

Json parseBody(const std::string &text) {
	try {
		return Json::parse(text);
	} catch (const Json::parse_error &e) {
		throw ValidationError("Request body is not valid JSON: " + printableAscii(e.what()));
	}
}

std::vector<DataItem> parseDataItems(const Json &body) {
	if (!body.is_array()) {
		throw ValidationError("Request body must be an array of data items.");
	}
	std::vector<DataItem> items;
	items.reserve(body.size());
	for (std::size_t i = 0; i < body.size(); ++i) {
		const auto where = "item " + std::to_string(i);
		const auto &entry = body[i];
		if (!entry.is_object()) {
			throw ValidationError(where + " must be an object.");
		}
		DataItem item;
		item.name = requireString(entry, "name", where);
		item.category = requireString(entry, "category", where);
		const auto value = entry.find("value");
		if (value == entry.end()) {
			throw ValidationError(where + ": field 'value' is required.");
		}
		item.value = requireNumber(*value, where + ": field 'value'");
		items.push_back(std::move(item));
	}
	return items;
}

std::vector<double> parseValues(const Json &body) {
	return requireNumberArray(body, "Request body");
}

ArimaRequest parseArimaRequest(const Json &body) {
	if (!body.is_object()) {
		throw ValidationError("Request body must be an object with a 'values' field.");
	}
	ArimaRequest request;

	const auto values = body.find("values");
	if (values == body.end()) {
		throw ValidationError("Field 'values' is required.");
	}
	request.values = requireNumberArray(*values, "values");

	const auto order = body.find("order");
	if (order != body.end()) {
		request.order = parseOrder(*order);
	}

	const auto steps = body.find("steps");
	if (steps != body.end()) {
		const auto horizon = requireInteger(*steps, "steps");
		if (horizon < 1) {
			throw ValidationError("steps must be a positive integer.");
		}
		if (horizon > kMaxForecastSteps) {
			throw ValidationError("steps must be at most " + std::to_string(kMaxForecastSteps) + ".");
		}
		request.steps = static_cast<int>(horizon);
	}
	return request;
}

void to_json(Json &j, const DataStats &stats) {
	j = Json::object();
	j["mean"] = stats.mean;
	j["median"] = stats.median;
	j["std"] = stats.stddev;
	j["count"] = stats.count;
}

void to_json(Json &j, const CategoryAnalysis &analysis) {
	Json groups = Json::object();
	for (const auto &[category, summary] : analysis.groups) {
		groups[category] = summaryToJson(summary);
	}
	j = Json::object();
	j["analysis"] = std::move(groups);
}

void to_json(Json &j, const ArimaOrder &order) {
	j = Json::array({order.p, order.d, order.q});
}

void to_json(Json &j, const ArimaForecast &forecast) {
	j = Json::object();
	j["forecast"] = forecast.forecast;
	j["model_order"] = forecast.model_order;
}

void to_json(Json &j, const ServiceInfo &info) {
	j = Json::object();
	j["message"] = info.message;
	j["version"] = info.version;
	j["endpoints"] = info.endpoints;
}

void to_json(Json &j, const HealthStatus &health) {
	j = Json::object();
	j["status"] = health.status;
}

} // namespace dataflow::service
