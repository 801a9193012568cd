#pragma once

#include "dataflow/utils/descriptive.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dataflow::service {

/// Responses keep field order stable, so they use the insertion-ordered variant.
using Json = nlohmann::ordered_json;

struct DataItem {
	std::string name;
	double value = 0.0;
	std::string category;
};

struct DataStats {
	double mean = 0.0;
	double median = 0.0;
	double stddev = 0.0;
	std::size_t count = 0;
};

struct CategoryAnalysis {
	utils::GroupedSummary groups;
};

/// ARIMA order (p, d, q).
struct ArimaOrder {
	int p = 1;
	int d = 1;
	int q = 1;

	bool operator==(const ArimaOrder &other) const {
		return p == other.p && d == other.d && q == other.q;
	}
};

/// Longest forecast horizon a single request may ask for.
constexpr int kMaxForecastSteps = 10000;

struct ArimaRequest {
	std::vector<double> values;
	ArimaOrder order;
	int steps = 10;
};

struct ArimaForecast {
	std::vector<double> forecast;
	ArimaOrder model_order;
};

struct ServiceInfo {
	std::string message;
	std::string version;
	std::vector<std::string> endpoints;
};

struct HealthStatus {
	std::string status;
};

// --- Request parsing. All of these throw ValidationError. ---

/// Parses raw request text as JSON.
Json parseBody(const std::string &text);

std::vector<DataItem> parseDataItems(const Json &body);
std::vector<double> parseValues(const Json &body);
ArimaRequest parseArimaRequest(const Json &body);

// --- Response serialization ---

void to_json(Json &j, const DataStats &stats);
void to_json(Json &j, const CategoryAnalysis &analysis);
void to_json(Json &j, const ArimaOrder &order);
void to_json(Json &j, const ArimaForecast &forecast);
void to_json(Json &j, const ServiceInfo &info);
void to_json(Json &j, const HealthStatus &health);

} // namespace dataflow::service
