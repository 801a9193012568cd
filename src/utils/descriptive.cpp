#include "dataflow/utils/descriptive.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <unordered_map>

namespace dataflow::utils {

double Descriptive::sum(const std::vector<double> &values) {
	return std::accumulate(values.begin(), values.end(), 0.0);
}

double Descriptive::mean(const std::vector<double> &values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	return sum(values) / static_cast<double>(values.size());
}

double Descriptive::median(std::vector<double> values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const size_t n = values.size();
	const auto middle = values.begin() + static_cast<std::ptrdiff_t>(n / 2);
	std::nth_element(values.begin(), middle, values.end());
	const double upper = *middle;
	if (n % 2 == 1) {
		return upper;
	}
	const double lower = *std::max_element(values.begin(), middle);
	return (lower + upper) / 2.0;
}

double Descriptive::populationStdDev(const std::vector<double> &values) {
	if (values.empty()) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	const double center = mean(values);
	double accum = 0.0;
	for (double value : values) {
		const double diff = value - center;
		accum += diff * diff;
	}
	return std::sqrt(accum / static_cast<double>(values.size()));
}

Summary Descriptive::summarize(const std::vector<double> &values) {
	if (values.empty()) {
		throw std::invalid_argument("Cannot summarize an empty sample.");
	}
	Summary summary;
	summary.count = values.size();
	summary.sum = sum(values);
	summary.mean = summary.sum / static_cast<double>(summary.count);
	summary.median = median(values);
	summary.stddev = populationStdDev(values);
	return summary;
}

GroupedSummary Descriptive::summarizeBy(const std::vector<std::string> &keys, const std::vector<double> &values) {
	if (keys.size() != values.size()) {
		throw std::invalid_argument("Group keys and values must have the same length.");
	}

	std::vector<std::string> order;
	std::unordered_map<std::string, std::vector<double>> groups;
	for (size_t i = 0; i < keys.size(); ++i) {
		auto it = groups.find(keys[i]);
		if (it == groups.end()) {
			order.push_back(keys[i]);
			it = groups.emplace(keys[i], std::vector<double>{}).first;
		}
		it->second.push_back(values[i]);
	}

	GroupedSummary result;
	result.reserve(order.size());
	for (const auto &key : order) {
		result.emplace_back(key, summarize(groups.at(key)));
	}
	return result;
}

} // namespace dataflow::utils
