#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace dataflow::utils {

/**
 * @struct Summary
 * @brief Descriptive statistics of a non-empty sample.
 */
struct Summary {
	double mean = 0.0;
	double median = 0.0;
	/// Population standard deviation (divisor n).
	double stddev = 0.0;
	std::size_t count = 0;
	double sum = 0.0;
};

/// Summaries keyed by group label, in order of first appearance.
using GroupedSummary = std::vector<std::pair<std::string, Summary>>;

class Descriptive {
public:
	static double sum(const std::vector<double> &values);
	static double mean(const std::vector<double> &values);
	static double median(std::vector<double> values);
	static double populationStdDev(const std::vector<double> &values);

	/**
	 * @brief Computes all statistics of the sample at once.
	 * @throws std::invalid_argument If @p values is empty.
	 */
	static Summary summarize(const std::vector<double> &values);

	/**
	 * @brief Summarizes @p values separately for each distinct key.
	 * @throws std::invalid_argument If the inputs differ in length.
	 */
	static GroupedSummary summarizeBy(const std::vector<std::string> &keys, const std::vector<double> &values);
};

} // namespace dataflow::utils
