#include "dataflow/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>

namespace dataflow::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("dataflow");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("dataflow");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	const auto level = spdlog::level::from_str(name);
	// from_str falls back to "off" for anything it does not recognise.
	if (level == spdlog::level::off && name != "off") {
		throw std::invalid_argument("Unknown log level '" + name + "'.");
	}
	return level;
}

} // namespace dataflow::utils
