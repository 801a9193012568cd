#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace dataflow::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by the models and the HTTP service. The
 * level is configured once at startup from the server configuration.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Maps a level name ("trace", "debug", "info", "warn", "error",
	 * "critical", "off") to the spdlog level.
	 * @throws std::invalid_argument for unknown names.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace dataflow::utils

// --- Logger Macros for convenient access ---
#define DATAFLOW_TRACE(...)    dataflow::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define DATAFLOW_DEBUG(...)    dataflow::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define DATAFLOW_INFO(...)     dataflow::utils::Logging::getLogger()->info(__VA_ARGS__)
#define DATAFLOW_WARN(...)     dataflow::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define DATAFLOW_ERROR(...)    dataflow::utils::Logging::getLogger()->error(__VA_ARGS__)
#define DATAFLOW_CRITICAL(...) dataflow::utils::Logging::getLogger()->critical(__VA_ARGS__)
