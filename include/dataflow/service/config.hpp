#pragma once

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace dataflow::service {

/**
 * @struct ServerConfig
 * @brief Runtime settings of the HTTP service.
 */
struct ServerConfig {
	std::string host = "0.0.0.0";
	/// 0 binds any free port.
	int port = 8000;
	/// Worker pool size; 0 uses the hardware concurrency.
	int threads = 0;
	std::string log_level = "info";
	std::size_t payload_max_length = 8 * 1024 * 1024;

	/// @throws std::invalid_argument If any field is out of range.
	void validate() const;

	/// Resolved worker count, never less than one.
	std::size_t workerThreads() const;
};

/// Looks up an environment variable; returns nullopt when unset.
using EnvironmentLookup = std::function<std::optional<std::string>(const std::string &name)>;

/// Reads the process environment.
std::optional<std::string> processEnvironment(const std::string &name);

/**
 * @class ConfigLoader
 * @brief Builds a ServerConfig from defaults, a JSON file, the environment and flags.
 *
 * Each source overrides the previous one:
 *   1. built-in defaults
 *   2. the JSON file named by --config=PATH
 *   3. DATAFLOW_HOST, DATAFLOW_PORT, DATAFLOW_THREADS, DATAFLOW_LOG_LEVEL
 *   4. --host=, --port=, --threads=, --log-level=
 *
 * All errors are reported as std::invalid_argument.
 */
class ConfigLoader {
public:
	explicit ConfigLoader(EnvironmentLookup environment = processEnvironment);

	/// Parses argv; sets helpRequested() instead of failing on --help.
	ServerConfig load(int argc, const char *const argv[]);

	bool helpRequested() const {
		return help_requested_;
	}

	static void applyJson(ServerConfig &config, const nlohmann::json &document);
	static void applyFile(ServerConfig &config, const std::string &path);
	void applyEnvironment(ServerConfig &config) const;

	static std::string usage(const std::string &program);

private:
	EnvironmentLookup environment_;
	bool help_requested_ = false;
};

} // namespace dataflow::service
