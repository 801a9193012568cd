#include "dataflow/service/config.hpp"

#include "dataflow/utils/logging.hpp"
#include <cstdlib>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace dataflow::service {

namespace {

int parseInt(const std::string &text, const std::string &field) {
	std::size_t consumed = 0;
	long value = 0;
	try {
		value = std::stol(text, &consumed);
	} catch (const std::exception &) {
		throw std::invalid_argument("Invalid value for " + field + ": '" + text + "'");
	}
	if (consumed != text.size() || value < std::numeric_limits<int>::min() ||
	    value > std::numeric_limits<int>::max()) {
		throw std::invalid_argument("Invalid value for " + field + ": '" + text + "'");
	}
	return static_cast<int>(value);
}

int jsonInt(const nlohmann::json &value, const std::string &key) {
	if (!value.is_number_integer()) {
		throw std::invalid_argument("Configuration value for " + key + " must be an integer");
	}
	const auto number = value.get<long long>();
	if (value.is_number_unsigned() && value.get<unsigned long long>() > static_cast<unsigned long long>(
	                                                                        std::numeric_limits<int>::max())) {
		throw std::invalid_argument("Configuration value for " + key + " is out of range");
	}
	if (number < std::numeric_limits<int>::min() || number > std::numeric_limits<int>::max()) {
		throw std::invalid_argument("Configuration value for " + key + " is out of range");
	}
	return static_cast<int>(number);
}

std::size_t jsonSize(const nlohmann::json &value, const std::string &key) {
	// Non-negative integers parse as unsigned; negative ones do not.
	if (!value.is_number_unsigned()) {
		throw std::invalid_argument("Configuration value for " + key + " must be a non-negative integer");
	}
	return value.get<std::size_t>();
}

// Applies a single "key=value" setting shared by the environment and the flags.
void applySetting(ServerConfig &config, const std::string &key, const std::string &value) {
	if (key == "host") {
		config.host = value;
	} else if (key == "port") {
		config.port = parseInt(value, key);
	} else if (key == "threads") {
		config.threads = parseInt(value, key);
	} else if (key == "log_level") {
		config.log_level = value;
	} else {
		throw std::invalid_argument("Unknown setting: " + key);
	}
}

} // namespace

void ServerConfig::validate() const {
	if (host.empty()) {
		throw std::invalid_argument("host must not be empty");
	}
	if (port < 0 || port > 65535) {
		throw std::invalid_argument("port must be between 0 and 65535, got " + std::to_string(port));
	}
	if (threads < 0) {
		throw std::invalid_argument("threads must be non-negative, got " + std::to_string(threads));
	}
	if (payload_max_length == 0) {
		throw std::invalid_argument("payload_max_length must be positive");
	}
	utils::Logging::parseLevel(log_level);
}

std::size_t ServerConfig::workerThreads() const {
	if (threads > 0) {
		return static_cast<std::size_t>(threads);
	}
	const auto hardware = std::thread::hardware_concurrency();
	return hardware > 0 ? hardware : 1;
}

std::optional<std::string> processEnvironment(const std::string &name) {
	const char *value = std::getenv(name.c_str());
	if (value == nullptr) {
		return std::nullopt;
	}
	return std::string(value);
}

ConfigLoader::ConfigLoader(EnvironmentLookup environment) : environment_(std::move(environment)) {
}

void ConfigLoader::applyJson(ServerConfig &config, const nlohmann::json &document) {
	if (!document.is_object()) {
		throw std::invalid_argument("Configuration must be a JSON object");
	}
	try {
		for (const auto &item : document.items()) {
			const auto &key = item.key();
			const auto &value = item.value();
			if (key == "host") {
				config.host = value.get<std::string>();
			} else if (key == "port") {
				config.port = jsonInt(value, key);
			} else if (key == "threads") {
				config.threads = jsonInt(value, key);
			} else if (key == "log_level") {
				config.log_level = value.get<std::string>();
			} else if (key == "payload_max_length") {
				config.payload_max_length = jsonSize(value, key);
			} else {
				throw std::invalid_argument("Unknown configuration key: " + key);
			}
		}
	} catch (const nlohmann::json::type_error &e) {
		throw std::invalid_argument(std::string("Invalid configuration value: ") + e.what());
	}
}

void ConfigLoader::applyFile(ServerConfig &config, const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::invalid_argument("Cannot open configuration file: " + path);
	}
	nlohmann::json document;
	try {
		file >> document;
	} catch (const nlohmann::json::parse_error &e) {
		throw std::invalid_argument("Cannot parse configuration file " + path + ": " + e.what());
	}
	applyJson(config, document);
}

void ConfigLoader::applyEnvironment(ServerConfig &config) const {
	static const std::vector<std::pair<std::string, std::string>> variables = {
	    {"DATAFLOW_HOST", "host"},
	    {"DATAFLOW_PORT", "port"},
	    {"DATAFLOW_THREADS", "threads"},
	    {"DATAFLOW_LOG_LEVEL", "log_level"}};
	for (const auto &[variable, key] : variables) {
		if (const auto value = environment_(variable)) {
			applySetting(config, key, *value);
		}
	}
}

ServerConfig ConfigLoader::load(int argc, const char *const argv[]) {
	help_requested_ = false;

	std::optional<std::string> config_path;
	std::vector<std::pair<std::string, std::string>> overrides;
	static const std::map<std::string, std::string> flags = {
	    {"--host", "host"}, {"--port", "port"}, {"--threads", "threads"}, {"--log-level", "log_level"}};

	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];
		if (arg == "--help" || arg == "-h") {
			help_requested_ = true;
			continue;
		}
		const auto eq = arg.find('=');
		if (eq == std::string::npos) {
			throw std::invalid_argument("Unknown argument: " + arg);
		}
		const auto name = arg.substr(0, eq);
		const auto value = arg.substr(eq + 1);
		if (name == "--config") {
			config_path = value;
			continue;
		}
		const auto flag = flags.find(name);
		if (flag == flags.end()) {
			throw std::invalid_argument("Unknown argument: " + arg);
		}
		overrides.emplace_back(flag->second, value);
	}

	ServerConfig config;
	if (help_requested_) {
		return config;
	}
	if (config_path) {
		applyFile(config, *config_path);
	}
	applyEnvironment(config);
	for (const auto &[key, value] : overrides) {
		applySetting(config, key, value);
	}
	config.validate();
	return config;
}

std::string ConfigLoader::usage(const std::string &program) {
	std::ostringstream out;
	out << "Usage: " << program << " [options]\n"
	    << "\nOptions:\n"
	    << "  --host=ADDR          Bind address (default: 0.0.0.0, env DATAFLOW_HOST)\n"
	    << "  --port=PORT          Listen port, 0 for any (default: 8000, env DATAFLOW_PORT)\n"
	    << "  --threads=N          Worker threads, 0 for hardware concurrency (default: 0, env DATAFLOW_THREADS)\n"
	    << "  --log-level=LEVEL    trace|debug|info|warn|error|critical|off (default: info, env DATAFLOW_LOG_LEVEL)\n"
	    << "  --config=PATH        JSON file with host, port, threads, log_level, payload_max_length\n"
	    << "  --help               Show this help message\n"
	    << "\nEndpoints:\n"
	    << "  GET  /                 service information\n"
	    << "  GET  /health           liveness check\n"
	    << "  POST /analyze          statistics grouped by category\n"
	    << "  POST /stats            statistics of a list of numbers\n"
	    << "  POST /forecast/arima   ARIMA(p,d,q) forecast\n";
	return out.str();
}

} // namespace dataflow::service
