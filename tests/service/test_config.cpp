#include <catch2/catch_test_macros.hpp>

#include "dataflow/service/config.hpp"

#include <cstdio>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using dataflow::service::ConfigLoader;
using dataflow::service::ServerConfig;

namespace {

dataflow::service::EnvironmentLookup fakeEnvironment(std::map<std::string, std::string> variables) {
	return [variables](const std::string &name) -> std::optional<std::string> {
		const auto it = variables.find(name);
		if (it == variables.end()) {
			return std::nullopt;
		}
		return it->second;
	};
}

ServerConfig loadWith(ConfigLoader &loader, std::vector<const char *> args) {
	args.insert(args.begin(), "dataflow_server");
	return loader.load(static_cast<int>(args.size()), args.data());
}

// Writes a temporary JSON file that is removed when the test finishes.
class TempConfigFile {
public:
	explicit TempConfigFile(const std::string &contents) : path_("dataflow_test_config.json") {
		std::ofstream out(path_);
		out << contents;
	}
	~TempConfigFile() {
		std::remove(path_.c_str());
	}
	const std::string &path() const {
		return path_;
	}

private:
	std::string path_;
};

} // namespace

TEST_CASE("ServerConfig defaults", "[service][config]") {
	ConfigLoader loader(fakeEnvironment({}));
	const auto config = loadWith(loader, {});

	REQUIRE(config.host == "0.0.0.0");
	REQUIRE(config.port == 8000);
	REQUIRE(config.threads == 0);
	REQUIRE(config.log_level == "info");
	REQUIRE(config.payload_max_length == 8u * 1024u * 1024u);
	REQUIRE(config.workerThreads() >= 1);
	REQUIRE_FALSE(loader.helpRequested());
}

TEST_CASE("Environment overrides defaults and flags override environment", "[service][config]") {
	ConfigLoader loader(fakeEnvironment(
	    {{"DATAFLOW_PORT", "9000"}, {"DATAFLOW_LOG_LEVEL", "debug"}, {"DATAFLOW_THREADS", "3"}}));

	const auto from_env = loadWith(loader, {});
	REQUIRE(from_env.port == 9000);
	REQUIRE(from_env.log_level == "debug");
	REQUIRE(from_env.threads == 3);
	REQUIRE(from_env.workerThreads() == 3);

	const auto from_flags = loadWith(loader, {"--port=9100", "--host=127.0.0.1"});
	REQUIRE(from_flags.port == 9100);
	REQUIRE(from_flags.host == "127.0.0.1");
	REQUIRE(from_flags.log_level == "debug");
}

TEST_CASE("Configuration file sits between defaults and environment", "[service][config][file]") {
	TempConfigFile file(R"({"host": "10.0.0.1", "port": 7000, "threads": 2, "payload_max_length": 1024})");

	ConfigLoader loader(fakeEnvironment({{"DATAFLOW_PORT", "7100"}}));
	const std::string flag = "--config=" + file.path();
	const auto config = loadWith(loader, {flag.c_str()});

	REQUIRE(config.host == "10.0.0.1");
	REQUIRE(config.port == 7100);
	REQUIRE(config.threads == 2);
	REQUIRE(config.payload_max_length == 1024u);
}

TEST_CASE("Configuration errors are reported as invalid arguments", "[service][config][validation]") {
	ConfigLoader loader(fakeEnvironment({}));

	REQUIRE_THROWS_AS(loadWith(loader, {"--port=abc"}), std::invalid_argument);
	REQUIRE_THROWS_AS(loadWith(loader, {"--port=70000"}), std::invalid_argument);
	REQUIRE_THROWS_AS(loadWith(loader, {"--threads=-1"}), std::invalid_argument);
	REQUIRE_THROWS_AS(loadWith(loader, {"--log-level=loud"}), std::invalid_argument);
	REQUIRE_THROWS_AS(loadWith(loader, {"--verbose"}), std::invalid_argument);
	REQUIRE_THROWS_AS(loadWith(loader, {"--colour=red"}), std::invalid_argument);
	REQUIRE_THROWS_AS(loadWith(loader, {"--config=/nonexistent/dataflow.json"}), std::invalid_argument);

	ConfigLoader bad_env(fakeEnvironment({{"DATAFLOW_PORT", "80x"}}));
	REQUIRE_THROWS_AS(loadWith(bad_env, {}), std::invalid_argument);

	ServerConfig config;
	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"prot": 1})")), std::invalid_argument);
	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"port": "x"})")), std::invalid_argument);
	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse("[1]")), std::invalid_argument);
}

TEST_CASE("Configuration file numbers must be exact integers", "[service][config][file]") {
	ServerConfig config;

	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"port": 8000.7})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"threads": 2.0})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"port": 4294967296})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"payload_max_length": -1})")),
	                  std::invalid_argument);
	REQUIRE_THROWS_AS(ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"payload_max_length": 1.5})")),
	                  std::invalid_argument);
	REQUIRE(config.port == 8000);
	REQUIRE(config.payload_max_length == 8u * 1024u * 1024u);

	ConfigLoader::applyJson(config, nlohmann::json::parse(R"({"port": 0, "threads": -1, "payload_max_length": 0})"));
	REQUIRE(config.port == 0);
	REQUIRE(config.threads == -1);
	REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
}

TEST_CASE("Help flag short-circuits loading", "[service][config]") {
	ConfigLoader loader(fakeEnvironment({{"DATAFLOW_PORT", "not-a-port"}}));
	const auto config = loadWith(loader, {"--help"});

	REQUIRE(loader.helpRequested());
	REQUIRE(config.port == 8000);

	const auto text = ConfigLoader::usage("dataflow_server");
	REQUIRE(text.find("Usage: dataflow_server") == 0);
	REQUIRE(text.find("--port=PORT") != std::string::npos);
	REQUIRE(text.find("/forecast/arima") != std::string::npos);
}
