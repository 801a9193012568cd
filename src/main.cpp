#include "dataflow/service/config.hpp"
#include "dataflow/service/http_server.hpp"
#include "dataflow/utils/logging.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> g_shutdown {false};

void signalHandler(int signal) {
	if (signal == SIGINT || signal == SIGTERM) {
		g_shutdown = true;
	}
}

} // namespace

int main(int argc, char *argv[]) {
	using dataflow::service::ConfigLoader;

	ConfigLoader loader;
	dataflow::service::ServerConfig config;
	try {
		config = loader.load(argc, argv);
	} catch (const std::invalid_argument &e) {
		dataflow::utils::Logging::init();
		DATAFLOW_ERROR("Invalid configuration: {}", e.what());
		std::cerr << ConfigLoader::usage(argv[0]);
		return 1;
	}
	if (loader.helpRequested()) {
		std::cout << ConfigLoader::usage(argv[0]);
		return 0;
	}

	dataflow::utils::Logging::init(dataflow::utils::Logging::parseLevel(config.log_level));

	std::signal(SIGINT, signalHandler);
	std::signal(SIGTERM, signalHandler);

	dataflow::service::HttpServer server(config);
	if (!server.start()) {
		DATAFLOW_CRITICAL("Could not start HTTP server on {}:{}", config.host, config.port);
		return 1;
	}

	DATAFLOW_INFO("Serving on port {}, press Ctrl+C to stop", server.port());

	while (!g_shutdown && server.isRunning()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(200));
	}
	if (g_shutdown) {
		DATAFLOW_INFO("Received shutdown signal");
	}
	server.stop();
	return 0;
}
