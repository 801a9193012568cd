#include "dataflow/service/http_server.hpp"

#include "dataflow/utils/logging.hpp"
#include <httplib.h>
#include <chrono>
#include <utility>

namespace dataflow::service {

HttpServer::HttpServer(ServerConfig config)
    : config_(std::move(config)), server_(std::make_unique<httplib::Server>()) {
}

HttpServer::~HttpServer() {
	stop();
}

bool HttpServer::start() {
	if (running_) {
		DATAFLOW_WARN("HTTP server already running on port {}", bound_port_);
		return true;
	}

	const auto threads = config_.workerThreads();
	server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
	server_->set_payload_max_length(config_.payload_max_length);
	registerRoutes();

	if (config_.port == 0) {
		bound_port_ = server_->bind_to_any_port(config_.host);
		if (bound_port_ < 0) {
			DATAFLOW_ERROR("Failed to bind {} on any port", config_.host);
			return false;
		}
	} else {
		if (!server_->bind_to_port(config_.host, config_.port)) {
			DATAFLOW_ERROR("Failed to bind {}:{}", config_.host, config_.port);
			return false;
		}
		bound_port_ = config_.port;
	}

	running_ = true;
	listener_ = std::thread([this]() {
		if (!server_->listen_after_bind()) {
			DATAFLOW_ERROR("HTTP server on port {} stopped listening unexpectedly", bound_port_);
		}
		running_ = false;
	});

	// stop() is a no-op until the listener has entered its accept loop.
	while (running_ && !server_->is_running()) {
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	}
	if (!running_) {
		listener_.join();
		return false;
	}

	DATAFLOW_INFO("Data Flow Analyzer listening on {}:{} with {} worker threads", config_.host, bound_port_, threads);
	return true;
}

void HttpServer::stop() {
	if (server_->is_running() || listener_.joinable()) {
		DATAFLOW_INFO("Stopping HTTP server...");
		server_->stop();
	}
	if (listener_.joinable()) {
		listener_.join();
		DATAFLOW_INFO("HTTP server stopped");
	}
	running_ = false;
}

bool HttpServer::isRunning() const {
	return running_;
}

void HttpServer::registerRoutes() {
	const auto handler = [this](const httplib::Request &req, httplib::Response &res) { dispatch(req, res); };
	server_->Get(".*", handler);
	server_->Post(".*", handler);
	server_->Put(".*", handler);
	server_->Patch(".*", handler);
	server_->Delete(".*", handler);
	server_->Options(".*", handler);
}

void HttpServer::dispatch(const httplib::Request &req, httplib::Response &res) const {
	const auto started = std::chrono::steady_clock::now();
	const auto reply = router_.handle(req.method, req.path, req.body);

	res.status = reply.status;
	res.set_content(reply.body.dump(-1, ' ', false, Json::error_handler_t::replace), "application/json");

	const auto elapsed =
	    std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started).count();
	DATAFLOW_INFO("{} {} {} {:.3f}ms", req.method, req.path, reply.status, static_cast<double>(elapsed) / 1000.0);
}

} // namespace dataflow::service
