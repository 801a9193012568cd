#pragma once

#include "dataflow/service/config.hpp"
#include "dataflow/service/router.hpp"
#include <atomic>
#include <memory>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
} // namespace httplib

namespace dataflow::service {

/**
 * @class HttpServer
 * @brief Serves a Router over HTTP with cpp-httplib.
 *
 * The listening socket is bound in start() and requests are accepted on a
 * background thread; handlers run on the server's worker pool.
 */
class HttpServer {
public:
	explicit HttpServer(ServerConfig config);
	~HttpServer();

	HttpServer(const HttpServer &) = delete;
	HttpServer &operator=(const HttpServer &) = delete;

	/**
	 * @brief Binds the configured address and starts accepting requests.
	 * @return false if the address could not be bound.
	 */
	bool start();

	/// Stops accepting requests and joins the listener thread. Idempotent.
	void stop();

	bool isRunning() const;

	/// The bound port; differs from the configured one when that was 0.
	int port() const {
		return bound_port_;
	}

private:
	void registerRoutes();
	void dispatch(const httplib::Request &req, httplib::Response &res) const;

	ServerConfig config_;
	Router router_;
	std::unique_ptr<httplib::Server> server_;
	std::thread listener_;
	std::atomic<bool> running_ {false};
	int bound_port_ = 0;
};

} // namespace dataflow::service
