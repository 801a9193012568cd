#pragma once

#include "dataflow/service/analyzer.hpp"
#include "dataflow/service/schema.hpp"
#include <functional>
#include <map>
#include <string>

namespace dataflow::service {

/// A status code and JSON body ready to be written to the client.
struct HttpReply {
	int status = 200;
	Json body;
};

/**
 * @class Router
 * @brief Dispatches (method, path, body) to the analyzer and maps errors to status codes.
 *
 * Kept free of any socket code so the full request/response contract can be
 * exercised directly in tests. Every failure becomes a {"detail": ...} body:
 * 404 for unknown paths, 405 for a known path with the wrong method, 422 for
 * malformed bodies, 400 for unmet size preconditions and 500 for model or
 * internal failures.
 */
class Router {
public:
	explicit Router(Analyzer analyzer = Analyzer());

	// Handlers are bound to this instance.
	Router(const Router &) = delete;
	Router &operator=(const Router &) = delete;

	HttpReply handle(const std::string &method, const std::string &path, const std::string &body) const;

private:
	using Handler = std::function<Json(const std::string &body)>;

	void addRoute(const std::string &method, const std::string &path, Handler handler);

	Analyzer analyzer_;
	// path -> method -> handler
	std::map<std::string, std::map<std::string, Handler>> routes_;
};

} // namespace dataflow::service
