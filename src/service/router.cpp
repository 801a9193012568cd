#include "dataflow/service/router.hpp"

#include "dataflow/service/errors.hpp"
#include "dataflow/utils/logging.hpp"
#include <exception>
#include <utility>

namespace dataflow::service {

namespace {

HttpReply errorReply(int status, const std::string &detail) {
	Json body = Json::object();
	body["detail"] = detail;
	return HttpReply {status, std::move(body)};
}

} // namespace

Router::Router(Analyzer analyzer) : analyzer_(analyzer) {
	addRoute("GET", "/", [this](const std::string &) { return Json(analyzer_.info()); });
	addRoute("GET", "/health", [this](const std::string &) { return Json(analyzer_.health()); });
	addRoute("POST", "/analyze",
	         [this](const std::string &body) { return Json(analyzer_.analyze(parseDataItems(parseBody(body)))); });
	addRoute("POST", "/stats",
	         [this](const std::string &body) { return Json(analyzer_.stats(parseValues(parseBody(body)))); });
	addRoute("POST", "/forecast/arima", [this](const std::string &body) {
		return Json(analyzer_.forecastArima(parseArimaRequest(parseBody(body))));
	});
}

void Router::addRoute(const std::string &method, const std::string &path, Handler handler) {
	routes_[path][method] = std::move(handler);
}

HttpReply Router::handle(const std::string &method, const std::string &path, const std::string &body) const {
	const auto route = routes_.find(path);
	if (route == routes_.end()) {
		return errorReply(404, "Not Found");
	}
	const auto handler = route->second.find(method);
	if (handler == route->second.end()) {
		return errorReply(405, "Method Not Allowed");
	}

	try {
		return HttpReply {200, handler->second(body)};
	} catch (const ValidationError &e) {
		const int status = e.reason() == ValidationError::Reason::Precondition ? 400 : 422;
		DATAFLOW_DEBUG("{} {} rejected ({}): {}", method, path, status, e.what());
		return errorReply(status, e.what());
	} catch (const ModelFittingError &e) {
		DATAFLOW_ERROR("{} {} failed: {}", method, path, e.what());
		return errorReply(500, e.what());
	} catch (const std::exception &e) {
		DATAFLOW_ERROR("Unhandled error in {} {}: {}", method, path, e.what());
		return errorReply(500, "Internal Server Error");
	}
}

} // namespace dataflow::service
