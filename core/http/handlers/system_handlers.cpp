#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace itemstore {
namespace http {

//=============================================================================
// GET /health - Service health including a MongoDB ping
//=============================================================================
void HttpServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    std::string error;
    if (!store_.ping(error)) {
        LOG_WARN("[HTTP] Health check failed: " << error);
        nlohmann::json response = {{"status", "error"}, {"mongodb", "unreachable"}, {"detail", error}};
        send_json(res, StatusCode::UNAVAILABLE, response);
        return;
    }

    nlohmann::json response = {{"status", "ok"}, {"mongodb", "ok"}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET / - Lightweight health check, does not touch the store
//=============================================================================
void HttpServer::handle_get_root(const httplib::Request &, httplib::Response &res) {
    send_json(res, StatusCode::OK, {{"message", "Healthy"}});
}

}  // namespace http
}  // namespace itemstore
