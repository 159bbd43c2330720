#include <optional>

#include "../../logging/logger.hpp"
#include "../../model/item_mapper.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace itemstore {
namespace http {

namespace {

// Hard cap on GET /items. Older items beyond it are not reachable through
// the listing; there is no pagination.
constexpr size_t kMaxListResults = 1000;

constexpr const char *kInvalidIdMessage = "Invalid ObjectId";
constexpr const char *kNotFoundMessage = "Item not found";

// Path id -> ObjectId. On failure the 422 response has already been written.
std::optional<model::ObjectId> parse_item_id(const httplib::Request &req, httplib::Response &res) {
    std::string raw_id;
    if (!parse_path_id(req, raw_id)) {
        send_error(res, StatusCode::UNPROCESSABLE_ENTITY, kInvalidIdMessage);
        return std::nullopt;
    }

    auto id = model::parse_object_id(raw_id);
    if (!id) {
        LOG_DEBUG("[HTTP] Rejecting malformed item id '" << raw_id << "'");
        send_error(res, StatusCode::UNPROCESSABLE_ENTITY, kInvalidIdMessage);
        return std::nullopt;
    }
    return id;
}

}  // namespace

//=============================================================================
// POST /items
//=============================================================================
void HttpServer::handle_create_item(const httplib::Request &req, httplib::Response &res) {
    model::ItemCreate payload;
    std::vector<FieldError> errors;
    if (!decode_item_create(req.body, payload, errors)) {
        send_validation_error(res, errors);
        return;
    }

    auto item = store_.insert(model::make_document(payload, model::now_utc()));
    LOG_INFO("[HTTP] Created item " << item.id.to_string());

    send_json(res, StatusCode::CREATED, encode_item(item));
}

//=============================================================================
// GET /items
//=============================================================================
void HttpServer::handle_list_items(const httplib::Request &, httplib::Response &res) {
    auto items = store_.list_newest_first(kMaxListResults);
    send_json(res, StatusCode::OK, encode_items(items));
}

//=============================================================================
// GET /items/{id}
//=============================================================================
void HttpServer::handle_get_item(const httplib::Request &req, httplib::Response &res) {
    auto id = parse_item_id(req, res);
    if (!id) {
        return;
    }

    auto item = store_.find(*id);
    if (!item) {
        send_error(res, StatusCode::NOT_FOUND, kNotFoundMessage);
        return;
    }

    send_json(res, StatusCode::OK, encode_item(*item));
}

//=============================================================================
// PUT /items/{id}
//
// Partial update. A body with nothing to set is an existence probe: the
// current item comes back unchanged (or 404).
//=============================================================================
void HttpServer::handle_update_item(const httplib::Request &req, httplib::Response &res) {
    auto id = parse_item_id(req, res);
    if (!id) {
        return;
    }

    model::ItemUpdate payload;
    std::vector<FieldError> errors;
    if (!decode_item_update(req.body, payload, errors)) {
        send_validation_error(res, errors);
        return;
    }

    auto fields = model::make_update_fields(payload);
    auto item = fields.empty() ? store_.find(*id) : store_.update(*id, fields);
    if (!item) {
        send_error(res, StatusCode::NOT_FOUND, kNotFoundMessage);
        return;
    }

    send_json(res, StatusCode::OK, encode_item(*item));
}

//=============================================================================
// DELETE /items/{id}
//=============================================================================
void HttpServer::handle_delete_item(const httplib::Request &req, httplib::Response &res) {
    auto id = parse_item_id(req, res);
    if (!id) {
        return;
    }

    if (!store_.remove(*id)) {
        send_error(res, StatusCode::NOT_FOUND, kNotFoundMessage);
        return;
    }

    LOG_INFO("[HTTP] Deleted item " << id->to_string());
    res.status = status_code_to_http(StatusCode::NO_CONTENT);
}

}  // namespace http
}  // namespace itemstore
