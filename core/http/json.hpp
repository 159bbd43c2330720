#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/item.hpp"

namespace itemstore {
namespace http {

/**
 * @brief JSON encoding utilities for items
 *
 * Item shape on the wire:
 *   {"id": "<24 hex>", "name": "...", "description": "..."|null,
 *    "created_at": "2025-01-01T12:00:00.123Z"}
 */
nlohmann::json encode_item(const model::Item &item);
nlohmann::json encode_items(const std::vector<model::Item> &items);

/**
 * @brief One request-body validation failure
 *
 * field is empty when the body as a whole is at fault (not JSON, not an object).
 */
struct FieldError {
    std::string field;
    std::string message;
    std::string type;
};

// Decode functions for incoming request bodies. On failure every offending
// field is reported, not just the first.
bool decode_item_create(const std::string &body, model::ItemCreate &payload, std::vector<FieldError> &errors);
bool decode_item_update(const std::string &body, model::ItemUpdate &payload, std::vector<FieldError> &errors);

// [{"loc": ["body", "name"], "msg": "...", "type": "..."}, ...]
nlohmann::json encode_field_errors(const std::vector<FieldError> &errors);

}  // namespace http
}  // namespace itemstore
