#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <bsoncxx/oid.hpp>

namespace itemstore {
namespace model {

/**
 * @brief Item identifier
 *
 * The driver's 12-byte ObjectId. A default-constructed value is a freshly
 * generated id; to_string() gives the 24 lowercase hex characters used on
 * the wire.
 */
using ObjectId = bsoncxx::oid;

constexpr size_t kObjectIdHexLength = 24;

/**
 * @brief Parse the 24-hex external form
 *
 * Strict: exactly 24 characters from [0-9a-fA-F]. Rejection happens before
 * the store is touched, which is what lets the HTTP layer tell "malformed
 * id" (422) apart from "no such item" (404).
 *
 * @return The id, or std::nullopt if the string is not a valid encoding
 */
std::optional<ObjectId> parse_object_id(const std::string &hex);

}  // namespace model
}  // namespace itemstore
