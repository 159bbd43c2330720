#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "object_id.hpp"

namespace itemstore {
namespace model {

// UTC instant at the store's date resolution (BSON dates are milliseconds)
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

using NullableString = std::optional<std::string>;

/**
 * @brief An item as stored in the items collection
 */
struct Item {
    ObjectId id;
    std::string name;
    NullableString description;
    Timestamp created_at;
};

// POST /items payload
struct ItemCreate {
    std::string name;
    NullableString description;
};

/**
 * @brief PUT /items/{id} payload
 *
 * Outer optional: was the key present in the body at all.
 * Inner optional: was the value a string or JSON null.
 */
struct ItemUpdate {
    std::optional<NullableString> name;
    std::optional<NullableString> description;
};

// Document ready to insert; the store assigns the id
struct NewItem {
    std::string name;
    NullableString description;
    Timestamp created_at;
};

// Fields to $set on an existing document
struct ItemFieldSet {
    std::optional<std::string> name;
    std::optional<std::string> description;

    bool empty() const { return !name.has_value() && !description.has_value(); }
};

}  // namespace model
}  // namespace itemstore
