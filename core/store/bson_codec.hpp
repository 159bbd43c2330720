#pragma once

#include <cstddef>

#include <bsoncxx/document/value.hpp>
#include <bsoncxx/document/view.hpp>
#include <mongocxx/options/find.hpp>

#include "model/item.hpp"

namespace itemstore {
namespace store {

/**
 * @brief Mapping between items and documents in the items collection
 *
 * Document shape:
 *   { _id: ObjectId, name: string, description: string|null, created_at: date }
 *
 * Pure functions over bsoncxx values; MongoItemStore only adds the driver calls.
 */
namespace bson {

// Stored document -> Item. A missing or null description reads as absent.
// Throws bsoncxx::exception when a required field has the wrong type.
model::Item document_to_item(const bsoncxx::document::view &doc);

// Insert body without _id (the server assigns it). Absent description is written as null.
bsoncxx::document::value make_insert_document(const model::NewItem &doc);

// {_id: <id>}
bsoncxx::document::value make_id_filter(const model::ObjectId &id);

// {$set: {...}} with only the fields present in @p fields
bsoncxx::document::value make_set_document(const model::ItemFieldSet &fields);

// created_at descending, at most @p limit documents
mongocxx::options::find make_list_options(size_t limit);

}  // namespace bson
}  // namespace store
}  // namespace itemstore
