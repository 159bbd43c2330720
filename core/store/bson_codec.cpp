#include "bson_codec.hpp"

#include <bsoncxx/builder/basic/document.hpp>
#include <bsoncxx/builder/basic/kvp.hpp>
#include <bsoncxx/types.hpp>

#include <cstdint>
#include <string>

namespace itemstore {
namespace store {
namespace bson {

namespace {

using bsoncxx::builder::basic::kvp;
using bsoncxx::builder::basic::make_document;

std::string to_std_string(const bsoncxx::document::element &element) {
    auto view = element.get_string().value;
    return std::string(view.data(), view.size());
}

}  // namespace

model::Item document_to_item(const bsoncxx::document::view &doc) {
    model::Item item;
    item.id = doc["_id"].get_oid().value;
    item.name = to_std_string(doc["name"]);

    auto description = doc["description"];
    if (description && description.type() == bsoncxx::type::k_string) {
        item.description = to_std_string(description);
    }

    item.created_at = model::Timestamp(doc["created_at"].get_date().value);
    return item;
}

bsoncxx::document::value make_insert_document(const model::NewItem &doc) {
    bsoncxx::builder::basic::document builder;
    builder.append(kvp("name", doc.name));
    if (doc.description) {
        builder.append(kvp("description", *doc.description));
    } else {
        builder.append(kvp("description", bsoncxx::types::b_null{}));
    }
    builder.append(kvp("created_at", bsoncxx::types::b_date{doc.created_at.time_since_epoch()}));
    return builder.extract();
}

bsoncxx::document::value make_id_filter(const model::ObjectId &id) {
    return make_document(kvp("_id", bsoncxx::types::b_oid{id}));
}

bsoncxx::document::value make_set_document(const model::ItemFieldSet &fields) {
    bsoncxx::builder::basic::document set_fields;
    if (fields.name) {
        set_fields.append(kvp("name", *fields.name));
    }
    if (fields.description) {
        set_fields.append(kvp("description", *fields.description));
    }
    return make_document(kvp("$set", set_fields.extract()));
}

mongocxx::options::find make_list_options(size_t limit) {
    mongocxx::options::find options;
    options.sort(make_document(kvp("created_at", -1)));
    options.limit(static_cast<std::int64_t>(limit));
    return options;
}

}  // namespace bson
}  // namespace store
}  // namespace itemstore
