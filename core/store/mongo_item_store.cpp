#include "mongo_item_store.hpp"

#include <mongocxx/client.hpp>
#include <mongocxx/collection.hpp>
#include <mongocxx/exception/exception.hpp>
#include <mongocxx/options/find_one_and_update.hpp>

#include <stdexcept>

#include "bson_codec.hpp"
#include "logging/logger.hpp"
#include "model/item_mapper.hpp"

namespace itemstore {
namespace store {

// Only driver failures become false. UninitializedError is a lifecycle bug and
// propagates to the HTTP exception handler like on every other operation.
bool MongoItemStore::ping(std::string &error) {
    try {
        connection_.ping();
        return true;
    } catch (const mongocxx::exception &e) {
        error = e.what();
    }
    LOG_WARN("[Mongo] Ping failed: " << error);
    return false;
}

model::Item MongoItemStore::insert(const model::NewItem &doc) {
    auto client = connection_.acquire();
    auto collection = (*client)[connection_.database_name()][kItemsCollection];
    auto result = collection.insert_one(bson::make_insert_document(doc).view());
    if (!result) {
        throw std::runtime_error("insert_one returned no result (unacknowledged write concern?)");
    }

    auto item = model::to_item(result->inserted_id().get_oid().value, doc);
    LOG_DEBUG("[Mongo] Inserted item " << item.id.to_string());
    return item;
}

std::vector<model::Item> MongoItemStore::list_newest_first(size_t limit) {
    auto client = connection_.acquire();
    auto collection = (*client)[connection_.database_name()][kItemsCollection];
    auto cursor = collection.find({}, bson::make_list_options(limit));

    std::vector<model::Item> items;
    for (const auto &doc : cursor) {
        items.push_back(bson::document_to_item(doc));
    }
    return items;
}

std::optional<model::Item> MongoItemStore::find(const model::ObjectId &id) {
    auto client = connection_.acquire();
    auto collection = (*client)[connection_.database_name()][kItemsCollection];
    auto doc = collection.find_one(bson::make_id_filter(id).view());
    if (!doc) {
        return std::nullopt;
    }
    return bson::document_to_item(doc->view());
}

std::optional<model::Item> MongoItemStore::update(const model::ObjectId &id, const model::ItemFieldSet &fields) {
    mongocxx::options::find_one_and_update options;
    options.return_document(mongocxx::options::return_document::k_after);

    auto client = connection_.acquire();
    auto collection = (*client)[connection_.database_name()][kItemsCollection];
    auto doc = collection.find_one_and_update(bson::make_id_filter(id).view(),
                                              bson::make_set_document(fields).view(), options);
    if (!doc) {
        return std::nullopt;
    }
    return bson::document_to_item(doc->view());
}

bool MongoItemStore::remove(const model::ObjectId &id) {
    auto client = connection_.acquire();
    auto collection = (*client)[connection_.database_name()][kItemsCollection];
    auto result = collection.delete_one(bson::make_id_filter(id).view());
    return result && result->deleted_count() > 0;
}

}  // namespace store
}  // namespace itemstore
