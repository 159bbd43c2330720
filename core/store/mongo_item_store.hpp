#pragma once

#include "i_item_store.hpp"
#include "mongo_connection.hpp"

namespace itemstore {
namespace store {

constexpr const char *kItemsCollection = "items";

/**
 * @brief IItemStore backed by the MongoDB "items" collection
 *
 * Document mapping lives in bson_codec.hpp.
 * Each call acquires its own pooled client, so one instance is shared by
 * all HTTP worker threads without extra locking.
 */
class MongoItemStore : public IItemStore {
public:
    explicit MongoItemStore(MongoConnection &connection) : connection_(connection) {}

    bool ping(std::string &error) override;
    model::Item insert(const model::NewItem &doc) override;
    std::vector<model::Item> list_newest_first(size_t limit) override;
    std::optional<model::Item> find(const model::ObjectId &id) override;
    std::optional<model::Item> update(const model::ObjectId &id, const model::ItemFieldSet &fields) override;
    bool remove(const model::ObjectId &id) override;

private:
    MongoConnection &connection_;
};

}  // namespace store
}  // namespace itemstore
