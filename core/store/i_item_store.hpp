#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "model/item.hpp"

namespace itemstore {
namespace store {

// Interface for the items collection to enable mocking
//
// Every method except ping() lets store failures escape as exceptions;
// the HTTP layer turns those into 500s.
class IItemStore {
public:
    virtual ~IItemStore() = default;

    // Connectivity probe; false with @p error populated when the store is unreachable
    virtual bool ping(std::string &error) = 0;

    // Insert and return the stored item with its assigned id
    virtual model::Item insert(const model::NewItem &doc) = 0;

    // All items ordered by created_at descending, at most @p limit of them
    virtual std::vector<model::Item> list_newest_first(size_t limit) = 0;

    virtual std::optional<model::Item> find(const model::ObjectId &id) = 0;

    // $set the given fields and return the document after the update (nullopt if missing)
    virtual std::optional<model::Item> update(const model::ObjectId &id, const model::ItemFieldSet &fields) = 0;

    // True if a document was deleted
    virtual bool remove(const model::ObjectId &id) = 0;
};

}  // namespace store
}  // namespace itemstore
