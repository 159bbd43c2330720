#pragma once

#include <string>

#include "item.hpp"

namespace itemstore {
namespace model {

// Current UTC time truncated to milliseconds
Timestamp now_utc();

// ISO-8601 UTC with millisecond precision: 2025-01-01T12:00:00.123Z
std::string format_timestamp(const Timestamp &ts);

/**
 * @brief Build the document to insert for a creation payload
 *
 * created_at is taken from @p now so callers (and tests) control the clock.
 */
NewItem make_document(const ItemCreate &payload, const Timestamp &now);

/**
 * @brief Reduce an update payload to the fields that should be written
 *
 * Keys that were absent or explicitly null are dropped; the stored
 * document keeps its current value for them.
 */
ItemFieldSet make_update_fields(const ItemUpdate &payload);

// Apply a field set to an in-memory copy, leaving id and created_at alone
void apply_update(Item &item, const ItemFieldSet &fields);

// Stored form of a freshly inserted document
Item to_item(const ObjectId &id, const NewItem &doc);

}  // namespace model
}  // namespace itemstore
