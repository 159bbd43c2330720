#include "item_mapper.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace itemstore {
namespace model {

Timestamp now_utc() { return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now()); }

std::string format_timestamp(const Timestamp &ts) {
    const auto epoch_ms = ts.time_since_epoch().count();
    // Floor division so pre-1970 instants keep a positive millisecond part
    auto seconds = epoch_ms / 1000;
    auto millis = epoch_ms % 1000;
    if (millis < 0) {
        millis += 1000;
        seconds -= 1;
    }

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << millis << "Z";
    return out.str();
}

NewItem make_document(const ItemCreate &payload, const Timestamp &now) {
    NewItem doc;
    doc.name = payload.name;
    doc.description = payload.description;
    doc.created_at = now;
    return doc;
}

ItemFieldSet make_update_fields(const ItemUpdate &payload) {
    ItemFieldSet fields;
    if (payload.name.has_value() && payload.name->has_value()) {
        fields.name = **payload.name;
    }
    if (payload.description.has_value() && payload.description->has_value()) {
        fields.description = **payload.description;
    }
    return fields;
}

void apply_update(Item &item, const ItemFieldSet &fields) {
    if (fields.name) {
        item.name = *fields.name;
    }
    if (fields.description) {
        item.description = *fields.description;
    }
}

Item to_item(const ObjectId &id, const NewItem &doc) {
    Item item;
    item.id = id;
    item.name = doc.name;
    item.description = doc.description;
    item.created_at = doc.created_at;
    return item;
}

}  // namespace model
}  // namespace itemstore
