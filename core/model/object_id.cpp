#include "object_id.hpp"

#include <bsoncxx/exception/exception.hpp>

namespace itemstore {
namespace model {

std::optional<ObjectId> parse_object_id(const std::string &hex) {
    if (hex.size() != kObjectIdHexLength) {
        return std::nullopt;
    }

    try {
        return ObjectId{hex};
    } catch (const bsoncxx::exception &) {
        return std::nullopt;
    }
}

}  // namespace model
}  // namespace itemstore
