#include "json.hpp"

#include "model/item_mapper.hpp"

namespace itemstore {
namespace http {

namespace {

// Parse the body and require a top-level object
bool parse_object(const std::string &body, nlohmann::json &json, std::vector<FieldError> &errors) {
    try {
        json = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error &e) {
        errors.push_back({"", std::string("Invalid JSON: ") + e.what(), "json_invalid"});
        return false;
    }

    if (!json.is_object()) {
        errors.push_back({"", "Input should be a JSON object", "model_attributes_type"});
        return false;
    }
    return true;
}

// Optional string-or-null field. Absent stays absent; present is recorded
// together with whether it was null.
void decode_nullable_string(const nlohmann::json &json, const std::string &field, bool require_non_empty,
                            std::optional<model::NullableString> &out, std::vector<FieldError> &errors) {
    auto it = json.find(field);
    if (it == json.end()) {
        return;
    }
    if (it->is_null()) {
        out = model::NullableString{};
        return;
    }
    if (!it->is_string()) {
        errors.push_back({field, "Input should be a valid string", "string_type"});
        return;
    }

    auto value = it->get<std::string>();
    if (require_non_empty && value.empty()) {
        errors.push_back({field, "String should have at least 1 character", "string_too_short"});
        return;
    }
    out = model::NullableString{std::move(value)};
}

}  // namespace

nlohmann::json encode_item(const model::Item &item) {
    return {{"id", item.id.to_string()},
            {"name", item.name},
            {"description", item.description ? nlohmann::json(*item.description) : nlohmann::json(nullptr)},
            {"created_at", model::format_timestamp(item.created_at)}};
}

nlohmann::json encode_items(const std::vector<model::Item> &items) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto &item : items) {
        array.push_back(encode_item(item));
    }
    return array;
}

bool decode_item_create(const std::string &body, model::ItemCreate &payload, std::vector<FieldError> &errors) {
    nlohmann::json json;
    if (!parse_object(body, json, errors)) {
        return false;
    }

    auto name_it = json.find("name");
    if (name_it == json.end()) {
        errors.push_back({"name", "Field required", "missing"});
    } else if (!name_it->is_string()) {
        errors.push_back({"name", "Input should be a valid string", "string_type"});
    } else if (name_it->get_ref<const std::string &>().empty()) {
        errors.push_back({"name", "String should have at least 1 character", "string_too_short"});
    } else {
        payload.name = name_it->get<std::string>();
    }

    std::optional<model::NullableString> description;
    decode_nullable_string(json, "description", false, description, errors);
    if (description) {
        payload.description = *description;
    }

    return errors.empty();
}

bool decode_item_update(const std::string &body, model::ItemUpdate &payload, std::vector<FieldError> &errors) {
    nlohmann::json json;
    if (!parse_object(body, json, errors)) {
        return false;
    }

    // A stored item's name is never empty, so an update can't set one
    decode_nullable_string(json, "name", true, payload.name, errors);
    decode_nullable_string(json, "description", false, payload.description, errors);

    return errors.empty();
}

nlohmann::json encode_field_errors(const std::vector<FieldError> &errors) {
    nlohmann::json detail = nlohmann::json::array();
    for (const auto &error : errors) {
        nlohmann::json loc = nlohmann::json::array({"body"});
        if (!error.field.empty()) {
            loc.push_back(error.field);
        }
        detail.push_back({{"loc", loc}, {"msg", error.message}, {"type", error.type}});
    }
    return detail;
}

}  // namespace http
}  // namespace itemstore
