#include <lgctl/core/entity.hpp>

namespace lgctl {

const char* plugin_type_name(PluginType type) {
    switch (type) {
        case PluginType::INPUT: return "input";
        case PluginType::OUTPUT: return "output";
        default: return "unknown";
    }
}

bool NamedEntity::from_json(const Json& j, NamedEntity& out, std::string& error) {
    if (!j.is_object()) {
        error = "entity must be an object";
        return false;
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        error = "entity is missing a string 'name'";
        return false;
    }

    out.name = j["name"].get<std::string>();
    if (j.contains("id") && j["id"].is_string()) {
        out.id = j["id"].get<std::string>();
    } else {
        out.id = out.name;
    }
    out.fields = j;
    return true;
}

bool parse_collection(const Json& array, EntityCollection& out, std::string& error) {
    out.clear();
    if (array.is_null()) {
        return true;
    }
    if (!array.is_array()) {
        error = "collection must be an array";
        return false;
    }

    for (size_t i = 0; i < array.size(); ++i) {
        NamedEntity entity;
        std::string entity_error;
        if (!NamedEntity::from_json(array[i], entity, entity_error)) {
            error = "item " + std::to_string(i) + ": " + entity_error;
            return false;
        }
        out.push_back(entity);
    }
    return true;
}

} // namespace lgctl
