/*
 * lgctl - Named entities
 *
 * Devices, directives and plugins as the state store hands them over:
 * an id, a display name, and the remaining fields as an opaque object.
 */
#ifndef lgctl_CORE_ENTITY_HPP
#define lgctl_CORE_ENTITY_HPP

#include "json.hpp"
#include <string>
#include <vector>

namespace lgctl {

enum class PluginType {
    INPUT,
    OUTPUT
};

const char* plugin_type_name(PluginType type);

struct NamedEntity {
    std::string id;
    std::string name;
    Json fields;            // Everything else, including "id" and "name"

    NamedEntity() : fields(Json::object()) {}
    NamedEntity(const std::string& i, const std::string& n)
        : id(i), name(n), fields(Json::object()) {
        fields["id"] = i;
        fields["name"] = n;
    }

    // Entities without an "id" take their name as id. A missing or
    // non-string "name" is an error.
    static bool from_json(const Json& j, NamedEntity& out, std::string& error);
};

// Load order is preserved
typedef std::vector<NamedEntity> EntityCollection;

bool parse_collection(const Json& array, EntityCollection& out, std::string& error);

} // namespace lgctl

#endif // lgctl_CORE_ENTITY_HPP
