#include <lgctl/core/path_resolver.hpp>
#include <lgctl/core/logger.hpp>
#include <lgctl/core/utils.hpp>

#include <vector>

namespace lgctl {

const Json* get_attribute(const Json& node, const std::string& name) {
    if (name.empty() || !node.is_object()) {
        return nullptr;
    }

    Json::const_iterator it = node.find(name);
    if (it == node.end()) {
        return nullptr;
    }
    return &(*it);
}

const Json* find_path(const Json& root, const std::string& path) {
    if (path.empty()) {
        return nullptr;
    }

    const Json* current = &root;
    std::vector<std::string> segments = split(path, '.');
    for (size_t i = 0; i < segments.size(); ++i) {
        current = get_attribute(*current, segments[i]);
        if (!current) {
            LOG_DEBUG("Segment '%s' of '%s' not found", segments[i].c_str(), path.c_str());
            return nullptr;
        }
    }
    return current;
}

ResolveResult resolve_path(const Json& root, const std::string& path) {
    const Json* node = find_path(root, path);
    if (!node) {
        return ResolveResult::not_found(path);
    }
    return ResolveResult::ok(path, *node);
}

} // namespace lgctl
