/*
 * lgctl - Dotted-Path Resolver
 *
 * Resolves "a.b.c" against a configuration tree by chaining a uniform
 * attribute lookup on every node. Arrays and scalars have no attributes.
 */
#ifndef lgctl_CORE_PATH_RESOLVER_HPP
#define lgctl_CORE_PATH_RESOLVER_HPP

#include "json.hpp"
#include <string>

namespace lgctl {

struct ResolveResult {
    bool success;
    Json value;             // Resolved node (copy) on success
    std::string path;       // The path exactly as the caller passed it
    std::string error;

    ResolveResult() : success(false) {}

    static ResolveResult ok(const std::string& path, const Json& value) {
        ResolveResult r;
        r.success = true;
        r.path = path;
        r.value = value;
        return r;
    }

    static ResolveResult not_found(const std::string& path) {
        ResolveResult r;
        r.success = false;
        r.path = path;
        r.error = "'" + path + "' does not exist";
        return r;
    }
};

// Child attribute `name` of `node`, or nullptr when `node` is not an
// object or has no such attribute.
const Json* get_attribute(const Json& node, const std::string& name);

// Walk `path` from `root`. nullptr on an empty path, an empty segment or
// any missing segment.
const Json* find_path(const Json& root, const std::string& path);

// Same walk, reported as a result that carries the original path on failure.
ResolveResult resolve_path(const Json& root, const std::string& path);

} // namespace lgctl

#endif // lgctl_CORE_PATH_RESOLVER_HPP
