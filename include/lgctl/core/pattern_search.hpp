/*
 * lgctl - Pattern Search
 *
 * Case-insensitive regular expression search over an entity collection.
 * The pattern must match at the start of the entity's id or name
 * ("rtr" matches "rtr1", "one" does not match "Router One").
 */
#ifndef lgctl_CORE_PATTERN_SEARCH_HPP
#define lgctl_CORE_PATTERN_SEARCH_HPP

#include "entity.hpp"
#include <string>
#include <vector>

namespace lgctl {

enum class SearchMode {
    FIRST_MATCH,    // Stop at the first match in collection order
    ALL_MATCHES     // Every match, in collection order
};

enum class SearchError {
    NONE,
    INVALID_PATTERN,
    NO_MATCHES
};

struct SearchResult {
    bool success;
    SearchError error;
    std::string message;
    EntityCollection matches;

    SearchResult() : success(false), error(SearchError::NONE) {}

    static SearchResult ok(const EntityCollection& matches) {
        SearchResult r;
        r.success = true;
        r.matches = matches;
        return r;
    }

    static SearchResult fail(SearchError error, const std::string& message) {
        SearchResult r;
        r.success = false;
        r.error = error;
        r.message = message;
        return r;
    }
};

// Zero matches (including over an empty collection) is NO_MATCHES.
SearchResult search_entities(const EntityCollection& collection,
                             const std::string& pattern,
                             SearchMode mode);

} // namespace lgctl

#endif // lgctl_CORE_PATTERN_SEARCH_HPP
