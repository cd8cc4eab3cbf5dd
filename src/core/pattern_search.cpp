#include <lgctl/core/pattern_search.hpp>
#include <lgctl/core/logger.hpp>

#include <regex>

namespace lgctl {

namespace {

bool matches_start(const std::regex& pattern, const std::string& field) {
    return std::regex_search(field, pattern, std::regex_constants::match_continuous);
}

} // namespace

SearchResult search_entities(const EntityCollection& collection,
                             const std::string& pattern,
                             SearchMode mode) {
    std::regex compiled;
    try {
        compiled = std::regex(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error& e) {
        return SearchResult::fail(SearchError::INVALID_PATTERN,
                                  "Invalid search pattern '" + pattern + "': " + e.what());
    }

    EntityCollection matches;
    for (size_t i = 0; i < collection.size(); ++i) {
        const NamedEntity& entity = collection[i];
        if (!matches_start(compiled, entity.id) && !matches_start(compiled, entity.name)) {
            continue;
        }

        matches.push_back(entity);
        if (mode == SearchMode::FIRST_MATCH) {
            break;
        }
    }

    LOG_DEBUG("Pattern '%s' matched %zu of %zu entities", pattern.c_str(),
              matches.size(), collection.size());

    if (matches.empty()) {
        return SearchResult::fail(SearchError::NO_MATCHES,
                                  "Nothing matching '" + pattern + "'");
    }
    return SearchResult::ok(matches);
}

} // namespace lgctl
