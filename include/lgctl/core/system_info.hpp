/*
 * lgctl - System information for bug reports
 */
#ifndef lgctl_CORE_SYSTEM_INFO_HPP
#define lgctl_CORE_SYSTEM_INFO_HPP

#include "config.hpp"
#include <string>
#include <vector>

namespace lgctl {

struct SystemInfoEntry {
    std::string title;
    std::string value;
    bool code;              // Render as inline code

    SystemInfoEntry() : code(false) {}
    SystemInfoEntry(const std::string& t, const std::string& v, bool c = false)
        : title(t), value(v), code(c) {}
};

std::vector<SystemInfoEntry> get_system_info(const Settings& settings);

// Markdown table with "Metric" and "Value" columns
std::string render_system_info(const std::vector<SystemInfoEntry>& entries);

} // namespace lgctl

#endif // lgctl_CORE_SYSTEM_INFO_HPP
