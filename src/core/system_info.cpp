#include <lgctl/core/system_info.hpp>
#include <lgctl/core/application.hpp>
#include <lgctl/core/json.hpp>

#include <sstream>
#include <iomanip>
#include <cstdlib>
#include <unistd.h>
#include <sys/utsname.h>
#include <sys/sysinfo.h>
#include <sqlite3.h>
#include <openssl/crypto.h>
#include <openssl/opensslv.h>

namespace lgctl {

namespace {

std::string format_bytes(unsigned long long bytes) {
    static const char* units[] = { "B", "KiB", "MiB", "GiB", "TiB" };
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    return oss.str();
}

} // namespace

std::vector<SystemInfoEntry> get_system_info(const Settings& settings) {
    std::vector<SystemInfoEntry> entries;
    entries.push_back(SystemInfoEntry("lgctl Version", AppInfo::VERSION, true));

    struct utsname uts;
    if (uname(&uts) == 0) {
        entries.push_back(SystemInfoEntry("Operating System", std::string(uts.sysname) + " " + uts.release, true));
        entries.push_back(SystemInfoEntry("Architecture", uts.machine, true));
        entries.push_back(SystemInfoEntry("Hostname", uts.nodename));
    }

    long cpus = sysconf(_SC_NPROCESSORS_ONLN);
    entries.push_back(SystemInfoEntry("CPU Count", cpus > 0 ? std::to_string(cpus) : "unknown"));

    struct sysinfo si;
    if (sysinfo(&si) == 0) {
        unsigned long long total = static_cast<unsigned long long>(si.totalram) * si.mem_unit;
        unsigned long long free_mem = static_cast<unsigned long long>(si.freeram) * si.mem_unit;
        entries.push_back(SystemInfoEntry("Memory", format_bytes(total) + " total, " +
                                          format_bytes(free_mem) + " free"));
    }

    double load[3];
    if (getloadavg(load, 3) == 3) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << load[0] << " " << load[1] << " " << load[2];
        entries.push_back(SystemInfoEntry("Load Average", oss.str()));
    }

    entries.push_back(SystemInfoEntry("App Path", settings.app_path, true));
    entries.push_back(SystemInfoEntry("Container", settings.container ? "yes" : "no"));
    entries.push_back(SystemInfoEntry("SQLite Version", sqlite3_libversion(), true));
    entries.push_back(SystemInfoEntry("OpenSSL Version", OpenSSL_version(OPENSSL_VERSION), true));

    std::ostringstream json_version;
    json_version << NLOHMANN_JSON_VERSION_MAJOR << "." << NLOHMANN_JSON_VERSION_MINOR
                 << "." << NLOHMANN_JSON_VERSION_PATCH;
    entries.push_back(SystemInfoEntry("nlohmann_json Version", json_version.str(), true));

#ifdef __VERSION__
    entries.push_back(SystemInfoEntry("Compiler", __VERSION__, true));
#endif

    return entries;
}

std::string render_system_info(const std::vector<SystemInfoEntry>& entries) {
    std::ostringstream oss;
    oss << "| Metric | Value |\n"
        << "| :----- | :---- |\n";
    for (size_t i = 0; i < entries.size(); ++i) {
        const SystemInfoEntry& e = entries[i];
        oss << "| **" << e.title << "** | ";
        if (e.code) {
            oss << "`" << e.value << "`";
        } else {
            oss << e.value;
        }
        oss << " |\n";
    }
    return oss.str();
}

} // namespace lgctl
