#include "io/Config.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;

static std::string env_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    if (!v || !*v) return def;
    return v;
}

std::string resolveTimesheetPath() {
    const std::string explicit_path = env_or("JSON_TIMESHEET", "");
    if (!explicit_path.empty()) return explicit_path;

    const std::string home = env_or("HOME", "");
    if (home.empty()) return "timesheet.json";
    return (fs::path(home) / "timesheet.json").string();
}
