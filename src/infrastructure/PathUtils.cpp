#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace waypoint::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetDataHome() {
    const char* xdgDataHome = std::getenv("XDG_DATA_HOME");
    if (xdgDataHome && *xdgDataHome) {
        return fs::path(xdgDataHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".local" / "share";
    }
    return fs::current_path(); // Fallback
}

fs::path PathUtils::GetConfigHome() {
    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfigHome && *xdgConfigHome) {
        return fs::path(xdgConfigHome);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetWaypointDataDir() {
    fs::path base = GetDataHome() / "Waypoint";
    std::error_code ec;
    fs::create_directories(base, ec);
    if (ec) {
        std::cerr << "[PathUtils] Could not create " << base << ": " << ec.message() << std::endl;
    }
    return base;
}

fs::path PathUtils::GetWaypointConfigDir() {
    return GetConfigHome() / "Waypoint";
}

} // namespace waypoint::infrastructure
