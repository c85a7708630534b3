// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace waypoint::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    // <data home>/Waypoint, created on demand
    static std::filesystem::path GetWaypointDataDir();
    // <config home>/Waypoint (not created)
    static std::filesystem::path GetWaypointConfigDir();
};

} // namespace waypoint::infrastructure
