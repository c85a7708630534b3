#include <iostream>
#include <string>
#include <vector>

#include "app/WaypointApp.hpp"

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    waypoint::app::WaypointApp app(std::cin, std::cout);
    return app.Run(args);
}
