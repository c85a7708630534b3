/**
 * @file LocationService.hpp
 * @brief Interface for nearby-business lookups.
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

namespace waypoint::domain::location {

/**
 * @struct BusinessLocation
 * @brief A business or point of interest returned by a location provider.
 */
struct BusinessLocation {
    std::string name;
    std::string address;
    std::string category;
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> distanceMeters; ///< Distance from the search point, when known.
};

/**
 * @class LocationService
 * @brief Abstract provider of places around a coordinate.
 */
class LocationService {
public:
    virtual ~LocationService() = default;

    /**
     * @brief Finds businesses around a point.
     * @param latitude WGS84 latitude.
     * @param longitude WGS84 longitude.
     * @param radiusMeters Search radius.
     * @param categories Optional category filter (empty = all).
     * @return The places, or nullopt when the provider could not be reached.
     */
    virtual std::optional<std::vector<BusinessLocation>> getNearbyBusinesses(double latitude,
                                                                             double longitude,
                                                                             int radiusMeters,
                                                                             const std::vector<std::string>& categories) = 0;
};

} // namespace waypoint::domain::location
