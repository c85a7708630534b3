/**
 * @file LocationApiClient.hpp
 * @brief HTTP client for the location REST API.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "domain/location/LocationService.hpp"

namespace waypoint::infrastructure {

using waypoint::domain::location::BusinessLocation;

class LocationApiClient : public waypoint::domain::location::LocationService {
public:
    LocationApiClient(const std::string& host = "localhost", int port = 4748, int timeoutSeconds = 30);

    /** @brief GET /api/locations/nearby. Nullopt when the API cannot be reached or answers garbage. */
    std::optional<std::vector<BusinessLocation>> getNearbyBusinesses(double latitude,
                                                                     double longitude,
                                                                     int radiusMeters,
                                                                     const std::vector<std::string>& categories) override;

    /** @brief Maps one element of the API response. */
    static BusinessLocation ParseBusiness(const nlohmann::json& j);

private:
    std::string m_host;
    int m_port;
    int m_timeoutSeconds;
};

} // namespace waypoint::infrastructure
