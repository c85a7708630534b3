/**
 * @file NearbyBusinessesActionHandler.hpp
 * @brief "get_nearby_businesses" action: looks up places around the workflow's coordinates.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "domain/location/LocationService.hpp"
#include "domain/workflow/ActionHandler.hpp"

namespace waypoint::application::actions {

using namespace waypoint::domain::workflow;

/**
 * @class NearbyBusinessesActionHandler
 * @brief Queries a LocationService and summarizes the result into workflow variables.
 *
 * Parameters: "radius" (meters), "categories" (comma separated),
 * "latitude"/"longitude" (fall back to the variables of the same name).
 * Produced variables: latitude, longitude, radius, count, businesses (top five
 * names), closest_business, closest_distance.
 */
class NearbyBusinessesActionHandler : public ActionHandler {
public:
    static constexpr const char* kActionName = "get_nearby_businesses";
    static constexpr std::size_t kMaxListed = 5;

    NearbyBusinessesActionHandler(std::shared_ptr<domain::location::LocationService> locationService,
                                  int defaultRadiusMeters = 1000);

    std::string name() const override { return kActionName; }
    ActionOutcome handle(const ActionContext& context, const CancellationToken& cancellation) override;

private:
    static std::optional<double> ParseCoordinate(const std::string& text);
    std::optional<double> lookupCoordinate(const ActionContext& context, const std::string& key) const;

    std::shared_ptr<domain::location::LocationService> m_locationService;
    int m_defaultRadiusMeters;
};

} // namespace waypoint::application::actions
