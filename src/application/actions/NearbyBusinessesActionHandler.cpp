/**
 * @file NearbyBusinessesActionHandler.cpp
 * @brief Implementation of NearbyBusinessesActionHandler.
 */

#include "application/actions/NearbyBusinessesActionHandler.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace waypoint::application::actions {

namespace {

std::string Trim(const std::string& value) {
    std::size_t start = 0;
    while (start < value.size() && std::isspace(static_cast<unsigned char>(value[start]))) ++start;
    std::size_t end = value.size();
    while (end > start && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
    return value.substr(start, end - start);
}

std::vector<std::string> SplitCategories(const std::string& raw) {
    std::vector<std::string> categories;
    std::stringstream ss(raw);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = Trim(item);
        if (!item.empty()) categories.push_back(item);
    }
    return categories;
}

std::string Fixed(double value, int decimals) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    return buffer;
}

} // namespace

NearbyBusinessesActionHandler::NearbyBusinessesActionHandler(
    std::shared_ptr<domain::location::LocationService> locationService,
    int defaultRadiusMeters)
    : m_locationService(std::move(locationService)), m_defaultRadiusMeters(defaultRadiusMeters) {
    if (!m_locationService) {
        throw std::invalid_argument("NearbyBusinessesActionHandler requires a LocationService.");
    }
}

std::optional<double> NearbyBusinessesActionHandler::ParseCoordinate(const std::string& text) {
    std::string trimmed = Trim(text);
    if (trimmed.empty()) return std::nullopt;

    char* end = nullptr;
    double value = std::strtod(trimmed.c_str(), &end);
    if (end == trimmed.c_str() || *end != '\0' || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> NearbyBusinessesActionHandler::lookupCoordinate(const ActionContext& context,
                                                                      const std::string& key) const {
    auto param = context.parameters.find(key);
    if (param != context.parameters.end()) {
        if (auto value = ParseCoordinate(param->second)) return value;
    }
    auto var = context.variables.find(key);
    if (var != context.variables.end()) {
        return ParseCoordinate(var->second);
    }
    return std::nullopt;
}

ActionOutcome NearbyBusinessesActionHandler::handle(const ActionContext& context, const CancellationToken& cancellation) {
    int radiusMeters = m_defaultRadiusMeters;
    auto radiusParam = context.parameters.find("radius");
    if (radiusParam != context.parameters.end()) {
        try {
            radiusMeters = std::stoi(radiusParam->second);
        } catch (const std::exception&) {
            std::cerr << "[NearbyBusinesses] Ignoring invalid radius '" << radiusParam->second << "'" << std::endl;
        }
    }

    std::vector<std::string> categories;
    auto categoriesParam = context.parameters.find("categories");
    if (categoriesParam != context.parameters.end()) {
        categories = SplitCategories(categoriesParam->second);
    }

    auto latitude = lookupCoordinate(context, "latitude");
    auto longitude = lookupCoordinate(context, "longitude");
    if (!latitude || !longitude || std::abs(*latitude) > 90.0 || std::abs(*longitude) > 180.0) {
        std::cerr << "[NearbyBusinesses] No valid coordinates for workflow " << context.workflowId << std::endl;
        ActionOutcome outcome;
        outcome.status = "location_unavailable";
        outcome.message = "Could not retrieve GPS coordinates";
        return outcome;
    }

    cancellation.throwIfCancellationRequested();
    std::cout << "[NearbyBusinesses] Searching within " << radiusMeters << "m of "
              << Fixed(*latitude, 6) << ", " << Fixed(*longitude, 6) << std::endl;

    auto businesses = m_locationService->getNearbyBusinesses(*latitude, *longitude, radiusMeters, categories);
    cancellation.throwIfCancellationRequested();

    if (!businesses) {
        return ActionOutcome::Error("Location service unavailable");
    }

    ActionOutcome outcome;
    outcome.status = ActionOutcome::kStatusSuccess;
    outcome.variables["latitude"] = Fixed(*latitude, 6);
    outcome.variables["longitude"] = Fixed(*longitude, 6);
    outcome.variables["radius"] = std::to_string(radiusMeters);
    outcome.variables["count"] = std::to_string(businesses->size());

    std::string names;
    for (std::size_t i = 0; i < businesses->size() && i < kMaxListed; ++i) {
        if (i > 0) names += ",";
        names += (*businesses)[i].name;
    }
    outcome.variables["businesses"] = names;

    if (!businesses->empty()) {
        const auto& closest = businesses->front();
        outcome.variables["closest_business"] = closest.name;
        outcome.variables["closest_distance"] = Fixed(closest.distanceMeters.value_or(0.0), 0);
    }

    std::cout << "[NearbyBusinesses] Found " << businesses->size() << " businesses" << std::endl;
    return outcome;
}

} // namespace waypoint::application::actions
