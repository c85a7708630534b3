/**
 * @file LocationApiClient.cpp
 * @brief Implementation of LocationApiClient.
 */

#include "infrastructure/LocationApiClient.hpp"
#include <httplib.h>
#include <iostream>
#include <locale>
#include <sstream>

namespace waypoint::infrastructure {

using json = nlohmann::json;

namespace {

std::string FormatDouble(double value) {
    std::ostringstream out;
    out.imbue(std::locale::classic());
    out.precision(10);
    out << value;
    return out.str();
}

} // namespace

LocationApiClient::LocationApiClient(const std::string& host, int port, int timeoutSeconds)
    : m_host(host), m_port(port), m_timeoutSeconds(timeoutSeconds) {}

BusinessLocation LocationApiClient::ParseBusiness(const json& j) {
    BusinessLocation business;
    business.name = j.value("name", std::string());
    if (j.contains("address") && j["address"].is_string()) {
        business.address = j["address"].get<std::string>();
    }
    if (j.contains("category") && j["category"].is_string()) {
        business.category = j["category"].get<std::string>();
    }
    business.latitude = j.value("latitude", 0.0);
    business.longitude = j.value("longitude", 0.0);
    if (j.contains("distanceMeters") && j["distanceMeters"].is_number()) {
        business.distanceMeters = j["distanceMeters"].get<double>();
    }
    return business;
}

std::optional<std::vector<BusinessLocation>> LocationApiClient::getNearbyBusinesses(double latitude,
                                                                                    double longitude,
                                                                                    int radiusMeters,
                                                                                    const std::vector<std::string>& categories) {
    httplib::Client cli(m_host, m_port);
    cli.set_connection_timeout(m_timeoutSeconds);
    cli.set_read_timeout(m_timeoutSeconds);

    httplib::Params params;
    params.emplace("latitude", FormatDouble(latitude));
    params.emplace("longitude", FormatDouble(longitude));
    params.emplace("radiusMeters", std::to_string(radiusMeters));
    for (const auto& category : categories) {
        if (!category.empty()) {
            params.emplace("categories", category);
        }
    }

    auto res = cli.Get("/api/locations/nearby", params, httplib::Headers{});
    if (res && res->status == 200) {
        try {
            auto body = json::parse(res->body);
            if (!body.is_array()) {
                std::cerr << "[LocationApiClient] Expected a JSON array from /api/locations/nearby" << std::endl;
                return std::nullopt;
            }
            std::vector<BusinessLocation> businesses;
            for (const auto& item : body) {
                businesses.push_back(ParseBusiness(item));
            }
            return businesses;
        } catch (const std::exception& e) {
            std::cerr << "[LocationApiClient] JSON Parse Error: " << e.what() << std::endl;
        }
    } else {
        if (res) {
            std::cerr << "[LocationApiClient] HTTP Error " << res->status << ": " << res->body << std::endl;
        } else {
            std::cerr << "[LocationApiClient] Connection failed: " << static_cast<int>(res.error()) << std::endl;
        }
    }
    return std::nullopt;
}

} // namespace waypoint::infrastructure
