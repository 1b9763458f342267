#include <date/date.h>
#include "ResponseCodec.hpp"

std::string ResponseCodec::serialize(VehicleResponse const& response)
{
    return vehiclesToJson(response).dump();
}

std::string ResponseCodec::serialize(GeofenceResponse const& response)
{
    return geofenceToJson(response).dump();
}

std::string ResponseCodec::error(std::string const& message)
{
    nlohmann::json j;
    j["error"] = message;
    return j.dump();
}

std::string ResponseCodec::formatTimestamp(Timestamp t)
{
    return date::format("%FT%TZ", date::floor<std::chrono::milliseconds>(t));
}

nlohmann::json ResponseCodec::vehicleToJson(VehiclePosition const& vehicle)
{
    nlohmann::json j;

    j["id"] = vehicle.id;
    j["vehicleClass"] = toString(vehicle.vehicleClass);
    j["routeId"] = vehicle.routeId;
    j["latitude"] = vehicle.latitude;
    j["longitude"] = vehicle.longitude;
    j["heading"] = vehicle.heading ? nlohmann::json(*vehicle.heading) : nlohmann::json(nullptr);
    j["speed"] = vehicle.speed ? nlohmann::json(*vehicle.speed) : nlohmann::json(nullptr);
    j["observedAt"] = formatTimestamp(vehicle.observedAt);

    return j;
}

nlohmann::json ResponseCodec::vehiclesToJson(VehicleResponse const& response)
{
    nlohmann::json j;

    j["buses"] = nlohmann::json::array();
    for (const auto& v : response.buses)
        j["buses"].push_back(vehicleToJson(v));

    j["trains"] = nlohmann::json::array();
    for (const auto& v : response.trains)
        j["trains"].push_back(vehicleToJson(v));

    j["timestamp"] = formatTimestamp(response.timestamp);
    j["source"] = toString(response.source);

    return j;
}

nlohmann::json ResponseCodec::zoneToJson(GeofenceZone const& zone)
{
    nlohmann::json j;

    j["id"] = zone.id;
    j["latitude"] = zone.latitude;
    j["longitude"] = zone.longitude;
    j["radiusMeters"] = zone.radiusMeters;
    j["priority"] = toString(zone.priority);
    j["message"] = zone.message;
    j["active"] = zone.active;

    return j;
}

nlohmann::json ResponseCodec::geofenceToJson(GeofenceResponse const& response)
{
    nlohmann::json j;

    j["alerts"] = nlohmann::json::array();
    for (const auto& z : response.alerts)
        j["alerts"].push_back(zoneToJson(z));

    j["triggeredZoneIds"] = response.triggeredZoneIds;

    return j;
}
