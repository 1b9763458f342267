#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "Types.hpp"

// JSON shapes of the query interface.
class ResponseCodec
{
public:
    static std::string serialize(VehicleResponse const& response);
    static std::string serialize(GeofenceResponse const& response);
    static std::string error(std::string const& message);

    static nlohmann::json vehicleToJson(VehiclePosition const& vehicle);
    static nlohmann::json vehiclesToJson(VehicleResponse const& response);
    static nlohmann::json zoneToJson(GeofenceZone const& zone);
    static nlohmann::json geofenceToJson(GeofenceResponse const& response);

    // ISO-8601 UTC with milliseconds, e.g. 2026-10-19T08:50:12.345Z
    static std::string formatTimestamp(Timestamp t);
};
