#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <cmath>
#include <optional>

using Timestamp = std::chrono::system_clock::time_point;

enum class FeedType
{
    Bus,
    Train
};

// How a snapshot was obtained.
enum class Provenance
{
    Live,
    Cached,
    Mock,
    Partial,
    Error
};

enum class ZonePriority
{
    Urgent = 0,
    High   = 1,
    Normal = 2,
    Low    = 3
};

std::string toString(FeedType type);
std::string toString(Provenance source);
std::string toString(ZonePriority priority);
std::optional<ZonePriority> parsePriority(std::string const& text);

struct BoundingBox
{
    double minLat = -90.0;
    double minLng = -180.0;
    double maxLat = 90.0;
    double maxLng = 180.0;

    bool contains(double lat, double lng) const
    {
        if (!std::isfinite(lat) || !std::isfinite(lng)) return false;
        if (lat < -90.0 || lat > 90.0 || lng < -180.0 || lng > 180.0) return false;
        return lat >= minLat && lat <= maxLat && lng >= minLng && lng <= maxLng;
    }
};

// One vehicle at one observed instant.
struct VehiclePosition
{
    std::string id;
    FeedType vehicleClass = FeedType::Bus;
    std::string routeId;
    double latitude  = 0.0;
    double longitude = 0.0;
    std::optional<double> heading;   // degrees, [0, 360)
    std::optional<double> speed;     // m/s
    Timestamp observedAt;
};

struct FeedSnapshot
{
    FeedType type = FeedType::Bus;
    std::vector<VehiclePosition> vehicles;
    Timestamp capturedAt;
    Provenance source = Provenance::Error;
};

struct GeofenceZone
{
    std::string id;
    double latitude  = 0.0;
    double longitude = 0.0;
    double radiusMeters = 0.0;
    ZonePriority priority = ZonePriority::Normal;
    std::string message;
    bool active = true;
};

struct VehicleResponse
{
    std::vector<VehiclePosition> buses;
    std::vector<VehiclePosition> trains;
    Timestamp timestamp;
    Provenance source = Provenance::Error;
};

struct GeofenceResponse
{
    std::vector<GeofenceZone> alerts;
    std::vector<std::string> triggeredZoneIds;
};
