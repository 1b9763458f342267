#include <random>
#include <sstream>
#include <iomanip>
#include "MockFeed.hpp"

FeedSnapshot MockFeed::generate(FeedType type, BoundingBox const& bounds, std::uint32_t seed, Timestamp now)
{
    std::mt19937 rng(seed * 2654435761u + (type == FeedType::Train ? 1u : 0u));

    // Keep markers off the edges of the service area.
    double latMargin = (bounds.maxLat - bounds.minLat) * 0.1;
    double lngMargin = (bounds.maxLng - bounds.minLng) * 0.1;
    std::uniform_real_distribution<double> latDist(bounds.minLat + latMargin, bounds.maxLat - latMargin);
    std::uniform_real_distribution<double> lngDist(bounds.minLng + lngMargin, bounds.maxLng - lngMargin);
    std::uniform_real_distribution<double> headingDist(0.0, 360.0);
    std::uniform_real_distribution<double> speedDist(0.0, type == FeedType::Train ? 25.0 : 15.0);
    std::uniform_int_distribution<int> routeDist(1, type == FeedType::Train ? 4 : 30);

    static const char* trainLines[] = {"RED", "GOLD", "BLUE", "GREEN"};

    FeedSnapshot snapshot;
    snapshot.type       = type;
    snapshot.capturedAt = now;
    snapshot.source     = Provenance::Mock;

    int count = type == FeedType::Train ? TRAIN_COUNT : BUS_COUNT;
    snapshot.vehicles.reserve(count);

    for (int i = 1; i <= count; ++i)
    {
        std::ostringstream id;
        id << "mock-" << toString(type) << "-" << std::setw(3) << std::setfill('0') << i;

        VehiclePosition v;
        v.id           = id.str();
        v.vehicleClass = type;
        v.latitude     = latDist(rng);
        v.longitude    = lngDist(rng);
        v.heading      = headingDist(rng);
        v.speed        = speedDist(rng);
        int route      = routeDist(rng);
        v.routeId      = type == FeedType::Train ? trainLines[route - 1] : std::to_string(route);
        v.observedAt   = now;

        snapshot.vehicles.push_back(std::move(v));
    }

    return snapshot;
}
