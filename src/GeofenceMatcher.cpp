#include <algorithm>
#include <cmath>
#include <mutex>
#include "GeofenceMatcher.hpp"
#include "Geo.hpp"

GeofenceMatcher::GeofenceMatcher(ZoneSource const& zones, VirtualClock const& clock, GeofenceSettings settings)
    : zones(zones)
    , clock(clock)
    , settings(settings)
    , bucketDegrees(settings.bucketMeters / Geo::METERS_PER_DEGREE_LAT)
{
}

GeofenceMatcher::BucketKey GeofenceMatcher::bucketFor(double lat, double lng) const
{
    return BucketKey{static_cast<std::int64_t>(std::llround(lat / bucketDegrees)),
                     static_cast<std::int64_t>(std::llround(lng / bucketDegrees))};
}

GeofenceResponse GeofenceMatcher::check(double lat, double lng)
{
    BucketKey key = bucketFor(lat, lng);
    Timestamp now = clock.now();

    {
        std::shared_lock<std::shared_mutex> lock(mutex);
        auto it = results.find(key);
        if (it != results.end() && now < it->second.expiresAt)
            return GeofenceResponse{it->second.zones, it->second.ids};
    }

    // One read of the zone set per check.
    std::vector<GeofenceZone> snapshot = zones.activeZones();

    CachedResult fresh;
    fresh.zones = match(snapshot, lat, lng);
    for (const auto& z : fresh.zones)
        fresh.ids.push_back(z.id);
    fresh.expiresAt = now + settings.resultTtl;

    GeofenceResponse response{fresh.zones, fresh.ids};
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        results[key] = std::move(fresh);
    }
    return response;
}

std::vector<GeofenceZone> GeofenceMatcher::match(std::vector<GeofenceZone> const& candidates, double lat, double lng)
{
    std::vector<std::pair<double, GeofenceZone const*>> triggered;

    for (const auto& zone : candidates)
    {
        if (!zone.active) continue;

        double distance = Geo::distanceMeters(lat, lng, zone.latitude, zone.longitude);
        if (distance <= zone.radiusMeters)
            triggered.emplace_back(distance, &zone);
    }

    std::stable_sort(triggered.begin(), triggered.end(),
        [](auto const& a, auto const& b)
        {
            if (a.second->priority != b.second->priority)
                return static_cast<int>(a.second->priority) < static_cast<int>(b.second->priority);
            return a.first < b.first;
        });

    std::vector<GeofenceZone> out;
    out.reserve(triggered.size());
    for (const auto& t : triggered)
        out.push_back(*t.second);
    return out;
}

std::size_t GeofenceMatcher::pruneExpired()
{
    Timestamp now = clock.now();
    std::unique_lock<std::shared_mutex> lock(mutex);

    std::size_t removed = 0;
    for (auto it = results.begin(); it != results.end();)
    {
        if (now >= it->second.expiresAt)
        {
            it = results.erase(it);
            ++removed;
        }
        else
        {
            ++it;
        }
    }
    return removed;
}

std::size_t GeofenceMatcher::cachedBuckets() const
{
    std::shared_lock<std::shared_mutex> lock(mutex);
    return results.size();
}
