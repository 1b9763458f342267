#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "Types.hpp"
#include "VirtualClock.hpp"
#include "ZoneStore.hpp"

struct GeofenceSettings
{
    double bucketMeters = 75.0;                  // grid resolution of the result cache
    std::chrono::seconds resultTtl{60};
};

// Which active zones contain a point, most urgent first.
//
// Results are cached per grid bucket for resultTtl, so a point near a zone
// edge can keep the answer computed for its bucket until the entry expires.
class GeofenceMatcher
{
public:
    GeofenceMatcher(ZoneSource const& zones, VirtualClock const& clock, GeofenceSettings settings);

    GeofenceResponse check(double lat, double lng);

    // Drops expired buckets; returns how many were removed.
    std::size_t pruneExpired();
    [[nodiscard]] std::size_t cachedBuckets() const;

    // Containment plus ordering against an explicit zone set, no caching.
    static std::vector<GeofenceZone> match(std::vector<GeofenceZone> const& candidates, double lat, double lng);

private:
    struct BucketKey
    {
        std::int64_t latIndex;
        std::int64_t lngIndex;

        bool operator==(BucketKey const& other) const
        {
            return latIndex == other.latIndex && lngIndex == other.lngIndex;
        }
    };

    struct BucketKeyHash
    {
        std::size_t operator()(BucketKey const& key) const noexcept
        {
            return std::hash<std::int64_t>()(key.latIndex) * 31u ^ std::hash<std::int64_t>()(key.lngIndex);
        }
    };

    struct CachedResult
    {
        std::vector<GeofenceZone> zones;
        std::vector<std::string> ids;
        Timestamp expiresAt;
    };

    ZoneSource const& zones;
    VirtualClock const& clock;
    GeofenceSettings settings;
    double bucketDegrees;

    std::unordered_map<BucketKey, CachedResult, BucketKeyHash> results;
    mutable std::shared_mutex mutex;

    BucketKey bucketFor(double lat, double lng) const;
};
