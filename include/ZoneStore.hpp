#pragma once
#include <string>
#include <vector>
#include <mutex>
#include "sqlite3.h"
#include "Types.hpp"

// Read side of the zone definitions, as the geofence matcher sees them.
class ZoneSource
{
public:
    virtual ~ZoneSource() = default;
    virtual std::vector<GeofenceZone> activeZones() const = 0;
};

// SQLite-backed zone definitions. Writers are the outside world (CSV import,
// admin tooling); the matcher only ever calls activeZones().
class ZoneStore : public ZoneSource
{
private:
    sqlite3* db;
    sqlite3_stmt* upsertStmt;
    mutable std::mutex mutex;

    bool upsertInternal(GeofenceZone const& zone);

public:
    explicit ZoneStore(std::string const& path);
    ~ZoneStore() override;

    ZoneStore(ZoneStore const&) = delete;
    ZoneStore& operator=(ZoneStore const&) = delete;

    bool upsert(GeofenceZone const& zone);
    int upsertMany(std::vector<GeofenceZone> const& zones);
    bool setActive(std::string const& zoneId, bool active);
    std::vector<GeofenceZone> activeZones() const override;
    std::size_t count() const;

    // id,lat,lng,radius_m,priority,active,message (header line required)
    int importCsv(std::string const& csvPath);
};
