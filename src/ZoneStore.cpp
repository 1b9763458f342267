#include <fstream>
#include <sstream>
#include <iostream>
#include <cstdlib>
#include "ZoneStore.hpp"

ZoneStore::ZoneStore(std::string const& path)
    : db(nullptr), upsertStmt(nullptr)
{
    int rc = sqlite3_open(path.c_str(), &db);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Zones] Failed to open SQLite DB " << path << ": " << sqlite3_errmsg(db) << "\n";
    }

    const char* createSql =
        "CREATE TABLE IF NOT EXISTS Zones ("
        "  id TEXT PRIMARY KEY, "
        "  latitude REAL NOT NULL, "
        "  longitude REAL NOT NULL, "
        "  radiusMeters REAL NOT NULL, "
        "  priority INTEGER NOT NULL, "
        "  message TEXT, "
        "  active INTEGER NOT NULL DEFAULT 1"
        ");";

    char* errMsg = nullptr;
    rc = sqlite3_exec(db, createSql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Zones] Failed to create tables: "
                  << (errMsg ? errMsg : "unknown error") << "\n";
        if (errMsg) sqlite3_free(errMsg);
    }

    const char* upsertSql =
        "INSERT INTO Zones (id, latitude, longitude, radiusMeters, priority, message, active) "
        "VALUES (?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(id) DO UPDATE SET "
        "  latitude = excluded.latitude, longitude = excluded.longitude, "
        "  radiusMeters = excluded.radiusMeters, priority = excluded.priority, "
        "  message = excluded.message, active = excluded.active;";

    rc = sqlite3_prepare_v2(db, upsertSql, -1, &upsertStmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Zones] Failed to prepare upsert statement: "
                  << sqlite3_errmsg(db) << "\n";
        upsertStmt = nullptr;
    }
}

ZoneStore::~ZoneStore()
{
    if (upsertStmt) sqlite3_finalize(upsertStmt);
    if (db) sqlite3_close(db);
}

bool ZoneStore::upsert(GeofenceZone const& zone)
{
    std::lock_guard<std::mutex> lock(mutex);
    return upsertInternal(zone);
}

bool ZoneStore::upsertInternal(GeofenceZone const& zone)
{
    if (!upsertStmt)
        return false;

    sqlite3_reset(upsertStmt);

    sqlite3_bind_text(upsertStmt, 1, zone.id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(upsertStmt, 2, zone.latitude);
    sqlite3_bind_double(upsertStmt, 3, zone.longitude);
    sqlite3_bind_double(upsertStmt, 4, zone.radiusMeters);
    sqlite3_bind_int(upsertStmt, 5, static_cast<int>(zone.priority));
    sqlite3_bind_text(upsertStmt, 6, zone.message.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(upsertStmt, 7, zone.active ? 1 : 0);

    int rc = sqlite3_step(upsertStmt);
    if (rc != SQLITE_DONE)
    {
        std::cerr << "[Zones] Upsert of " << zone.id << " failed: " << sqlite3_errmsg(db) << "\n";
        return false;
    }
    return true;
}

int ZoneStore::upsertMany(std::vector<GeofenceZone> const& zones)
{
    std::lock_guard<std::mutex> lock(mutex);

    sqlite3_exec(db, "BEGIN TRANSACTION;", nullptr, nullptr, nullptr);

    int stored = 0;
    for (const GeofenceZone& zone : zones)
    {
        if (upsertInternal(zone))
            ++stored;
    }

    sqlite3_exec(db, "COMMIT;", nullptr, nullptr, nullptr);
    return stored;
}

bool ZoneStore::setActive(std::string const& zoneId, bool active)
{
    std::lock_guard<std::mutex> lock(mutex);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "UPDATE Zones SET active = ? WHERE id = ?;", -1, &stmt, nullptr) != SQLITE_OK)
    {
        std::cerr << "[Zones] Failed to prepare setActive: " << sqlite3_errmsg(db) << "\n";
        return false;
    }

    sqlite3_bind_int(stmt, 1, active ? 1 : 0);
    sqlite3_bind_text(stmt, 2, zoneId.c_str(), -1, SQLITE_TRANSIENT);

    bool changed = false;
    if (sqlite3_step(stmt) == SQLITE_DONE)
        changed = sqlite3_changes(db) > 0;
    else
        std::cerr << "[Zones] setActive(" << zoneId << ") failed: " << sqlite3_errmsg(db) << "\n";

    sqlite3_finalize(stmt);
    return changed;
}

std::vector<GeofenceZone> ZoneStore::activeZones() const
{
    std::lock_guard<std::mutex> lock(mutex);

    std::vector<GeofenceZone> results;
    const char* sql =
        "SELECT id, latitude, longitude, radiusMeters, priority, message "
        "FROM Zones WHERE active = 1 ORDER BY id;";

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        std::cerr << "[Zones] Failed to prepare activeZones: "
                  << sqlite3_errmsg(db) << "\n";
        return results;
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW)
    {
        GeofenceZone z;

        const unsigned char* id      = sqlite3_column_text(stmt, 0);
        const unsigned char* message = sqlite3_column_text(stmt, 5);

        z.id           = id ? reinterpret_cast<const char*>(id) : "";
        z.latitude     = sqlite3_column_double(stmt, 1);
        z.longitude    = sqlite3_column_double(stmt, 2);
        z.radiusMeters = sqlite3_column_double(stmt, 3);

        int priority = sqlite3_column_int(stmt, 4);
        z.priority = (priority >= 0 && priority <= 3) ? static_cast<ZonePriority>(priority) : ZonePriority::Normal;

        z.message = message ? reinterpret_cast<const char*>(message) : "";
        z.active  = true;

        results.push_back(std::move(z));
    }

    if (rc != SQLITE_DONE)
    {
        std::cerr << "[Zones] Error stepping activeZones: "
                  << sqlite3_errmsg(db) << "\n";
    }

    sqlite3_finalize(stmt);
    return results;
}

std::size_t ZoneStore::count() const
{
    std::lock_guard<std::mutex> lock(mutex);

    sqlite3_stmt* stmt = nullptr;
    std::size_t total = 0;
    if (sqlite3_prepare_v2(db, "SELECT count(*) FROM Zones;", -1, &stmt, nullptr) == SQLITE_OK
        && sqlite3_step(stmt) == SQLITE_ROW)
    {
        total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return total;
}

int ZoneStore::importCsv(std::string const& csvPath)
{
    std::ifstream file(csvPath);
    if (!file.is_open())
    {
        std::cerr << "[Zones] ERROR: Could not open " << csvPath << std::endl;
        return 0;
    }

    std::cout << "[Zones] Importing " << csvPath << "..." << std::endl;

    std::vector<GeofenceZone> zones;
    std::string line;
    std::getline(file, line);

    int lineNo = 1;
    while (std::getline(file, line))
    {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::stringstream ss(line);
        std::string id, lat, lng, radius, priority, active, message;
        std::getline(ss, id, ',');
        std::getline(ss, lat, ',');
        std::getline(ss, lng, ',');
        std::getline(ss, radius, ',');
        std::getline(ss, priority, ',');
        std::getline(ss, active, ',');
        std::getline(ss, message);   // rest of the line, commas allowed

        GeofenceZone z;
        char* latEnd = nullptr;
        char* lngEnd = nullptr;
        char* radiusEnd = nullptr;
        z.id           = id;
        z.latitude     = std::strtod(lat.c_str(), &latEnd);
        z.longitude    = std::strtod(lng.c_str(), &lngEnd);
        z.radiusMeters = std::strtod(radius.c_str(), &radiusEnd);
        auto parsedPriority = parsePriority(priority);

        if (id.empty() || latEnd == lat.c_str() || lngEnd == lng.c_str()
            || radiusEnd == radius.c_str() || z.radiusMeters < 0.0 || !parsedPriority)
        {
            std::cerr << "[Zones] Skipping malformed line " << lineNo << " of " << csvPath << "\n";
            continue;
        }

        z.priority = *parsedPriority;
        z.active   = !(active == "0" || active == "false" || active == "no");
        z.message  = message;
        zones.push_back(std::move(z));
    }

    int stored = upsertMany(zones);
    std::cout << "[Zones] Import Complete. Loaded " << stored << " zones." << std::endl;
    return stored;
}
