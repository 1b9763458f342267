#include <cstdlib>
#include <sstream>
#include <algorithm>
#include <cctype>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"

namespace
{
    std::string lowered(std::string text)
    {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return text;
    }

    std::optional<double> parseDouble(std::string const& text)
    {
        if (text.empty()) return std::nullopt;
        char* end = nullptr;
        double value = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0') return std::nullopt;
        return value;
    }
}

ConfigurationManager::ConfigurationManager()
    : ConfigurationManager(&ConfigurationManager::systemEnvironment)
{
}

ConfigurationManager::ConfigurationManager(EnvironmentLookup lookup)
    : lookup(std::move(lookup))
{
    load();
}

std::optional<std::string> ConfigurationManager::systemEnvironment(std::string const& name)
{
    const char* value = std::getenv(name.c_str());
    if (!value) return std::nullopt;
    return std::string(value);
}

EngineSettings const& ConfigurationManager::getSettings() const noexcept { return settings; }

void ConfigurationManager::load()
{
    settings.mockMode = flag("TRANSIT_MOCK_MODE");
    settings.mockSeed = static_cast<std::uint32_t>(integer("TRANSIT_MOCK_SEED", 42, 0));

    std::string transport = lowered(get("TRANSIT_TRANSPORT").value_or("direct"));
    if (transport == "direct")
        settings.transport = TransportMode::Direct;
    else if (transport == "relay" || transport == "relayed")
        settings.transport = TransportMode::Relayed;
    else
        throw ConfigError(ConfigError::Kind::InvalidParameter, "TRANSIT_TRANSPORT",
                          "TRANSIT_TRANSPORT must be 'direct' or 'relay', got '" + transport + "'");

    if (!settings.mockMode)
    {
        settings.busFeedUrl   = require("TRANSIT_BUS_FEED_URL");
        settings.trainFeedUrl = require("TRANSIT_TRAIN_FEED_URL");
        if (settings.transport == TransportMode::Relayed)
            settings.relayUrl = require("TRANSIT_RELAY_URL");
    }
    else
    {
        settings.busFeedUrl   = get("TRANSIT_BUS_FEED_URL").value_or("");
        settings.trainFeedUrl = get("TRANSIT_TRAIN_FEED_URL").value_or("");
        settings.relayUrl     = get("TRANSIT_RELAY_URL").value_or("");
    }

    settings.apiKey      = get("TRANSIT_API_KEY").value_or("");
    settings.serviceArea = boundingBox("TRANSIT_SERVICE_AREA");

    settings.feedTtl          = std::chrono::seconds(integer("TRANSIT_FEED_TTL_SEC", 30, 1));
    settings.staleGraceFactor = static_cast<int>(integer("TRANSIT_STALE_GRACE_FACTOR", 5, 1));
    settings.fetchTimeout     = std::chrono::milliseconds(integer("TRANSIT_FETCH_TIMEOUT_MS", 10000, 1));

    settings.geofenceBucketMeters = number("TRANSIT_GEOFENCE_BUCKET_METERS", 75.0);
    if (settings.geofenceBucketMeters <= 0.0)
        throw ConfigError(ConfigError::Kind::InvalidParameter, "TRANSIT_GEOFENCE_BUCKET_METERS",
                          "TRANSIT_GEOFENCE_BUCKET_METERS must be positive");
    settings.geofenceTtl = std::chrono::seconds(integer("TRANSIT_GEOFENCE_TTL_SEC", 60, 1));

    settings.zonesDbPath  = get("TRANSIT_ZONES_DB").value_or("zones.db");
    settings.zonesCsvPath = get("TRANSIT_ZONES_CSV").value_or("");

    long long port = integer("TRANSIT_HTTP_PORT", 8080, 1);
    if (port > 65535)
        throw ConfigError(ConfigError::Kind::InvalidParameter, "TRANSIT_HTTP_PORT",
                          "TRANSIT_HTTP_PORT out of range");
    settings.httpPort = static_cast<unsigned short>(port);
}

std::optional<std::string> ConfigurationManager::get(std::string const& name) const
{
    auto value = lookup(name);
    if (!value || value->empty()) return std::nullopt;
    return value;
}

std::string ConfigurationManager::require(std::string const& name) const
{
    auto value = get(name);
    if (!value)
        throw ConfigError(ConfigError::Kind::MissingParameter, name, name + " not set.");
    return *value;
}

long long ConfigurationManager::integer(std::string const& name, long long fallback, long long minimum) const
{
    auto value = get(name);
    if (!value) return fallback;

    char* end = nullptr;
    long long parsed = std::strtoll(value->c_str(), &end, 10);
    if (end == value->c_str() || *end != '\0' || parsed < minimum)
        throw ConfigError(ConfigError::Kind::InvalidParameter, name,
                          name + " must be an integer >= " + std::to_string(minimum) + ", got '" + *value + "'");
    return parsed;
}

double ConfigurationManager::number(std::string const& name, double fallback) const
{
    auto value = get(name);
    if (!value) return fallback;

    auto parsed = parseDouble(*value);
    if (!parsed)
        throw ConfigError(ConfigError::Kind::InvalidParameter, name,
                          name + " must be a number, got '" + *value + "'");
    return *parsed;
}

bool ConfigurationManager::flag(std::string const& name) const
{
    auto value = get(name);
    if (!value) return false;

    std::string v = lowered(*value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

BoundingBox ConfigurationManager::boundingBox(std::string const& name) const
{
    std::string text = require(name);

    std::vector<double> parts;
    std::stringstream ss(text);
    std::string segment;
    while (std::getline(ss, segment, ','))
    {
        segment.erase(std::remove_if(segment.begin(), segment.end(),
                                     [](unsigned char c) { return std::isspace(c); }),
                      segment.end());
        auto parsed = parseDouble(segment);
        if (!parsed)
            throw ConfigError(ConfigError::Kind::InvalidParameter, name,
                              name + " has a non-numeric component '" + segment + "'");
        parts.push_back(*parsed);
    }

    if (parts.size() != 4)
        throw ConfigError(ConfigError::Kind::InvalidParameter, name,
                          name + " must be minLat,minLng,maxLat,maxLng");

    BoundingBox box{parts[0], parts[1], parts[2], parts[3]};
    if (box.minLat >= box.maxLat || box.minLng >= box.maxLng
        || box.minLat < -90.0 || box.maxLat > 90.0 || box.minLng < -180.0 || box.maxLng > 180.0)
        throw ConfigError(ConfigError::Kind::InvalidParameter, name,
                          name + " is not a valid bounding box");

    return box;
}
