#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include "Types.hpp"

enum class TransportMode
{
    Direct,
    Relayed
};

struct EngineSettings
{
    TransportMode transport = TransportMode::Direct;
    bool mockMode = false;
    std::uint32_t mockSeed = 42;

    std::string busFeedUrl;
    std::string trainFeedUrl;
    std::string relayUrl;
    std::string apiKey;

    BoundingBox serviceArea;

    std::chrono::seconds feedTtl{30};
    int staleGraceFactor = 5;
    std::chrono::milliseconds fetchTimeout{10000};

    double geofenceBucketMeters = 75.0;
    std::chrono::seconds geofenceTtl{60};

    std::string zonesDbPath = "zones.db";
    std::string zonesCsvPath;

    unsigned short httpPort = 8080;
};

class ConfigurationManager
{
public:
    using EnvironmentLookup = std::function<std::optional<std::string>(std::string const&)>;

    ConfigurationManager();
    explicit ConfigurationManager(EnvironmentLookup lookup);

    static std::optional<std::string> systemEnvironment(std::string const& name);

    [[nodiscard]] EngineSettings const& getSettings() const noexcept;

private:
    EnvironmentLookup lookup;
    EngineSettings settings;

    void load();
    std::optional<std::string> get(std::string const& name) const;
    std::string require(std::string const& name) const;
    long long integer(std::string const& name, long long fallback, long long minimum) const;
    double number(std::string const& name, double fallback) const;
    bool flag(std::string const& name) const;
    BoundingBox boundingBox(std::string const& name) const;
};
