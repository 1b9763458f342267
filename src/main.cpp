#include <string>
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <optional>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "ConfigurationManager.hpp"
#include "Errors.hpp"
#include "HttpFeedClient.hpp"
#include "FeedTransport.hpp"
#include "FeedAcquirer.hpp"
#include "PositionCache.hpp"
#include "VehicleService.hpp"
#include "ZoneStore.hpp"
#include "GeofenceMatcher.hpp"
#include "ApiServer.hpp"
#include "VirtualClock.hpp"

boost::asio::awaitable<void> runPollingLoop(PositionCache& cache, GeofenceMatcher& geofence, boost::asio::io_context& io, std::chrono::seconds interval)
{
    boost::asio::steady_timer timer(io);
    auto lastPruneTime = std::chrono::steady_clock::now();

    for (;;)
    {
        std::cout << "\n[T=" << std::time(nullptr) << "] --- Feed Refresh ---" << std::endl;

        cache.refresh(FeedType::Bus);
        cache.refresh(FeedType::Train);

        for (FeedType type : {FeedType::Bus, FeedType::Train})
        {
            FeedSnapshot snapshot = co_await cache.getOrFetch(type);
            std::cout << "   | " << toString(type) << ": " << snapshot.vehicles.size()
                      << " vehicles (" << toString(snapshot.source) << ")." << std::endl;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::seconds>(now - lastPruneTime).count() > 3600)
        {
            std::size_t removed = geofence.pruneExpired();
            std::cout << "   [Maintenance] Pruned " << removed << " expired geofence buckets." << std::endl;
            lastPruneTime = now;
        }

        timer.expires_after(interval);
        co_await timer.async_wait(boost::asio::use_awaitable);
    }
}

void parseCommandLineArgs(int argc, char* argv[], bool& mockMode, unsigned short& port)
{
    mockMode = false;
    port = 0;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--mock")
        {
            mockMode = true;
        }
        else if (arg == "--port" && i + 1 < argc)
        {
            int value = std::atoi(argv[++i]);
            if (value > 0 && value <= 65535)
                port = static_cast<unsigned short>(value);
            else
                std::cerr << "Warning: ignoring invalid port: " << argv[i] << "\n";
        }
        else
        {
            std::cerr << "Warning: ignoring unknown or malformed argument: " << arg << "\n";
        }
    }
}

int main(int argc, char* argv[])
{
    try
    {
        bool forceMock = false;
        unsigned short portOverride = 0;

        parseCommandLineArgs(argc, argv, forceMock, portOverride);

        ConfigurationManager config([forceMock](std::string const& name) -> std::optional<std::string>
        {
            if (forceMock && name == "TRANSIT_MOCK_MODE")
                return std::string("1");
            return ConfigurationManager::systemEnvironment(name);
        });

        EngineSettings settings = config.getSettings();
        if (portOverride != 0)
            settings.httpPort = portOverride;

        boost::asio::io_context io;
        VirtualClock clock;

        HttpFeedClient client(io, settings.apiKey, settings.fetchTimeout);
        auto transport = makeTransport(settings, client);
        FeedAcquirer acquirer(settings, *transport, clock);

        PositionCache cache(io.get_executor(),
                            [&acquirer](FeedType type) { return acquirer.acquire(type); },
                            clock,
                            CacheSettings{settings.feedTtl, settings.staleGraceFactor, settings.fetchTimeout});
        VehicleService service(cache, clock, settings.mockMode);

        ZoneStore zones(settings.zonesDbPath);
        if (!settings.zonesCsvPath.empty())
            zones.importCsv(settings.zonesCsvPath);
        GeofenceMatcher matcher(zones, clock, GeofenceSettings{settings.geofenceBucketMeters, settings.geofenceTtl});

        std::cout << "[System] Transport: " << transport->name()
                  << (settings.mockMode ? " (mock mode, upstreams bypassed)" : "") << "\n";
        std::cout << "[System] " << zones.count() << " geofence zones in " << settings.zonesDbPath << "\n";
        std::cout << "System Initialized.\n";

        ApiServer server(io, settings.httpPort, service, matcher);
        server.start();

        boost::asio::co_spawn(io, runPollingLoop(cache, matcher, io, settings.feedTtl), boost::asio::detached);

        io.run();
    }
    catch (ConfigError const& e)
    {
        std::cerr << "Configuration Error: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception& e)
    {
        std::cerr << "Main Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
