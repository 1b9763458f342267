#include "VehicleService.hpp"

VehicleService::VehicleService(PositionCache& cache, VirtualClock const& clock, bool mockMode)
    : cache(cache), clock(clock), mockMode(mockMode)
{
}

boost::asio::awaitable<VehicleResponse> VehicleService::vehicles()
{
    // Kick off both refreshes before waiting on either so the feeds load concurrently.
    cache.refresh(FeedType::Bus);
    cache.refresh(FeedType::Train);

    FeedSnapshot buses  = co_await cache.getOrFetch(FeedType::Bus);
    FeedSnapshot trains = co_await cache.getOrFetch(FeedType::Train);

    VehicleResponse response;
    response.buses     = std::move(buses.vehicles);
    response.trains    = std::move(trains.vehicles);
    response.timestamp = clock.now();
    response.source    = combine(buses.source, trains.source, mockMode);
    co_return response;
}

Provenance VehicleService::combine(Provenance bus, Provenance train, bool mockMode)
{
    if (mockMode)
        return Provenance::Mock;

    auto healthy = [](Provenance p) { return p == Provenance::Live || p == Provenance::Mock; };

    bool busOk   = healthy(bus);
    bool trainOk = healthy(train);

    if (busOk && trainOk)
        return Provenance::Live;
    if (busOk || trainOk)
        return Provenance::Partial;
    return Provenance::Error;
}
