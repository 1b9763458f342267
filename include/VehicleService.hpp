#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "PositionCache.hpp"
#include "VirtualClock.hpp"
#include "Types.hpp"

// The vehicle half of the query interface: both feeds, one provenance tag.
class VehicleService
{
private:
    PositionCache& cache;
    VirtualClock const& clock;
    bool mockMode;

public:
    VehicleService(PositionCache& cache, VirtualClock const& clock, bool mockMode);

    // Never throws for upstream trouble; degradation shows up in `source`.
    boost::asio::awaitable<VehicleResponse> vehicles();

    static Provenance combine(Provenance bus, Provenance train, bool mockMode);
};
