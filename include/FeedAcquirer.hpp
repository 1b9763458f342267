#pragma once
#include <string>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "ConfigurationManager.hpp"
#include "FeedTransport.hpp"
#include "VirtualClock.hpp"
#include "Types.hpp"

// One upstream cycle for one feed type: transport -> decoder -> snapshot.
class FeedAcquirer
{
private:
    EngineSettings const& settings;
    FeedTransport& transport;
    VirtualClock const& clock;

public:
    FeedAcquirer(EngineSettings const& settings, FeedTransport& transport, VirtualClock const& clock);

    // Returns a Live snapshot, or a Mock one in mock mode.
    // Throws FetchError or DecodeError; the position cache turns those into a degraded snapshot.
    boost::asio::awaitable<FeedSnapshot> acquire(FeedType type);

    [[nodiscard]] std::string const& upstreamUrl(FeedType type) const noexcept;
};
