#include "FeedAcquirer.hpp"
#include "FeedDecoder.hpp"
#include "MockFeed.hpp"

FeedAcquirer::FeedAcquirer(EngineSettings const& settings, FeedTransport& transport, VirtualClock const& clock)
    : settings(settings), transport(transport), clock(clock)
{
}

std::string const& FeedAcquirer::upstreamUrl(FeedType type) const noexcept
{
    return type == FeedType::Bus ? settings.busFeedUrl : settings.trainFeedUrl;
}

boost::asio::awaitable<FeedSnapshot> FeedAcquirer::acquire(FeedType type)
{
    if (settings.mockMode)
        co_return MockFeed::generate(type, settings.serviceArea, settings.mockSeed, clock.now());

    std::string data = co_await transport.get(upstreamUrl(type));

    FeedSnapshot snapshot;
    snapshot.type       = type;
    snapshot.vehicles   = FeedDecoder::decode(data, type, settings.serviceArea);
    snapshot.capturedAt = clock.now();
    snapshot.source     = Provenance::Live;
    co_return snapshot;
}
