#include <iostream>
#include <unordered_map>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include "PositionCache.hpp"
#include "Errors.hpp"

PositionCache::PositionCache(boost::asio::any_io_executor executor, Fetcher fetcher, VirtualClock const& clock, CacheSettings settings)
    : executor(std::move(executor))
    , fetcher(std::move(fetcher))
    , clock(clock)
    , settings(settings)
{
}

PositionCache::Entry& PositionCache::entryFor(FeedType type)
{
    return entries[type == FeedType::Bus ? 0 : 1];
}

PositionCache::Entry const& PositionCache::entryFor(FeedType type) const
{
    return entries[type == FeedType::Bus ? 0 : 1];
}

boost::asio::awaitable<FeedSnapshot> PositionCache::getOrFetch(FeedType type)
{
    std::optional<FeedSnapshot> immediate;
    std::shared_ptr<Flight> flight;
    bool started = false;

    {
        std::lock_guard<std::mutex> lock(mutex);
        Timestamp now = clock.now();
        Entry& entry = entryFor(type);

        if (entry.snapshot && now < entry.expiresAt)
        {
            immediate = *entry.snapshot;
        }
        else
        {
            flight = entry.inFlight;
            if (!flight)
            {
                flight = beginFlight(entry);
                started = true;
            }

            // Stale-while-revalidate. A cold or long-dead entry waits instead.
            if (withinGrace(entry, now))
                immediate = *entry.snapshot;
        }
    }

    if (started)
        launch(type, flight);

    if (immediate)
        co_return std::move(*immediate);

    co_return co_await awaitFlight(type, flight);
}

void PositionCache::refresh(FeedType type)
{
    std::shared_ptr<Flight> flight;
    {
        std::lock_guard<std::mutex> lock(mutex);
        Entry& entry = entryFor(type);

        if (entry.inFlight) return;
        if (entry.snapshot && clock.now() < entry.expiresAt) return;

        flight = beginFlight(entry);
    }
    launch(type, flight);
}

std::optional<FeedSnapshot> PositionCache::peek(FeedType type) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return entryFor(type).snapshot;
}

bool PositionCache::refreshing(FeedType type) const
{
    std::lock_guard<std::mutex> lock(mutex);
    return entryFor(type).inFlight != nullptr;
}

std::shared_ptr<PositionCache::Flight> PositionCache::beginFlight(Entry& entry)
{
    auto flight = std::make_shared<Flight>(executor);
    flight->signal.expires_after(settings.fetchTimeout);
    flight->generation = entry.generation;
    entry.inFlight = flight;
    return flight;
}

void PositionCache::launch(FeedType type, std::shared_ptr<Flight> flight)
{
    boost::asio::co_spawn(executor, runFlight(type, std::move(flight)), boost::asio::detached);
}

boost::asio::awaitable<void> PositionCache::runFlight(FeedType type, std::shared_ptr<Flight> flight)
{
    std::optional<FeedSnapshot> fresh;
    try
    {
        fresh = co_await fetcher(type);
    }
    catch (FetchError const& e)
    {
        std::cerr << "[Cache] " << toString(type) << " fetch failed: " << e.what() << std::endl;
    }
    catch (DecodeError const& e)
    {
        std::cerr << "[Cache] " << toString(type) << " feed rejected: " << e.what() << std::endl;
    }
    catch (std::exception const& e)
    {
        std::cerr << "[Cache] " << toString(type) << " refresh error: " << e.what() << std::endl;
    }

    finishFlight(type, flight, std::move(fresh));
}

boost::asio::awaitable<FeedSnapshot> PositionCache::awaitFlight(FeedType type, std::shared_ptr<Flight> flight)
{
    bool done = false;
    {
        std::lock_guard<std::mutex> lock(mutex);
        done = flight->result.has_value();
    }

    if (!done)
    {
        boost::system::error_code ec;
        co_await flight->signal.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    std::lock_guard<std::mutex> lock(mutex);
    if (flight->result)
        co_return *flight->result;

    // Deadline passed with the fetch still running: free the slot so the next
    // caller can retry, and answer from the fallback chain.
    Entry& entry = entryFor(type);
    if (entry.inFlight == flight)
    {
        entry.inFlight.reset();
        std::cerr << "[Cache] " << toString(type) << " fetch exceeded "
                  << settings.fetchTimeout.count() << "ms, slot released" << std::endl;
    }
    co_return degraded(type, entry, clock.now());
}

void PositionCache::finishFlight(FeedType type, std::shared_ptr<Flight> const& flight, std::optional<FeedSnapshot> fresh)
{
    std::lock_guard<std::mutex> lock(mutex);
    Timestamp now = clock.now();
    Entry& entry = entryFor(type);

    if (fresh && entry.generation != flight->generation && entry.snapshot)
    {
        // A newer flight stored while this one was abandoned; keep its data.
        std::cerr << "[Cache] " << toString(type) << " late fetch result dropped" << std::endl;
        flight->result = *entry.snapshot;
    }
    else if (fresh)
    {
        store(entry, std::move(*fresh), now);
        flight->result = *entry.snapshot;
    }
    else
    {
        // A late failure from an abandoned flight must not downgrade a newer store.
        if (entry.snapshot && entry.generation == flight->generation)
            entry.snapshot->source = Provenance::Cached;
        flight->result = degraded(type, entry, now);
    }

    if (entry.inFlight == flight)
        entry.inFlight.reset();

    flight->signal.cancel();
}

void PositionCache::store(Entry& entry, FeedSnapshot fresh, Timestamp now)
{
    if (entry.snapshot)
    {
        std::unordered_map<std::string, VehiclePosition const*> previous;
        for (const auto& v : entry.snapshot->vehicles)
            previous.emplace(v.id, &v);

        for (auto& v : fresh.vehicles)
        {
            auto it = previous.find(v.id);
            if (it != previous.end() && it->second->observedAt > v.observedAt)
                v = *it->second;
        }
    }

    entry.snapshot  = std::move(fresh);
    entry.storedAt  = now;
    entry.expiresAt = now + settings.ttl;
    ++entry.generation;
}

bool PositionCache::withinGrace(Entry const& entry, Timestamp now) const
{
    if (!entry.snapshot) return false;
    return now - entry.storedAt <= settings.ttl * settings.staleGraceFactor;
}

FeedSnapshot PositionCache::degraded(FeedType type, Entry const& entry, Timestamp now) const
{
    if (withinGrace(entry, now))
    {
        FeedSnapshot copy = *entry.snapshot;
        copy.source = Provenance::Cached;
        return copy;
    }

    FeedSnapshot empty;
    empty.type       = type;
    empty.capturedAt = now;
    empty.source     = Provenance::Error;
    return empty;
}
