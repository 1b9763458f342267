#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include "Types.hpp"
#include "VirtualClock.hpp"

struct CacheSettings
{
    std::chrono::seconds ttl{30};
    int staleGraceFactor = 5;                      // grace window = factor * ttl
    std::chrono::milliseconds fetchTimeout{10000};
};

// TTL cache with one slot per feed type and single-flight refresh.
//
// At most one upstream fetch per feed type is in flight. Callers that arrive
// while it runs either get the stale entry at once (when it is still inside
// the grace window) or wait for the shared result. A fetch that fails or
// outlives fetchTimeout is answered with the fallback chain: the last good
// snapshot tagged Cached while inside the grace window, otherwise an empty
// snapshot tagged Error. Once a refresh has failed, stale reads carry the
// Cached tag until a fetch succeeds. Exceptions never leave getOrFetch.
//
// All coroutines must run on a single-threaded io_context (or one strand);
// the mutex only protects peek() and refreshing() callers on other threads.
// The cache must outlive every coroutine it spawned on the executor.
class PositionCache
{
public:
    using Fetcher = std::function<boost::asio::awaitable<FeedSnapshot>(FeedType)>;

    PositionCache(boost::asio::any_io_executor executor, Fetcher fetcher, VirtualClock const& clock, CacheSettings settings);

    boost::asio::awaitable<FeedSnapshot> getOrFetch(FeedType type);

    // Starts a background fetch when the entry is expired and none is running.
    void refresh(FeedType type);

    [[nodiscard]] std::optional<FeedSnapshot> peek(FeedType type) const;
    [[nodiscard]] bool refreshing(FeedType type) const;

private:
    struct Flight
    {
        explicit Flight(boost::asio::any_io_executor const& executor) : signal(executor) {}

        // Expires at the fetch deadline; cancelled early when the result lands.
        boost::asio::steady_timer signal;
        std::optional<FeedSnapshot> result;
        std::uint64_t generation = 0;           // entry generation at launch
    };

    struct Entry
    {
        std::optional<FeedSnapshot> snapshot;   // last good snapshot
        Timestamp storedAt;
        Timestamp expiresAt;
        std::shared_ptr<Flight> inFlight;
        std::uint64_t generation = 0;           // bumped on every store
    };

    boost::asio::any_io_executor executor;
    Fetcher fetcher;
    VirtualClock const& clock;
    CacheSettings settings;
    std::array<Entry, 2> entries;
    mutable std::mutex mutex;

    Entry& entryFor(FeedType type);
    Entry const& entryFor(FeedType type) const;

    std::shared_ptr<Flight> beginFlight(Entry& entry);
    void launch(FeedType type, std::shared_ptr<Flight> flight);
    boost::asio::awaitable<void> runFlight(FeedType type, std::shared_ptr<Flight> flight);
    boost::asio::awaitable<FeedSnapshot> awaitFlight(FeedType type, std::shared_ptr<Flight> flight);
    void finishFlight(FeedType type, std::shared_ptr<Flight> const& flight, std::optional<FeedSnapshot> fresh);

    void store(Entry& entry, FeedSnapshot fresh, Timestamp now);
    bool withinGrace(Entry const& entry, Timestamp now) const;
    FeedSnapshot degraded(FeedType type, Entry const& entry, Timestamp now) const;
};
