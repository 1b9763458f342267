#pragma once
#include <cstdint>
#include "Types.hpp"

// Deterministic stand-in for the upstream feeds: the same seed and bounds
// always produce the same vehicles.
class MockFeed
{
public:
    static constexpr int BUS_COUNT   = 12;
    static constexpr int TRAIN_COUNT = 6;

    static FeedSnapshot generate(FeedType type, BoundingBox const& bounds, std::uint32_t seed, Timestamp now);
};
