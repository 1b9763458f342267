#include <gtest/gtest.h>
#include <cstdint>
#include "FeedDecoder.hpp"
#include "Errors.hpp"
#include "gtfs-realtime.pb.h"

namespace
{
    BoundingBox const ATLANTA{33.40, -84.80, 34.10, -84.00};

    transit_realtime::FeedMessage emptyFeed(std::string const& version = "2.0")
    {
        transit_realtime::FeedMessage feed;
        feed.mutable_header()->set_gtfs_realtime_version(version);
        feed.mutable_header()->set_timestamp(1760000000);
        return feed;
    }

    void addTrain(transit_realtime::FeedMessage& feed, std::string const& id, float lat, float lng, std::uint64_t timestamp, std::string const& route = "RED")
    {
        auto* entity = feed.add_entity();
        entity->set_id("entity-" + id);
        auto* vp = entity->mutable_vehicle();
        vp->mutable_vehicle()->set_id(id);
        vp->mutable_trip()->set_route_id(route);
        vp->mutable_position()->set_latitude(lat);
        vp->mutable_position()->set_longitude(lng);
        vp->set_timestamp(timestamp);
    }

    std::string bytes(transit_realtime::FeedMessage const& feed)
    {
        std::string out;
        feed.SerializePartialToString(&out);
        return out;
    }

    DecodeError::Kind decodeFailure(std::string const& raw, FeedType type)
    {
        try
        {
            FeedDecoder::decode(raw, type, ATLANTA);
        }
        catch (DecodeError const& e)
        {
            return e.getKind();
        }
        ADD_FAILURE() << "expected DecodeError";
        return DecodeError::Kind::Malformed;
    }
}

TEST(FeedDecoderTest, TrainFeedYieldsNormalizedRecords)
{
    auto feed = emptyFeed();
    addTrain(feed, "T101", 33.7545f, -84.3900f, 1760000010, "GOLD");
    feed.mutable_entity(0)->mutable_vehicle()->mutable_position()->set_bearing(90.0f);
    feed.mutable_entity(0)->mutable_vehicle()->mutable_position()->set_speed(12.5f);

    auto vehicles = FeedDecoder::decodeTrainFeed(bytes(feed), ATLANTA);

    ASSERT_EQ(vehicles.size(), 1u);
    EXPECT_EQ(vehicles[0].id, "T101");
    EXPECT_EQ(vehicles[0].vehicleClass, FeedType::Train);
    EXPECT_EQ(vehicles[0].routeId, "GOLD");
    EXPECT_NEAR(vehicles[0].latitude, 33.7545, 1e-4);
    EXPECT_NEAR(vehicles[0].longitude, -84.3900, 1e-4);
    ASSERT_TRUE(vehicles[0].heading.has_value());
    EXPECT_DOUBLE_EQ(*vehicles[0].heading, 90.0);
    ASSERT_TRUE(vehicles[0].speed.has_value());
    EXPECT_DOUBLE_EQ(*vehicles[0].speed, 12.5);
    EXPECT_EQ(vehicles[0].observedAt, Timestamp(std::chrono::seconds(1760000010)));
}

TEST(FeedDecoderTest, DuplicateIdsKeepNewestObservation)
{
    auto feed = emptyFeed();
    addTrain(feed, "T1", 33.70f, -84.40f, 1760000000);
    addTrain(feed, "T2", 33.80f, -84.30f, 1760000000);
    addTrain(feed, "T1", 33.75f, -84.35f, 1760000030);
    addTrain(feed, "T1", 33.60f, -84.50f, 1760000015);

    auto vehicles = FeedDecoder::decodeTrainFeed(bytes(feed), ATLANTA);

    ASSERT_EQ(vehicles.size(), 2u);
    EXPECT_EQ(vehicles[0].id, "T1");
    EXPECT_NEAR(vehicles[0].latitude, 33.75, 1e-4);
    EXPECT_EQ(vehicles[0].observedAt, Timestamp(std::chrono::seconds(1760000030)));
    EXPECT_EQ(vehicles[1].id, "T2");
}

TEST(FeedDecoderTest, RecordsOutsideServiceAreaAreDropped)
{
    auto feed = emptyFeed();
    addTrain(feed, "inside", 33.75f, -84.39f, 1760000000);
    addTrain(feed, "elsewhere", 40.71f, -74.00f, 1760000000);
    addTrain(feed, "impossible", 91.0f, -84.39f, 1760000000);

    auto vehicles = FeedDecoder::decodeTrainFeed(bytes(feed), ATLANTA);

    ASSERT_EQ(vehicles.size(), 1u);
    EXPECT_EQ(vehicles[0].id, "inside");
}

TEST(FeedDecoderTest, EntitiesWithoutPositionAreSkipped)
{
    auto feed = emptyFeed();
    addTrain(feed, "T1", 33.75f, -84.39f, 1760000000);

    auto* noPosition = feed.add_entity();
    noPosition->set_id("trip-update-only");
    noPosition->mutable_vehicle()->mutable_vehicle()->set_id("T2");

    auto* deleted = feed.add_entity();
    deleted->set_id("gone");
    deleted->set_is_deleted(true);

    auto vehicles = FeedDecoder::decodeTrainFeed(bytes(feed), ATLANTA);

    ASSERT_EQ(vehicles.size(), 1u);
    EXPECT_EQ(vehicles[0].id, "T1");
}

TEST(FeedDecoderTest, MissingVehicleTimestampFallsBackToHeader)
{
    auto feed = emptyFeed();
    addTrain(feed, "T1", 33.75f, -84.39f, 0);
    feed.mutable_entity(0)->mutable_vehicle()->clear_timestamp();

    auto vehicles = FeedDecoder::decodeTrainFeed(bytes(feed), ATLANTA);

    ASSERT_EQ(vehicles.size(), 1u);
    EXPECT_EQ(vehicles[0].observedAt, Timestamp(std::chrono::seconds(1760000000)));
}

TEST(FeedDecoderTest, GarbageTrainPayloadIsMalformed)
{
    EXPECT_EQ(decodeFailure("", FeedType::Train), DecodeError::Kind::Malformed);
    EXPECT_EQ(decodeFailure("<html><body>502 Bad Gateway</body></html>", FeedType::Train), DecodeError::Kind::Malformed);
    EXPECT_EQ(decodeFailure(std::string("\xff\xff\xff\xff\xff\xff", 6), FeedType::Train), DecodeError::Kind::Malformed);
}

TEST(FeedDecoderTest, TrainFeedNeedsSupportedVersion)
{
    transit_realtime::FeedMessage headerless;
    addTrain(headerless, "T1", 33.75f, -84.39f, 1760000000);
    EXPECT_EQ(decodeFailure(bytes(headerless), FeedType::Train), DecodeError::Kind::Malformed);

    auto future = emptyFeed("3.0");
    addTrain(future, "T1", 33.75f, -84.39f, 1760000000);
    EXPECT_EQ(decodeFailure(bytes(future), FeedType::Train), DecodeError::Kind::Malformed);

    auto legacy = emptyFeed("1.0");
    addTrain(legacy, "T1", 33.75f, -84.39f, 1760000000);
    EXPECT_EQ(FeedDecoder::decodeTrainFeed(bytes(legacy), ATLANTA).size(), 1u);
}

TEST(FeedDecoderTest, BusFeedAcceptsBothFieldSpellings)
{
    std::string raw = R"([
        {"id": "2301", "route": "110", "lat": 33.7490, "lon": -84.3880, "heading": 270, "speed": 8.2, "timestamp": 1760000100},
        {"VEHICLE": 2302, "ROUTE": "39", "LATITUDE": "33.7700", "LONGITUDE": "-84.3600", "MSGTIME": 1760000110}
    ])";

    auto vehicles = FeedDecoder::decodeBusFeed(raw, ATLANTA);

    ASSERT_EQ(vehicles.size(), 2u);
    EXPECT_EQ(vehicles[0].id, "2301");
    EXPECT_EQ(vehicles[0].vehicleClass, FeedType::Bus);
    EXPECT_EQ(vehicles[0].routeId, "110");
    EXPECT_DOUBLE_EQ(vehicles[0].latitude, 33.7490);
    ASSERT_TRUE(vehicles[0].heading.has_value());
    EXPECT_DOUBLE_EQ(*vehicles[0].heading, 270.0);
    EXPECT_EQ(vehicles[0].observedAt, Timestamp(std::chrono::seconds(1760000100)));

    EXPECT_EQ(vehicles[1].id, "2302");
    EXPECT_EQ(vehicles[1].routeId, "39");
    EXPECT_DOUBLE_EQ(vehicles[1].longitude, -84.3600);
    EXPECT_FALSE(vehicles[1].heading.has_value());
    EXPECT_FALSE(vehicles[1].speed.has_value());
}

TEST(FeedDecoderTest, BadBusRecordsAreSkippedNotFatal)
{
    std::string raw = R"([
        {"id": "ok", "lat": 33.75, "lon": -84.39, "timestamp": 1760000000},
        {"id": "no-position"},
        {"lat": 33.75, "lon": -84.39},
        {"id": "bad-lat", "lat": "north", "lon": -84.39},
        {"id": "far", "lat": 40.71, "lon": -74.00},
        "not an object",
        42
    ])";

    auto vehicles = FeedDecoder::decodeBusFeed(raw, ATLANTA);

    ASSERT_EQ(vehicles.size(), 1u);
    EXPECT_EQ(vehicles[0].id, "ok");
}

TEST(FeedDecoderTest, BusEnvelopeErrors)
{
    EXPECT_EQ(decodeFailure("{not json", FeedType::Bus), DecodeError::Kind::Malformed);
    EXPECT_EQ(decodeFailure(R"({"vehicles": []})", FeedType::Bus), DecodeError::Kind::SchemaViolation);
    EXPECT_TRUE(FeedDecoder::decodeBusFeed("[]", ATLANTA).empty());
}

TEST(FeedDecoderTest, BusDuplicatesKeepNewest)
{
    std::string raw = R"([
        {"id": "7", "lat": 33.70, "lon": -84.40, "timestamp": 1760000050},
        {"id": "7", "lat": 33.71, "lon": -84.41, "timestamp": 1760000020}
    ])";

    auto vehicles = FeedDecoder::decodeBusFeed(raw, ATLANTA);

    ASSERT_EQ(vehicles.size(), 1u);
    EXPECT_DOUBLE_EQ(vehicles[0].latitude, 33.70);
}

TEST(FeedDecoderTest, InvalidLatitudeAloneYieldsEmptyResult)
{
    auto feed = emptyFeed();
    addTrain(feed, "T91", 91.0f, -84.39f, 1760000000);

    std::vector<VehiclePosition> vehicles;
    EXPECT_NO_THROW(vehicles = FeedDecoder::decodeTrainFeed(bytes(feed), ATLANTA));
    EXPECT_TRUE(vehicles.empty());

    BoundingBox everywhere;
    EXPECT_TRUE(FeedDecoder::decodeTrainFeed(bytes(feed), everywhere).empty());
}

TEST(FeedDecoderTest, OutOfRangeTrainTimestampFallsBackToHeader)
{
    auto feed = emptyFeed();
    addTrain(feed, "T-max", 33.75f, -84.39f, UINT64_MAX);
    addTrain(feed, "T-ms", 33.76f, -84.38f, 1760000000123ull);

    auto vehicles = FeedDecoder::decodeTrainFeed(bytes(feed), ATLANTA);

    ASSERT_EQ(vehicles.size(), 2u);
    EXPECT_EQ(vehicles[0].observedAt, Timestamp(std::chrono::seconds(1760000000)));
    EXPECT_EQ(vehicles[1].observedAt, Timestamp(std::chrono::seconds(1760000000)));
}

TEST(FeedDecoderTest, MillisecondBusTimestampIsTreatedAsMissing)
{
    std::string raw = R"([
        {"id": "ms", "lat": 33.75, "lon": -84.39, "timestamp": 1760000000123},
        {"id": "negative", "lat": 33.75, "lon": -84.39, "MSGTIME": -5},
        {"id": "ok", "lat": 33.75, "lon": -84.39, "timestamp": "1760000001"}
    ])";

    auto vehicles = FeedDecoder::decodeBusFeed(raw, ATLANTA);

    ASSERT_EQ(vehicles.size(), 3u);
    EXPECT_EQ(vehicles[0].observedAt, Timestamp{});
    EXPECT_EQ(vehicles[1].observedAt, Timestamp{});
    EXPECT_EQ(vehicles[2].observedAt, Timestamp(std::chrono::seconds(1760000001)));
}
