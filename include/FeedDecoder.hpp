#pragma once
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "gtfs-realtime.pb.h"
#include "Types.hpp"

// Raw feed bytes -> normalized vehicle records.
// Envelope failures throw DecodeError; bad individual records are skipped.
class FeedDecoder
{
public:
    static std::vector<VehiclePosition> decode(std::string const& raw, FeedType type, BoundingBox const& bounds);

    // GTFS-realtime FeedMessage (protobuf).
    static std::vector<VehiclePosition> decodeTrainFeed(std::string const& raw, BoundingBox const& bounds);

    // JSON array of vehicle records.
    static std::vector<VehiclePosition> decodeBusFeed(std::string const& raw, BoundingBox const& bounds);

private:
    static bool supportedVersion(std::string const& version);
    static std::optional<VehiclePosition> trainRecord(transit_realtime::FeedEntity const& entity, Timestamp headerTime);
    static std::optional<VehiclePosition> busRecord(nlohmann::json const& record);
    static void keepNewest(std::vector<VehiclePosition>& out, std::unordered_map<std::string, std::size_t>& indexOf, VehiclePosition&& v);
};
