#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <unordered_map>
#include "FeedDecoder.hpp"
#include "Errors.hpp"

namespace
{
    // Upper bound is early 2096; epoch milliseconds and garbage land above it.
    constexpr double MAX_EPOCH_SECONDS = 4e9;

    // Out-of-range values count as missing.
    std::optional<Timestamp> fromEpochSeconds(double seconds)
    {
        if (!std::isfinite(seconds) || seconds < 0.0 || seconds >= MAX_EPOCH_SECONDS)
            return std::nullopt;
        return Timestamp(std::chrono::duration_cast<Timestamp::duration>(std::chrono::duration<double>(seconds)));
    }

    std::optional<Timestamp> fromWholeSeconds(std::uint64_t seconds)
    {
        if (seconds >= static_cast<std::uint64_t>(MAX_EPOCH_SECONDS))
            return std::nullopt;
        return Timestamp(std::chrono::seconds(static_cast<std::int64_t>(seconds)));
    }

    nlohmann::json const* field(nlohmann::json const& record, std::initializer_list<const char*> names)
    {
        for (const char* name : names)
        {
            auto it = record.find(name);
            if (it != record.end() && !it->is_null())
                return &*it;
        }
        return nullptr;
    }

    std::optional<double> numberField(nlohmann::json const& record, std::initializer_list<const char*> names)
    {
        nlohmann::json const* value = field(record, names);
        if (!value) return std::nullopt;

        if (value->is_number())
            return value->get<double>();

        if (value->is_string())
        {
            std::string const& text = value->get_ref<std::string const&>();
            if (text.empty()) return std::nullopt;
            char* end = nullptr;
            double parsed = std::strtod(text.c_str(), &end);
            if (end == text.c_str() || *end != '\0') return std::nullopt;
            return parsed;
        }
        return std::nullopt;
    }

    std::optional<std::string> textField(nlohmann::json const& record, std::initializer_list<const char*> names)
    {
        nlohmann::json const* value = field(record, names);
        if (!value) return std::nullopt;

        if (value->is_string())
            return value->get<std::string>();
        if (value->is_number_integer())
            return std::to_string(value->get<long long>());
        if (value->is_number())
            return value->dump();
        return std::nullopt;
    }

    std::optional<double> normalizedHeading(double degrees)
    {
        if (!std::isfinite(degrees) || degrees < 0.0 || degrees > 360.0)
            return std::nullopt;
        return degrees == 360.0 ? 0.0 : degrees;
    }
}

std::vector<VehiclePosition> FeedDecoder::decode(std::string const& raw, FeedType type, BoundingBox const& bounds)
{
    if (type == FeedType::Train)
        return decodeTrainFeed(raw, bounds);
    return decodeBusFeed(raw, bounds);
}

bool FeedDecoder::supportedVersion(std::string const& version)
{
    return version.rfind("1.", 0) == 0 || version.rfind("2.", 0) == 0
        || version == "1" || version == "2";
}

std::vector<VehiclePosition> FeedDecoder::decodeTrainFeed(std::string const& raw, BoundingBox const& bounds)
{
    if (raw.empty() || raw[0] == '<')
        throw DecodeError(DecodeError::Kind::Malformed, "Train feed is empty or an HTML page");

    transit_realtime::FeedMessage feed;
    if (!feed.ParsePartialFromString(raw))
        throw DecodeError(DecodeError::Kind::Malformed, "Train feed is not a GTFS-realtime message");

    if (!feed.has_header() || !feed.header().has_gtfs_realtime_version())
        throw DecodeError(DecodeError::Kind::Malformed, "Train feed has no header");

    const std::string& version = feed.header().gtfs_realtime_version();
    if (!supportedVersion(version))
        throw DecodeError(DecodeError::Kind::Malformed, "Unsupported GTFS-realtime version '" + version + "'");

    Timestamp headerTime = fromWholeSeconds(feed.header().timestamp()).value_or(Timestamp{});

    std::vector<VehiclePosition> out;
    std::unordered_map<std::string, std::size_t> indexOf;

    for (const auto& entity : feed.entity())
    {
        auto v = trainRecord(entity, headerTime);
        if (!v) continue;
        if (!bounds.contains(v->latitude, v->longitude)) continue;

        keepNewest(out, indexOf, std::move(*v));
    }

    return out;
}

std::optional<VehiclePosition> FeedDecoder::trainRecord(transit_realtime::FeedEntity const& entity, Timestamp headerTime)
{
    if (entity.is_deleted() || !entity.has_vehicle())
        return std::nullopt;

    const auto& vp = entity.vehicle();
    if (!vp.has_position())
        return std::nullopt;

    const auto& pos = vp.position();
    if (!pos.has_latitude() || !pos.has_longitude())
        return std::nullopt;

    VehiclePosition v;
    v.vehicleClass = FeedType::Train;
    v.id = (vp.has_vehicle() && !vp.vehicle().id().empty()) ? vp.vehicle().id() : entity.id();
    if (v.id.empty())
        return std::nullopt;

    v.routeId   = vp.trip().route_id();
    v.latitude  = pos.latitude();
    v.longitude = pos.longitude();

    if (pos.has_bearing())
        v.heading = normalizedHeading(pos.bearing());
    if (pos.has_speed() && std::isfinite(pos.speed()) && pos.speed() >= 0.0f)
        v.speed = pos.speed();

    std::optional<Timestamp> observed;
    if (vp.has_timestamp())
        observed = fromWholeSeconds(vp.timestamp());
    v.observedAt = observed.value_or(headerTime);
    return v;
}

std::vector<VehiclePosition> FeedDecoder::decodeBusFeed(std::string const& raw, BoundingBox const& bounds)
{
    nlohmann::json doc = nlohmann::json::parse(raw, nullptr, false);
    if (doc.is_discarded())
        throw DecodeError(DecodeError::Kind::Malformed, "Bus feed is not valid JSON");

    if (!doc.is_array())
        throw DecodeError(DecodeError::Kind::SchemaViolation, "Bus feed has no top-level vehicle array");

    std::vector<VehiclePosition> out;
    std::unordered_map<std::string, std::size_t> indexOf;

    for (const auto& record : doc)
    {
        auto v = busRecord(record);
        if (!v) continue;
        if (!bounds.contains(v->latitude, v->longitude)) continue;

        keepNewest(out, indexOf, std::move(*v));
    }

    return out;
}

std::optional<VehiclePosition> FeedDecoder::busRecord(nlohmann::json const& record)
{
    if (!record.is_object())
        return std::nullopt;

    auto id  = textField(record, {"id", "VEHICLE"});
    auto lat = numberField(record, {"lat", "LATITUDE"});
    auto lon = numberField(record, {"lon", "LONGITUDE"});
    if (!id || id->empty() || !lat || !lon)
        return std::nullopt;

    VehiclePosition v;
    v.vehicleClass = FeedType::Bus;
    v.id        = *id;
    v.routeId   = textField(record, {"route", "ROUTE"}).value_or("");
    v.latitude  = *lat;
    v.longitude = *lon;

    if (auto heading = numberField(record, {"heading"}))
        v.heading = normalizedHeading(*heading);
    if (auto speed = numberField(record, {"speed"}); speed && std::isfinite(*speed) && *speed >= 0.0)
        v.speed = *speed;

    auto seconds = numberField(record, {"timestamp", "MSGTIME"});
    v.observedAt = seconds ? fromEpochSeconds(*seconds).value_or(Timestamp{}) : Timestamp{};
    return v;
}

void FeedDecoder::keepNewest(std::vector<VehiclePosition>& out, std::unordered_map<std::string, std::size_t>& indexOf, VehiclePosition&& v)
{
    auto it = indexOf.find(v.id);
    if (it == indexOf.end())
    {
        indexOf.emplace(v.id, out.size());
        out.push_back(std::move(v));
        return;
    }

    VehiclePosition& existing = out[it->second];
    if (v.observedAt > existing.observedAt)
        existing = std::move(v);
}
