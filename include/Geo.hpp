#pragma once

class Geo
{
public:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;
    static constexpr double METERS_PER_DEGREE_LAT = 111320.0;

    // Great-circle distance, haversine formula.
    static double distanceMeters(double lat1, double lng1, double lat2, double lng2);

    // Point `meters` away from (lat, lng) along `bearingDeg`.
    static void destination(double lat, double lng, double bearingDeg, double meters, double& outLat, double& outLng);

private:
    static double toRadians(double degrees);
    static double toDegrees(double radians);
};
