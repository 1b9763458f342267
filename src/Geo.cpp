#include <cmath>
#include <algorithm>
#include <numbers>
#include "Geo.hpp"

double Geo::toRadians(double degrees)
{
    return degrees * std::numbers::pi / 180.0;
}

double Geo::toDegrees(double radians)
{
    return radians * 180.0 / std::numbers::pi;
}

double Geo::distanceMeters(double lat1, double lng1, double lat2, double lng2)
{
    double dLat = toRadians(lat2 - lat1);
    double dLng = toRadians(lng2 - lng1);

    double a = std::sin(dLat / 2) * std::sin(dLat / 2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLng / 2) * std::sin(dLng / 2);

    a = std::clamp(a, 0.0, 1.0);
    double c = 2 * std::atan2(std::sqrt(a), std::sqrt(1 - a));
    return EARTH_RADIUS_METERS * c;
}

void Geo::destination(double lat, double lng, double bearingDeg, double meters, double& outLat, double& outLng)
{
    double bearing = toRadians(bearingDeg);
    double d = meters / EARTH_RADIUS_METERS;

    double lat1 = toRadians(lat);
    double lng1 = toRadians(lng);

    double lat2 = std::asin(std::sin(lat1) * std::cos(d) +
                            std::cos(lat1) * std::sin(d) * std::cos(bearing));

    double lng2 = lng1 + std::atan2(std::sin(bearing) * std::sin(d) * std::cos(lat1),
                                    std::cos(d) - std::sin(lat1) * std::sin(lat2));

    outLat = toDegrees(lat2);
    outLng = toDegrees(lng2);
}
