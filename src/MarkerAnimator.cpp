#include <algorithm>
#include <cmath>
#include "MarkerAnimator.hpp"

namespace
{
    double progressBetween(Timestamp startedAt, std::chrono::milliseconds duration, Timestamp now)
    {
        if (duration.count() <= 0)
            return 1.0;

        double elapsed = std::chrono::duration<double, std::milli>(now - startedAt).count();
        return std::clamp(elapsed / static_cast<double>(duration.count()), 0.0, 1.0);
    }

    double normalizeDegrees(double degrees)
    {
        double d = std::fmod(degrees, 360.0);
        if (d < 0.0) d += 360.0;
        return d;
    }

    double shortestDelta(double from, double to)
    {
        double delta = std::fmod(normalizeDegrees(to) - normalizeDegrees(from), 360.0);
        if (delta > 180.0)   delta -= 360.0;
        if (delta <= -180.0) delta += 360.0;
        return delta;
    }
}

double easeOutCubic(double t)
{
    t = std::clamp(t, 0.0, 1.0);
    double inv = 1.0 - t;
    return 1.0 - inv * inv * inv;
}

double AnimationState::progress(Timestamp now) const
{
    return progressBetween(startedAt, duration, now);
}

LatLng AnimationState::positionAt(Timestamp now) const
{
    double p = progress(now);
    if (p >= 1.0)
        return target;

    double e = easing(p);
    return LatLng{start.lat + (target.lat - start.lat) * e,
                  start.lng + (target.lng - start.lng) * e};
}

double HeadingAnimation::target() const
{
    return normalizeDegrees(start + delta);
}

double HeadingAnimation::headingAt(Timestamp now) const
{
    double p = progressBetween(startedAt, duration, now);
    if (p >= 1.0)
        return target();
    return normalizeDegrees(start + delta * easing(p));
}

bool HeadingAnimation::finished(Timestamp now) const
{
    return progressBetween(startedAt, duration, now) >= 1.0;
}

MarkerAnimator::MarkerAnimator(std::chrono::milliseconds positionDuration, std::chrono::milliseconds headingDuration)
    : positionDuration(positionDuration), headingDuration(headingDuration)
{
}

LatLng MarkerAnimator::displayed(Marker const& marker, Timestamp now)
{
    return marker.motion ? marker.motion->positionAt(now) : marker.settled;
}

std::optional<double> MarkerAnimator::displayedHeading(Marker const& marker, Timestamp now)
{
    if (marker.turn)
        return marker.turn->headingAt(now);
    return marker.settledHeading;
}

void MarkerAnimator::setTarget(std::string const& id, LatLng target, Timestamp now)
{
    auto it = markers.find(id);
    if (it == markers.end())
    {
        // First sighting: place without animating.
        Marker marker;
        marker.settled = target;
        markers.emplace(id, std::move(marker));
        return;
    }

    Marker& marker = it->second;
    LatLng current = displayed(marker, now);
    if (current == target)
        return;

    // Interrupts any running animation at its current point.
    marker.settled = current;
    marker.motion  = AnimationState{current, target, now, positionDuration, easeOutCubic};
}

void MarkerAnimator::setHeading(std::string const& id, double heading, Timestamp now)
{
    auto it = markers.find(id);
    if (it == markers.end())
        return;

    Marker& marker = it->second;
    double target = normalizeDegrees(heading);

    std::optional<double> current = displayedHeading(marker, now);
    if (!current)
    {
        marker.settledHeading = target;
        return;
    }

    double delta = shortestDelta(*current, target);
    if (delta == 0.0)
        return;

    marker.settledHeading = *current;
    marker.turn = HeadingAnimation{*current, delta, now, headingDuration, easeOutCubic};
}

void MarkerAnimator::update(VehiclePosition const& vehicle, Timestamp now)
{
    setTarget(vehicle.id, LatLng{vehicle.latitude, vehicle.longitude}, now);
    if (vehicle.heading)
        setHeading(vehicle.id, *vehicle.heading, now);
}

std::optional<LatLng> MarkerAnimator::position(std::string const& id, Timestamp now) const
{
    auto it = markers.find(id);
    if (it == markers.end())
        return std::nullopt;
    return displayed(it->second, now);
}

std::optional<double> MarkerAnimator::heading(std::string const& id, Timestamp now) const
{
    auto it = markers.find(id);
    if (it == markers.end())
        return std::nullopt;
    return displayedHeading(it->second, now);
}

std::optional<AnimationState> MarkerAnimator::animation(std::string const& id) const
{
    auto it = markers.find(id);
    if (it == markers.end())
        return std::nullopt;
    return it->second.motion;
}

bool MarkerAnimator::animating(std::string const& id, Timestamp now) const
{
    auto it = markers.find(id);
    return it != markers.end() && it->second.motion && !it->second.motion->finished(now);
}

std::size_t MarkerAnimator::frame(Timestamp now)
{
    std::size_t running = 0;
    for (auto& [id, marker] : markers)
    {
        if (marker.motion)
        {
            if (marker.motion->finished(now))
            {
                marker.settled = marker.motion->target;
                marker.motion.reset();
            }
            else
            {
                ++running;
            }
        }

        if (marker.turn && marker.turn->finished(now))
        {
            marker.settledHeading = marker.turn->target();
            marker.turn.reset();
        }
    }
    return running;
}

void MarkerAnimator::remove(std::string const& id)
{
    markers.erase(id);
}
