#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include "Types.hpp"

struct LatLng
{
    double lat = 0.0;
    double lng = 0.0;

    bool operator==(LatLng const& other) const { return lat == other.lat && lng == other.lng; }
    bool operator!=(LatLng const& other) const { return !(*this == other); }
};

using Easing = double (*)(double);

// 1 - (1 - t)^3 on [0, 1].
double easeOutCubic(double t);

struct AnimationState
{
    LatLng start;
    LatLng target;
    Timestamp startedAt;
    std::chrono::milliseconds duration{2000};
    Easing easing = easeOutCubic;

    // clamp((now - startedAt) / duration, 0, 1)
    double progress(Timestamp now) const;
    LatLng positionAt(Timestamp now) const;
    bool finished(Timestamp now) const { return progress(now) >= 1.0; }
};

// Rotation along the shortest arc; eased on its own clock.
struct HeadingAnimation
{
    double start = 0.0;
    double delta = 0.0;   // (-180, 180]
    Timestamp startedAt;
    std::chrono::milliseconds duration{1000};
    Easing easing = easeOutCubic;

    double target() const;
    double headingAt(Timestamp now) const;
    bool finished(Timestamp now) const;
};

// Smooths discrete feed updates into continuous marker motion.
// A new target always restarts from the currently displayed point; nothing is
// queued. Intended for a single render loop; not thread-safe.
class MarkerAnimator
{
public:
    explicit MarkerAnimator(std::chrono::milliseconds positionDuration = std::chrono::milliseconds(2000),
                            std::chrono::milliseconds headingDuration = std::chrono::milliseconds(1000));

    void setTarget(std::string const& id, LatLng target, Timestamp now);
    // Ignored until the marker has been placed by setTarget.
    void setHeading(std::string const& id, double heading, Timestamp now);

    // Feeds one observed vehicle: position, and heading when present.
    void update(VehiclePosition const& vehicle, Timestamp now);

    std::optional<LatLng> position(std::string const& id, Timestamp now) const;
    std::optional<double> heading(std::string const& id, Timestamp now) const;
    std::optional<AnimationState> animation(std::string const& id) const;
    bool animating(std::string const& id, Timestamp now) const;

    // Settles finished animations; returns how many are still running.
    std::size_t frame(Timestamp now);
    void remove(std::string const& id);
    std::size_t size() const { return markers.size(); }

private:
    struct Marker
    {
        LatLng settled;
        std::optional<AnimationState> motion;
        std::optional<double> settledHeading;
        std::optional<HeadingAnimation> turn;
    };

    std::chrono::milliseconds positionDuration;
    std::chrono::milliseconds headingDuration;
    std::unordered_map<std::string, Marker> markers;

    static LatLng displayed(Marker const& marker, Timestamp now);
    static std::optional<double> displayedHeading(Marker const& marker, Timestamp now);
};
