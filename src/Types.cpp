#include <algorithm>
#include <cctype>
#include "Types.hpp"

std::string toString(FeedType type)
{
    return type == FeedType::Bus ? "bus" : "train";
}

std::string toString(Provenance source)
{
    switch (source)
    {
        case Provenance::Live:    return "live";
        case Provenance::Cached:  return "cached";
        case Provenance::Mock:    return "mock";
        case Provenance::Partial: return "partial";
        case Provenance::Error:   return "error";
    }
    return "error";
}

std::string toString(ZonePriority priority)
{
    switch (priority)
    {
        case ZonePriority::Urgent: return "urgent";
        case ZonePriority::High:   return "high";
        case ZonePriority::Normal: return "normal";
        case ZonePriority::Low:    return "low";
    }
    return "normal";
}

std::optional<ZonePriority> parsePriority(std::string const& text)
{
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "urgent") return ZonePriority::Urgent;
    if (lower == "high")   return ZonePriority::High;
    if (lower == "normal") return ZonePriority::Normal;
    if (lower == "low")    return ZonePriority::Low;
    return std::nullopt;
}
