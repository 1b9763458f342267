#include <sstream>
#include <iomanip>
#include <date/date.h>
#include "Dashboard.hpp"

using namespace std::chrono;

std::string Dashboard::escape(std::string const& text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text)
    {
        switch (c)
        {
            case '<':  out += "&lt;";   break;
            case '>':  out += "&gt;";   break;
            case '&':  out += "&amp;";  break;
            case '\'': out += "&#39;";  break;
            case '"':  out += "&quot;"; break;
            default:   out += c;
        }
    }
    return out;
}

std::string Dashboard::buildHtmlHead(VehicleResponse const& response)
{
    std::stringstream ss;

    ss << "<html><head><title>Transit Pulse</title>"
       << "<style>"
       << "body { font-family: sans-serif; background: #1a1a1a; color: #ddd; padding: 20px; }"
       << "h1 { color: #3498db; border-bottom: 2px solid #444; padding-bottom: 10px; }"
       << "h2 { color: #bbb; margin-top: 30px; }"
       << "table { width: 100%; border-collapse: collapse; margin-top: 10px; }"
       << "th { text-align: left; background: #333; padding: 10px; border-bottom: 2px solid #555; }"
       << "td { padding: 10px; border-bottom: 1px solid #333; }"
       << "tr:hover { background: #2c2c2c; }"
       << ".delayed { background: #5a3d00; color: #f1c40f; padding: 10px; border-left: 5px solid #f1c40f; }"
       << ".badge { background: #444; padding: 2px 5px; border-radius: 3px; "
                     "font-size: 0.8em; margin-right:5px;}"
       << "</style>"
       << "<meta charset='UTF-8'>"
       << "<meta http-equiv='refresh' content='10'>"
       << "</head><body>";

    ss << "<h1>Live Vehicles</h1>";
    ss << "<p>Source: <span class='badge'>" << toString(response.source) << "</span> "
       << response.buses.size() << " buses, " << response.trains.size() << " trains. "
       << "Updated " << date::format("%F %T UTC", floor<seconds>(response.timestamp)) << "</p>";

    return ss.str();
}

std::string Dashboard::buildDelayBanner(Provenance source)
{
    if (source == Provenance::Live || source == Provenance::Mock)
        return "";

    std::string detail =
        source == Provenance::Partial ? "One feed is unavailable; its vehicles may be missing or out of date." :
        source == Provenance::Cached  ? "Showing the last positions received." :
                                        "No feed is currently reachable.";

    return "<p class='delayed'><b>Data may be delayed.</b> " + detail + "</p>";
}

std::string Dashboard::formatAge(Timestamp observedAt, Timestamp now)
{
    if (observedAt.time_since_epoch().count() == 0)
        return "<span style='color:#777'>unknown</span>";

    auto age = duration_cast<seconds>(now - observedAt).count();
    if (age < 0) age = 0;

    std::stringstream ss;
    if (age >= 60)
        ss << age / 60 << "m " << age % 60 << "s";
    else
        ss << age << "s";
    return ss.str();
}

std::string Dashboard::buildRow(VehiclePosition const& v, Timestamp now)
{
    std::stringstream ss;
    ss << std::fixed;
    ss << "<tr>"
       << "<td><b style='font-size:1.2em'>" << escape(v.routeId) << "</b></td>"
       << "<td>" << escape(v.id) << "</td>"
       << "<td>" << std::setprecision(5) << v.latitude << ", " << v.longitude << "</td>"
       << "<td>";
    if (v.heading)
        ss << std::setprecision(0) << *v.heading << "&deg;";
    else
        ss << "-";
    ss << "</td><td>";
    if (v.speed)
        ss << std::setprecision(1) << *v.speed << " m/s";
    else
        ss << "-";
    ss << "</td>"
       << "<td>" << formatAge(v.observedAt, now) << "</td>"
       << "</tr>";

    return ss.str();
}

std::string Dashboard::buildTable(std::string const& title, std::vector<VehiclePosition> const& vehicles, Timestamp now)
{
    std::stringstream ss;
    ss << "<h2>" << title << " (" << vehicles.size() << ")</h2>";
    ss << "<table><thead><tr>"
       << "<th>Route</th>"
       << "<th>Vehicle</th>"
       << "<th>Position</th>"
       << "<th>Heading</th>"
       << "<th>Speed</th>"
       << "<th>Age</th>"
       << "</tr></thead><tbody>";

    for (const auto& v : vehicles)
    {
        ss << buildRow(v, now);
    }

    ss << "</tbody></table>";
    return ss.str();
}

std::string Dashboard::generate(VehicleResponse const& response)
{
    std::stringstream ss;
    ss << buildHtmlHead(response);
    ss << buildDelayBanner(response.source);
    ss << buildTable("Trains", response.trains, response.timestamp);
    ss << buildTable("Buses", response.buses, response.timestamp);
    ss << "</body></html>";

    return ss.str();
}
