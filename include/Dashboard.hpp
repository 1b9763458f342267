#pragma once
#include <string>
#include <vector>
#include "Types.hpp"

class Dashboard
{
public:
    static std::string generate(VehicleResponse const& response);

private:
    static std::string buildHtmlHead(VehicleResponse const& response);
    static std::string buildDelayBanner(Provenance source);
    static std::string buildTable(std::string const& title, std::vector<VehiclePosition> const& vehicles, Timestamp now);
    static std::string buildRow(VehiclePosition const& v, Timestamp now);
    static std::string formatAge(Timestamp observedAt, Timestamp now);
    static std::string escape(std::string const& text);
};
