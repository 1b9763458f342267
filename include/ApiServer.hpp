#pragma once
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/beast.hpp>
#include "VehicleService.hpp"
#include "GeofenceMatcher.hpp"

// Query interface over HTTP:
//   GET /api/vehicles
//   GET /api/geofence?lat=..&lng=..
//   GET /               (status page)
class ApiServer
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ip::tcp::acceptor acceptor;
    VehicleService& vehicles;
    GeofenceMatcher& geofence;

    boost::asio::awaitable<void> acceptLoop();
    boost::asio::awaitable<void> handleClient(boost::asio::ip::tcp::socket socket);
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> handleGeofence(std::string const& target, unsigned version);

    static boost::beast::http::response<boost::beast::http::string_body> makeResponse(boost::beast::http::status status, unsigned version, std::string const& contentType, std::string body);

public:
    ApiServer(boost::asio::io_context& ioc, unsigned short port, VehicleService& vehicles, GeofenceMatcher& geofence);

    void start();
    [[nodiscard]] unsigned short port() const;

    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> route(boost::beast::http::request<boost::beast::http::string_body> const& request);
};
