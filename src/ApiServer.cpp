#include <cmath>
#include <cstdlib>
#include <map>
#include <optional>
#include <iostream>
#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include "ApiServer.hpp"
#include "Dashboard.hpp"
#include "ResponseCodec.hpp"
#include "Url.hpp"

namespace http = boost::beast::http;

namespace
{
    std::optional<double> coordinate(std::map<std::string, std::string> const& params, std::string const& name, double limit)
    {
        auto it = params.find(name);
        if (it == params.end() || it->second.empty())
            return std::nullopt;

        char* end = nullptr;
        double value = std::strtod(it->second.c_str(), &end);
        if (end == it->second.c_str() || *end != '\0' || !std::isfinite(value) || std::fabs(value) > limit)
            return std::nullopt;
        return value;
    }
}

ApiServer::ApiServer(boost::asio::io_context& ioc, unsigned short port, VehicleService& vehicles, GeofenceMatcher& geofence)
    : ioContext(ioc)
    , acceptor(ioc, {boost::asio::ip::tcp::v4(), port})
    , vehicles(vehicles)
    , geofence(geofence)
{
}

unsigned short ApiServer::port() const
{
    return acceptor.local_endpoint().port();
}

void ApiServer::start()
{
    std::cout << "[HTTP] Query interface active at http://localhost:" << port() << "\n";
    boost::asio::co_spawn(ioContext, acceptLoop(), boost::asio::detached);
}

boost::asio::awaitable<void> ApiServer::acceptLoop()
{
    for (;;)
    {
        boost::asio::ip::tcp::socket socket(co_await boost::asio::this_coro::executor);

        co_await acceptor.async_accept(socket, boost::asio::use_awaitable);
        boost::asio::co_spawn(socket.get_executor(), handleClient(std::move(socket)), boost::asio::detached);
    }
}

boost::asio::awaitable<void> ApiServer::handleClient(boost::asio::ip::tcp::socket socket)
{
    boost::beast::tcp_stream stream(std::move(socket));
    try
    {
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> request;

        stream.expires_after(std::chrono::seconds(30));
        co_await http::async_read(stream, buffer, request, boost::asio::use_awaitable);

        http::response<http::string_body> response = co_await route(request);
        response.keep_alive(false);

        co_await http::async_write(stream, response, boost::asio::use_awaitable);

        boost::system::error_code ignore;
        stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);
    }
    catch (boost::system::system_error const& e)
    {
        auto code = e.code();
        if (code == boost::asio::error::operation_aborted ||
            code == boost::asio::error::connection_reset ||
            code == boost::asio::error::connection_aborted ||
            code == boost::asio::error::eof ||
            code == http::error::end_of_stream ||
            code == boost::beast::error::timeout)
        {
            co_return;
        }

        std::cerr << "[HTTP] handler error: " << e.what() << "\n";
    }
    catch (std::exception const& e)
    {
        std::cerr << "[HTTP] handler error: " << e.what() << "\n";
    }
}

http::response<http::string_body> ApiServer::makeResponse(http::status status, unsigned version, std::string const& contentType, std::string body)
{
    http::response<http::string_body> response(status, version);
    response.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    response.set(http::field::content_type, contentType);
    response.set(http::field::cache_control, "no-store");
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

boost::asio::awaitable<http::response<http::string_body>> ApiServer::route(http::request<http::string_body> const& request)
{
    unsigned version = request.version();

    if (request.method() != http::verb::get)
        co_return makeResponse(http::status::method_not_allowed, version, "application/json", ResponseCodec::error("only GET is supported"));

    std::string target(request.target().data(), request.target().size());
    std::string path = target.substr(0, target.find('?'));

    if (path == "/api/vehicles")
    {
        VehicleResponse result = co_await vehicles.vehicles();
        co_return makeResponse(http::status::ok, version, "application/json", ResponseCodec::serialize(result));
    }

    if (path == "/api/geofence")
        co_return co_await handleGeofence(target, version);

    if (path == "/" || path == "/index.html")
    {
        VehicleResponse result = co_await vehicles.vehicles();
        co_return makeResponse(http::status::ok, version, "text/html; charset=utf-8", Dashboard::generate(result));
    }

    co_return makeResponse(http::status::not_found, version, "application/json", ResponseCodec::error("no route for " + path));
}

boost::asio::awaitable<http::response<http::string_body>> ApiServer::handleGeofence(std::string const& target, unsigned version)
{
    auto params = parseQuery(target);
    auto lat = coordinate(params, "lat", 90.0);
    auto lng = coordinate(params, "lng", 180.0);

    if (!lat || !lng)
        co_return makeResponse(http::status::bad_request, version, "application/json",
                               ResponseCodec::error("lat and lng must be numeric coordinates"));

    GeofenceResponse result = geofence.check(*lat, *lng);
    co_return makeResponse(http::status::ok, version, "application/json", ResponseCodec::serialize(result));
}
