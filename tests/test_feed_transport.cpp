#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include "FeedTransport.hpp"
#include "HttpFeedClient.hpp"
#include "Errors.hpp"
#include <optional>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>

TEST(FeedTransportTest, RelayCarriesUpstreamAsEncodedQueryParameter)
{
    EXPECT_EQ(RelayTransport::relayTarget("https://relay.example.com/proxy", "http://rail.example.com:8443/gtfs-rt"),
              "https://relay.example.com/proxy?url=http%3A%2F%2Frail.example.com%3A8443%2Fgtfs-rt");
}

TEST(FeedTransportTest, RelayAppendsToExistingQuery)
{
    EXPECT_EQ(RelayTransport::relayTarget("https://relay.example.com/proxy?token=abc", "http://x:1/y"),
              "https://relay.example.com/proxy?token=abc&url=http%3A%2F%2Fx%3A1%2Fy");
    EXPECT_EQ(RelayTransport::relayTarget("https://relay.example.com/proxy?", "http://x:1/y"),
              "https://relay.example.com/proxy?url=http%3A%2F%2Fx%3A1%2Fy");
}

TEST(FeedTransportTest, TransportIsChosenFromSettings)
{
    boost::asio::io_context io;
    HttpFeedClient client(io, "", std::chrono::milliseconds(1000));

    EngineSettings settings;
    settings.transport = TransportMode::Direct;
    EXPECT_EQ(makeTransport(settings, client)->name(), "direct");

    settings.transport = TransportMode::Relayed;
    settings.relayUrl = "https://relay.example.com/proxy";
    EXPECT_EQ(makeTransport(settings, client)->name(), "relay");
}

namespace
{
    using boost::asio::ip::tcp;

    // Accepts one connection, reads the request head, optionally stalls, then answers.
    boost::asio::awaitable<void> serveOnce(tcp::acceptor& acceptor, std::string response, std::string* requestOut, std::chrono::milliseconds stall)
    {
        tcp::socket socket = co_await acceptor.async_accept(boost::asio::use_awaitable);

        boost::asio::streambuf buffer;
        co_await boost::asio::async_read_until(socket, buffer, "\r\n\r\n", boost::asio::use_awaitable);
        if (requestOut)
            *requestOut = std::string(boost::asio::buffers_begin(buffer.data()), boost::asio::buffers_end(buffer.data()));

        if (stall.count() > 0)
        {
            boost::asio::steady_timer timer(socket.get_executor());
            timer.expires_after(stall);
            co_await timer.async_wait(boost::asio::use_awaitable);
        }

        boost::system::error_code ec;
        co_await boost::asio::async_write(socket, boost::asio::buffer(response),
                                          boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        socket.shutdown(tcp::socket::shutdown_both, ec);
    }

    struct FetchOutcome
    {
        std::string body;
        std::optional<FetchError::Kind> error;
        int status = 0;
    };

    boost::asio::awaitable<void> fetchInto(HttpFeedClient& client, std::string url, FetchOutcome& out)
    {
        try
        {
            out.body = co_await client.fetch(url);
        }
        catch (FetchError const& e)
        {
            out.error = e.getKind();
            out.status = e.getStatusCode();
        }
    }

    std::string localUrl(tcp::acceptor const& acceptor, std::string const& path)
    {
        return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + path;
    }
}

TEST(HttpFeedClientTest, ReturnsBodyAndSendsApiKey)
{
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    HttpFeedClient client(io, "secret-key", std::chrono::milliseconds(2000));

    std::string request;
    FetchOutcome outcome;
    boost::asio::co_spawn(io, serveOnce(acceptor,
        "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 2\r\nConnection: close\r\n\r\n[]",
        &request, std::chrono::milliseconds(0)), boost::asio::detached);
    boost::asio::co_spawn(io, fetchInto(client, localUrl(acceptor, "/vehicles"), outcome), boost::asio::detached);
    io.run();

    EXPECT_FALSE(outcome.error.has_value());
    EXPECT_EQ(outcome.body, "[]");
    EXPECT_NE(request.find("GET /vehicles HTTP/1.1"), std::string::npos);
    EXPECT_NE(request.find("X-API-Key: secret-key"), std::string::npos);
}

TEST(HttpFeedClientTest, NonSuccessStatusIsUpstreamStatus)
{
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    HttpFeedClient client(io, "", std::chrono::milliseconds(2000));

    FetchOutcome outcome;
    boost::asio::co_spawn(io, serveOnce(acceptor,
        "HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\nConnection: close\r\n\r\n",
        nullptr, std::chrono::milliseconds(0)), boost::asio::detached);
    boost::asio::co_spawn(io, fetchInto(client, localUrl(acceptor, "/gtfs-rt"), outcome), boost::asio::detached);
    io.run();

    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, FetchError::Kind::UpstreamStatus);
    EXPECT_EQ(outcome.status, 503);
}

TEST(HttpFeedClientTest, SilentUpstreamTimesOut)
{
    boost::asio::io_context io;
    tcp::acceptor acceptor(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    HttpFeedClient client(io, "", std::chrono::milliseconds(100));

    FetchOutcome outcome;
    boost::asio::co_spawn(io, serveOnce(acceptor,
        "HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n",
        nullptr, std::chrono::milliseconds(600)), boost::asio::detached);
    boost::asio::co_spawn(io, fetchInto(client, localUrl(acceptor, "/gtfs-rt"), outcome), boost::asio::detached);
    io.run();

    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, FetchError::Kind::Timeout);
}

TEST(HttpFeedClientTest, ClosedPortIsUnreachable)
{
    boost::asio::io_context io;
    std::string url;
    {
        tcp::acceptor released(io, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        url = localUrl(released, "/gtfs-rt");
    }
    HttpFeedClient client(io, "", std::chrono::milliseconds(2000));

    FetchOutcome outcome;
    boost::asio::co_spawn(io, fetchInto(client, url, outcome), boost::asio::detached);
    io.run();

    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, FetchError::Kind::Unreachable);
}

TEST(HttpFeedClientTest, MalformedUrlIsUnreachable)
{
    boost::asio::io_context io;
    HttpFeedClient client(io, "", std::chrono::milliseconds(2000));

    FetchOutcome outcome;
    boost::asio::co_spawn(io, fetchInto(client, "gopher://old.example.com", outcome), boost::asio::detached);
    io.run();

    ASSERT_TRUE(outcome.error.has_value());
    EXPECT_EQ(*outcome.error, FetchError::Kind::Unreachable);
}
