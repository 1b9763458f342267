#pragma once
#include <string>
#include <chrono>
#include <cstdint>
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include "Url.hpp"

// GET-only HTTP(S) client for upstream feeds. Every failure leaves as a FetchError.
class HttpFeedClient
{
private:
    boost::asio::io_context& ioContext;
    boost::asio::ssl::context sslContext;
    std::string apiKey;
    std::chrono::milliseconds timeout;

    static constexpr std::uint64_t MAX_BODY_BYTES = 32 * 1024 * 1024;

    void configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, std::string const& host);
    boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> resolve(boost::asio::ip::tcp::resolver& resolver, Url const& url);
    boost::beast::http::request<boost::beast::http::string_body> buildGetRequest(Url const& url) const;
    template <class Stream>
    boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> readResponse(Stream& stream);
    boost::asio::awaitable<std::string> fetchPlain(Url const& url);
    boost::asio::awaitable<std::string> fetchTls(Url const& url);
    boost::asio::awaitable<void> shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream);
    static std::string acceptBody(Url const& url, boost::beast::http::response<boost::beast::http::string_body>& response);

public:
    HttpFeedClient(boost::asio::io_context& ioc, std::string key, std::chrono::milliseconds timeout);
    boost::asio::awaitable<std::string> fetch(std::string const& url);
};
