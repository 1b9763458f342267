#include <iostream>
#include "HttpFeedClient.hpp"
#include "Errors.hpp"

HttpFeedClient::HttpFeedClient(boost::asio::io_context& ioc, std::string key, std::chrono::milliseconds timeout)
        : ioContext(ioc)
        , sslContext(boost::asio::ssl::context::tlsv12_client)
        , apiKey(std::move(key))
        , timeout(timeout)
    {
        sslContext.set_options(
            boost::asio::ssl::context::default_workarounds
            | boost::asio::ssl::context::no_sslv2
            | boost::asio::ssl::context::single_dh_use
        );

        sslContext.set_default_verify_paths();
        sslContext.set_verify_mode(boost::asio::ssl::verify_peer);
    }


void HttpFeedClient::configureTlsStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream, std::string const& host)
{
    if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str()))
    {
        throw boost::beast::system_error(boost::system::error_code(static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()),"Failed to set SNI");
    }
    stream.set_verify_callback(boost::asio::ssl::host_name_verification(host));
}

boost::asio::awaitable<boost::asio::ip::tcp::resolver::results_type> HttpFeedClient::resolve(boost::asio::ip::tcp::resolver& resolver, Url const& url)
{
    boost::asio::ip::tcp::resolver::results_type results = co_await resolver.async_resolve(url.host, url.port, boost::asio::use_awaitable);
    co_return results;
}

boost::beast::http::request<boost::beast::http::string_body> HttpFeedClient::buildGetRequest(Url const& url) const
{
    boost::beast::http::request<boost::beast::http::string_body> request(boost::beast::http::verb::get, url.target, 11);
    request.set(boost::beast::http::field::host, url.host);
    request.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    request.set(boost::beast::http::field::accept, "application/json, application/x-protobuf, */*");
    if (!apiKey.empty())
        request.set("X-API-Key", apiKey);

    return request;
}

template <class Stream>
boost::asio::awaitable<boost::beast::http::response<boost::beast::http::string_body>> HttpFeedClient::readResponse(Stream& stream)
{
    boost::beast::http::response_parser<boost::beast::http::string_body> parser;
    parser.body_limit(MAX_BODY_BYTES);
    boost::beast::flat_buffer buffer;
    co_await boost::beast::http::async_read(stream, buffer, parser, boost::asio::use_awaitable);
    co_return parser.release();
}

std::string HttpFeedClient::acceptBody(Url const& url, boost::beast::http::response<boost::beast::http::string_body>& response)
{
    int status = static_cast<int>(response.result_int());
    if (status < 200 || status >= 300)
        throw FetchError::upstreamStatus(url.str(), status);

    return std::move(response.body());
}

boost::asio::awaitable<std::string> HttpFeedClient::fetchPlain(Url const& url)
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    boost::asio::ip::tcp::resolver resolver(ioContext);
    boost::beast::tcp_stream stream(executor);

    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver, url);
    stream.expires_at(deadline);
    co_await stream.async_connect(results, boost::asio::use_awaitable);

    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest(url);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
    boost::beast::http::response<boost::beast::http::string_body> response = co_await readResponse(stream);

    boost::beast::error_code ignore;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignore);

    co_return acceptBody(url, response);
}

boost::asio::awaitable<std::string> HttpFeedClient::fetchTls(Url const& url)
{
    auto executor = co_await boost::asio::this_coro::executor;
    auto deadline = std::chrono::steady_clock::now() + timeout;

    boost::asio::ip::tcp::resolver resolver(ioContext);
    boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, sslContext);

    configureTlsStream(stream, url.host);
    boost::asio::ip::tcp::resolver::results_type results = co_await resolve(resolver, url);

    boost::beast::get_lowest_layer(stream).expires_at(deadline);
    co_await boost::beast::get_lowest_layer(stream).async_connect(results, boost::asio::use_awaitable);
    co_await stream.async_handshake(boost::asio::ssl::stream_base::client, boost::asio::use_awaitable);

    boost::beast::http::request<boost::beast::http::string_body> request = buildGetRequest(url);
    co_await boost::beast::http::async_write(stream, request, boost::asio::use_awaitable);
    boost::beast::http::response<boost::beast::http::string_body> response = co_await readResponse(stream);

    co_await shutdownStream(stream);

    co_return acceptBody(url, response);
}

boost::asio::awaitable<void> HttpFeedClient::shutdownStream(boost::beast::ssl_stream<boost::beast::tcp_stream>& stream)
{
    boost::system::error_code ec;
    co_await stream.async_shutdown(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    co_return;
}

boost::asio::awaitable<std::string> HttpFeedClient::fetch(std::string const& target)
{
    auto url = Url::parse(target);
    if (!url)
        throw FetchError::unreachable(target, "unsupported or malformed URL");

    try
    {
        if (url->secure())
            co_return co_await fetchTls(*url);
        co_return co_await fetchPlain(*url);
    }
    catch (boost::system::system_error const& e)
    {
        if (e.code() == boost::beast::error::timeout)
            throw FetchError::timeout(url->str());
        throw FetchError::unreachable(url->str(), e.code().message());
    }
}
