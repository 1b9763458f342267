#include "FeedTransport.hpp"
#include "HttpFeedClient.hpp"
#include "Url.hpp"

DirectTransport::DirectTransport(HttpFeedClient& client)
    : client(client)
{
}

boost::asio::awaitable<std::string> DirectTransport::get(std::string const& upstreamUrl)
{
    co_return co_await client.fetch(upstreamUrl);
}

RelayTransport::RelayTransport(HttpFeedClient& client, std::string relayUrl)
    : client(client), relayUrl(std::move(relayUrl))
{
}

std::string RelayTransport::relayTarget(std::string const& relayUrl, std::string const& upstreamUrl)
{
    char separator = relayUrl.find('?') == std::string::npos ? '?' : '&';
    if (!relayUrl.empty() && (relayUrl.back() == '?' || relayUrl.back() == '&'))
        return relayUrl + "url=" + percentEncode(upstreamUrl);
    return relayUrl + separator + "url=" + percentEncode(upstreamUrl);
}

boost::asio::awaitable<std::string> RelayTransport::get(std::string const& upstreamUrl)
{
    co_return co_await client.fetch(relayTarget(relayUrl, upstreamUrl));
}

std::unique_ptr<FeedTransport> makeTransport(EngineSettings const& settings, HttpFeedClient& client)
{
    if (settings.transport == TransportMode::Relayed)
        return std::make_unique<RelayTransport>(client, settings.relayUrl);
    return std::make_unique<DirectTransport>(client);
}
