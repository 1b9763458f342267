#pragma once
#include <string>
#include <memory>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include "ConfigurationManager.hpp"

class HttpFeedClient;

// How upstream bytes are reached. Chosen once at startup from TransportMode.
class FeedTransport
{
public:
    virtual ~FeedTransport() = default;

    // Throws FetchError.
    virtual boost::asio::awaitable<std::string> get(std::string const& upstreamUrl) = 0;
    virtual std::string name() const = 0;
};

class DirectTransport : public FeedTransport
{
private:
    HttpFeedClient& client;

public:
    explicit DirectTransport(HttpFeedClient& client);

    boost::asio::awaitable<std::string> get(std::string const& upstreamUrl) override;
    std::string name() const override { return "direct"; }
};

// Reaches upstreams on blocked ports through an HTTP relay that takes the
// original URL as a percent-encoded "url" query parameter.
class RelayTransport : public FeedTransport
{
private:
    HttpFeedClient& client;
    std::string relayUrl;

public:
    RelayTransport(HttpFeedClient& client, std::string relayUrl);

    boost::asio::awaitable<std::string> get(std::string const& upstreamUrl) override;
    std::string name() const override { return "relay"; }

    static std::string relayTarget(std::string const& relayUrl, std::string const& upstreamUrl);
};

std::unique_ptr<FeedTransport> makeTransport(EngineSettings const& settings, HttpFeedClient& client);
