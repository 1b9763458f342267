#pragma once
#include <string>
#include <map>
#include <optional>

struct Url
{
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;
    std::string target;   // path and query, always starts with '/'

    [[nodiscard]] bool secure() const noexcept { return scheme == "https"; }
    [[nodiscard]] std::string str() const;

    static std::optional<Url> parse(std::string const& text);
};

// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string percentEncode(std::string const& text);
std::string percentDecode(std::string const& text);

// "/path?a=1&b=x%20y" -> {a: "1", b: "x y"}
std::map<std::string, std::string> parseQuery(std::string const& target);
