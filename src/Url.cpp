#include <cctype>
#include <sstream>
#include "Url.hpp"

std::string Url::str() const
{
    bool defaultPort = (scheme == "https" && port == "443") || (scheme == "http" && port == "80");
    return scheme + "://" + host + (defaultPort ? "" : ":" + port) + target;
}

std::optional<Url> Url::parse(std::string const& text)
{
    auto schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos)
        return std::nullopt;

    Url url;
    url.scheme = text.substr(0, schemeEnd);
    for (auto& c : url.scheme)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (url.scheme != "http" && url.scheme != "https")
        return std::nullopt;

    auto authorityStart = schemeEnd + 3;
    auto pathStart = text.find_first_of("/?", authorityStart);
    std::string authority = text.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);

    if (pathStart == std::string::npos)
        url.target = "/";
    else if (text[pathStart] == '?')
        url.target = "/" + text.substr(pathStart);
    else
        url.target = text.substr(pathStart);

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos)
    {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    }
    else
    {
        url.host = authority;
        url.port = url.secure() ? "443" : "80";
    }

    if (url.host.empty() || url.port.empty())
        return std::nullopt;

    for (char c : url.port)
    {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return std::nullopt;
    }

    return url;
}

std::string percentEncode(std::string const& text)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size() * 3);

    for (unsigned char c : text)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string percentDecode(std::string const& text)
{
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '%' && i + 2 < text.size()
            && std::isxdigit(static_cast<unsigned char>(text[i + 1]))
            && std::isxdigit(static_cast<unsigned char>(text[i + 2])))
        {
            out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        }
        else if (text[i] == '+')
        {
            out.push_back(' ');
        }
        else
        {
            out.push_back(text[i]);
        }
    }
    return out;
}

std::map<std::string, std::string> parseQuery(std::string const& target)
{
    std::map<std::string, std::string> params;

    auto q = target.find('?');
    if (q == std::string::npos)
        return params;

    std::stringstream ss(target.substr(q + 1));
    std::string pair;
    while (std::getline(ss, pair, '&'))
    {
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        if (eq == std::string::npos)
            params[percentDecode(pair)] = "";
        else
            params[percentDecode(pair.substr(0, eq))] = percentDecode(pair.substr(eq + 1));
    }
    return params;
}
