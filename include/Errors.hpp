#pragma once
#include <stdexcept>
#include <string>
#include <utility>

// Raised by the HTTP client and transports. Converted into a degraded
// snapshot by the position cache; never reaches the query interface.
class FetchError : public std::runtime_error
{
public:
    enum class Kind
    {
        Timeout,
        Unreachable,
        UpstreamStatus
    };

    FetchError(Kind kind, std::string const& what, int statusCode = 0)
        : std::runtime_error(what), kind(kind), statusCode(statusCode)
    {
    }

    static FetchError timeout(std::string const& target)
    {
        return FetchError(Kind::Timeout, "Timed out fetching " + target);
    }

    static FetchError unreachable(std::string const& target, std::string const& reason)
    {
        return FetchError(Kind::Unreachable, "Could not reach " + target + ": " + reason);
    }

    static FetchError upstreamStatus(std::string const& target, int code)
    {
        return FetchError(Kind::UpstreamStatus,
                          "Upstream " + target + " answered HTTP " + std::to_string(code), code);
    }

    [[nodiscard]] Kind getKind() const noexcept { return kind; }
    [[nodiscard]] int getStatusCode() const noexcept { return statusCode; }

private:
    Kind kind;
    int statusCode;
};

class DecodeError : public std::runtime_error
{
public:
    enum class Kind
    {
        Malformed,
        SchemaViolation
    };

    DecodeError(Kind kind, std::string const& what)
        : std::runtime_error(what), kind(kind)
    {
    }

    [[nodiscard]] Kind getKind() const noexcept { return kind; }

private:
    Kind kind;
};

// Startup only. Blocks the process from starting.
class ConfigError : public std::runtime_error
{
public:
    enum class Kind
    {
        MissingParameter,
        InvalidParameter
    };

    ConfigError(Kind kind, std::string parameter, std::string const& what)
        : std::runtime_error(what), kind(kind), parameter(std::move(parameter))
    {
    }

    [[nodiscard]] Kind getKind() const noexcept { return kind; }
    [[nodiscard]] std::string const& getParameter() const noexcept { return parameter; }

private:
    Kind kind;
    std::string parameter;
};
