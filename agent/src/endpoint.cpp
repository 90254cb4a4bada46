#include "fleetsync/agent/endpoint.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>
#include <string_view>

namespace fleetsync::agent
{

    namespace
    {

        struct SchemeMapping
        {
            std::string_view scheme;
            bool tls;
        };

        constexpr std::array<SchemeMapping, 6> kSchemeMappings{{
            {"tcp", false},
            {"ws", false},
            {"http", false},
            {"tls", true},
            {"wss", true},
            {"https", true},
        }};

        std::uint16_t parse_port(const std::string &value, const std::string &url)
        {
            if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char ch)
                                              { return std::isdigit(ch) != 0; }))
            {
                throw std::invalid_argument("Invalid port in coordinator URL: " + url);
            }
            // More than five digits cannot be a port and may not fit in unsigned long.
            const auto port = value.size() <= 5 ? std::stoul(value) : 0UL;
            if (port == 0 || port > 65535)
            {
                throw std::invalid_argument("Port out of range in coordinator URL: " + url);
            }
            return static_cast<std::uint16_t>(port);
        }

    } // namespace

    Endpoint parse_endpoint(const std::string &url)
    {
        const auto scheme_end = url.find("://");
        if (scheme_end == std::string::npos)
        {
            throw std::invalid_argument("Coordinator URL needs a scheme: " + url);
        }

        Endpoint endpoint;
        endpoint.scheme = url.substr(0, scheme_end);
        std::transform(endpoint.scheme.begin(), endpoint.scheme.end(), endpoint.scheme.begin(),
                       [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });

        const auto mapping = std::find_if(kSchemeMappings.begin(), kSchemeMappings.end(),
                                          [&](const SchemeMapping &item)
                                          { return item.scheme == endpoint.scheme; });
        if (mapping == kSchemeMappings.end())
        {
            throw std::invalid_argument("Unsupported coordinator URL scheme: " + endpoint.scheme);
        }
        endpoint.tls = mapping->tls;

        auto authority = url.substr(scheme_end + 3);
        if (const auto slash = authority.find('/'); slash != std::string::npos)
        {
            endpoint.path = authority.substr(slash);
            authority.resize(slash);
        }

        if (!authority.empty() && authority.front() == '[')
        {
            const auto close = authority.find(']');
            if (close == std::string::npos)
            {
                throw std::invalid_argument("Unterminated IPv6 address in coordinator URL: " + url);
            }
            endpoint.host = authority.substr(1, close - 1);
            if (close + 1 < authority.size())
            {
                if (authority[close + 1] != ':')
                {
                    throw std::invalid_argument("Invalid coordinator URL: " + url);
                }
                endpoint.port = parse_port(authority.substr(close + 2), url);
            }
        }
        else if (const auto colon = authority.rfind(':'); colon != std::string::npos)
        {
            endpoint.host = authority.substr(0, colon);
            endpoint.port = parse_port(authority.substr(colon + 1), url);
        }
        else
        {
            endpoint.host = authority;
        }

        if (endpoint.host.empty())
        {
            throw std::invalid_argument("Coordinator URL has no host: " + url);
        }
        return endpoint;
    }

    std::string to_string(const Endpoint &endpoint)
    {
        const bool ipv6 = endpoint.host.find(':') != std::string::npos;
        return endpoint.scheme + "://" + (ipv6 ? "[" + endpoint.host + "]" : endpoint.host) + ":" +
               std::to_string(endpoint.port) + endpoint.path;
    }

} // namespace fleetsync::agent
