#pragma once

#include <cstdint>
#include <string>

namespace fleetsync::agent
{

    constexpr std::uint16_t kDefaultCoordinatorPort = 8090;

    struct Endpoint
    {
        std::string scheme;
        std::string host;
        std::uint16_t port{kDefaultCoordinatorPort};
        std::string path;
        bool tls{};
    };

    // Accepts tcp://, ws:// and http:// for plain links, tls://, wss:// and https://
    // for TLS. Throws std::invalid_argument on anything else.
    Endpoint parse_endpoint(const std::string &url);

    std::string to_string(const Endpoint &endpoint);

} // namespace fleetsync::agent
