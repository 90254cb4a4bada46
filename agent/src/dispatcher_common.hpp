#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace fleetsync::agent::dispatcher_common
{

    // Peer sync port registered for devices paired during job deployment.
    constexpr std::uint16_t kPeerSyncPort = 22101;

    // Non-empty string value of key, if any.
    std::optional<std::string> string_field(const nlohmann::json &fields, const char *key);

    std::optional<bool> bool_field(const nlohmann::json &fields, const char *key);

    // Accepts integral and floating JSON numbers.
    std::optional<std::int64_t> integer_field(const nlohmann::json &fields, const char *key);

    // String elements of an array field, trimmed, empties dropped.
    std::vector<std::string> string_list(const nlohmann::json &fields, const char *key);

    std::string trim(const std::string &value);

    // Host part of "scheme://host:port/path", "host:port" or a bare host.
    std::string host_of(const std::string &address);

    std::string peer_address(const std::string &host);

} // namespace fleetsync::agent::dispatcher_common
