#include "dispatcher_common.hpp"

#include <cctype>
#include <cmath>

namespace fleetsync::agent::dispatcher_common
{

    std::optional<std::string> string_field(const nlohmann::json &fields, const char *key)
    {
        if (!fields.is_object())
        {
            return std::nullopt;
        }
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_string())
        {
            return std::nullopt;
        }
        auto value = it->get<std::string>();
        if (value.empty())
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<bool> bool_field(const nlohmann::json &fields, const char *key)
    {
        if (!fields.is_object())
        {
            return std::nullopt;
        }
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_boolean())
        {
            return std::nullopt;
        }
        return it->get<bool>();
    }

    std::optional<std::int64_t> integer_field(const nlohmann::json &fields, const char *key)
    {
        if (!fields.is_object())
        {
            return std::nullopt;
        }
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_number())
        {
            return std::nullopt;
        }
        if (it->is_number_float())
        {
            return static_cast<std::int64_t>(std::llround(it->get<double>()));
        }
        return it->get<std::int64_t>();
    }

    std::vector<std::string> string_list(const nlohmann::json &fields, const char *key)
    {
        std::vector<std::string> result;
        if (!fields.is_object())
        {
            return result;
        }
        auto it = fields.find(key);
        if (it == fields.end() || !it->is_array())
        {
            return result;
        }
        for (const auto &item : *it)
        {
            if (!item.is_string())
            {
                continue;
            }
            auto value = trim(item.get<std::string>());
            if (!value.empty())
            {
                result.push_back(std::move(value));
            }
        }
        return result;
    }

    std::string trim(const std::string &value)
    {
        std::size_t begin = 0;
        std::size_t end = value.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])))
        {
            ++begin;
        }
        while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])))
        {
            --end;
        }
        return value.substr(begin, end - begin);
    }

    std::string host_of(const std::string &address)
    {
        auto rest = address;
        if (const auto scheme = rest.find("://"); scheme != std::string::npos)
        {
            rest = rest.substr(scheme + 3);
        }
        if (const auto slash = rest.find('/'); slash != std::string::npos)
        {
            rest.resize(slash);
        }
        if (!rest.empty() && rest.front() == '[')
        {
            const auto close = rest.find(']');
            return close == std::string::npos ? rest.substr(1) : rest.substr(1, close - 1);
        }
        if (const auto colon = rest.find(':'); colon != std::string::npos)
        {
            rest.resize(colon);
        }
        return rest;
    }

    std::string peer_address(const std::string &host)
    {
        const bool ipv6 = host.find(':') != std::string::npos;
        return "tcp://" + (ipv6 ? "[" + host + "]" : host) + ":" + std::to_string(kPeerSyncPort);
    }

} // namespace fleetsync::agent::dispatcher_common
