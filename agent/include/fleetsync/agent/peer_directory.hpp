#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace fleetsync::agent
{

    // Agent id to host address. Seeded from configuration and taught by deploy
    // messages that carry peer addresses.
    class PeerDirectory
    {
    public:
        PeerDirectory() = default;
        explicit PeerDirectory(std::map<std::string, std::string> peers);

        void learn(const std::string &agent_id, const std::string &host);
        std::optional<std::string> lookup(const std::string &agent_id) const;
        std::size_t size() const;

    private:
        mutable std::mutex mutex_;
        std::map<std::string, std::string> peers_;
    };

} // namespace fleetsync::agent
