#include "fleetsync/agent/peer_directory.hpp"

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    PeerDirectory::PeerDirectory(std::map<std::string, std::string> peers)
        : peers_(std::move(peers)) {}

    void PeerDirectory::learn(const std::string &agent_id, const std::string &host)
    {
        if (agent_id.empty() || host.empty())
        {
            return;
        }
        std::lock_guard lock(mutex_);
        auto &slot = peers_[agent_id];
        if (slot != host)
        {
            spdlog::debug("Peer {} is at {}", agent_id, host);
            slot = host;
        }
    }

    std::optional<std::string> PeerDirectory::lookup(const std::string &agent_id) const
    {
        std::lock_guard lock(mutex_);
        auto it = peers_.find(agent_id);
        if (it == peers_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t PeerDirectory::size() const
    {
        std::lock_guard lock(mutex_);
        return peers_.size();
    }

} // namespace fleetsync::agent
