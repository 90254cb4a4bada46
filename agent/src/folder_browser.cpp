#include "fleetsync/agent/folder_browser.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>

namespace fleetsync::agent
{

    namespace
    {

        bool is_hidden(const std::filesystem::path &path)
        {
            const auto name = path.filename().string();
            return !name.empty() && name.front() == '.';
        }

        // Returns false when the directory cannot be read.
        bool list_children(const std::filesystem::path &directory, int remaining_depth,
                           std::vector<protocol::BrowseEntry> &children)
        {
            std::error_code ec;
            std::filesystem::directory_iterator it(directory, ec);
            if (ec)
            {
                spdlog::debug("Cannot read directory {}: {}", directory.string(), ec.message());
                return false;
            }

            std::vector<std::filesystem::directory_entry> entries;
            for (const std::filesystem::directory_iterator end; it != end; it.increment(ec))
            {
                if (ec)
                {
                    break;
                }
                if (!is_hidden(it->path()))
                {
                    entries.push_back(*it);
                }
            }
            std::sort(entries.begin(), entries.end(), [](const auto &lhs, const auto &rhs)
                      { return lhs.path().filename() < rhs.path().filename(); });

            for (const auto &entry : entries)
            {
                std::error_code status_ec;
                protocol::BrowseEntry child{
                    .name = entry.path().filename().string(),
                    .path = entry.path().string(),
                    .is_directory = entry.is_directory(status_ec),
                };
                if (child.is_directory && remaining_depth > 0)
                {
                    if (!list_children(entry.path(), remaining_depth - 1, child.children))
                    {
                        spdlog::debug("Skipping unreadable directory {}", child.path);
                        continue;
                    }
                    child.expanded = true;
                }
                children.push_back(std::move(child));
            }
            return true;
        }

    } // namespace

    protocol::BrowseEntry browse_path(const std::string &path, int depth)
    {
        const std::filesystem::path target = path.empty() ? std::filesystem::path("/") : std::filesystem::path(path);

        std::error_code ec;
        const auto status = std::filesystem::status(target, ec);
        if (ec || !std::filesystem::exists(status))
        {
            throw std::runtime_error("path not accessible: " + target.string() +
                                     (ec ? ": " + ec.message() : std::string{}));
        }

        auto name = target.filename().string();
        if (name.empty())
        {
            name = target.has_relative_path() ? target.parent_path().filename().string() : target.string();
        }

        protocol::BrowseEntry root{
            .name = name,
            .path = target.string(),
            .is_directory = std::filesystem::is_directory(status),
        };
        if (root.is_directory && depth > 0)
        {
            root.expanded = list_children(target, depth - 1, root.children);
            if (!root.expanded)
            {
                spdlog::warn("Failed to list children of {}", root.path);
            }
        }
        return root;
    }

} // namespace fleetsync::agent
