#pragma once

#include <filesystem>
#include <string>

#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    constexpr int kDefaultBrowseDepth = 2;

    // Lists path and its children down to depth levels. Hidden entries are skipped,
    // unreadable subdirectories are left out. Throws std::runtime_error when path
    // itself is not accessible.
    protocol::BrowseEntry browse_path(const std::string &path, int depth = kDefaultBrowseDepth);

} // namespace fleetsync::agent
