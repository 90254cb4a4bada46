#pragma once

#include <filesystem>
#include <string>

#include "fleetsync/protocol.hpp"

namespace fleetsync::agent
{

    std::string local_hostname();

    // Distribution name from /etc/os-release, falling back to the kernel name.
    std::string os_description();

    // Snapshot for health reports. Disk usage is measured on the volume holding data_dir.
    protocol::SystemInfo collect_system_info(const std::filesystem::path &data_dir);

} // namespace fleetsync::agent
